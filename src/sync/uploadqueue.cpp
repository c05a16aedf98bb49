#include "uploadqueue.h"
#include "syncengine.h"

#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

namespace Fbo {

UploadQueue::UploadQueue(SyncEngine *engine, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
{
    m_pool.setMaxThreadCount(2);
}

UploadQueue::~UploadQueue()
{
    m_pool.waitForDone();
}

void UploadQueue::enqueue(const QString &locationCode)
{
    const QString code = SyncEngine::normalizeLocationCode(locationCode);
    if (code.isEmpty() || !m_engine) {
        return;
    }

    {
        QMutexLocker locker(&m_mutex);
        if (m_inFlight.contains(code)) {
            m_rerun.insert(code);
            return;
        }
        m_inFlight.insert(code);
    }

    qDebug() << "[UploadQueue] Scheduled push for" << code;
    QtConcurrent::run(&m_pool, [this, code]() { run(code); });
}

int UploadQueue::enqueueAllPending()
{
    if (!m_engine) {
        return 0;
    }

    const QStringList codes = m_engine->locationsWithPendingWork();
    for (const QString &code : codes) {
        enqueue(code);
    }
    return static_cast<int>(codes.size());
}

bool UploadQueue::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

bool UploadQueue::isIdle() const
{
    QMutexLocker locker(&m_mutex);
    return m_inFlight.isEmpty();
}

void UploadQueue::run(const QString &locationCode)
{
    for (;;) {
        const SyncStats stats = m_engine->pushPending(locationCode);
        emit uploadFinished(locationCode, stats);

        QMutexLocker locker(&m_mutex);
        if (!m_rerun.remove(locationCode)) {
            m_inFlight.remove(locationCode);
            return;
        }
    }
}

} // namespace Fbo
