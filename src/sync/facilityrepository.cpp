#include "facilityrepository.h"
#include "syncengine.h"
#include "uploadqueue.h"
#include "localstore.h"

#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

namespace Fbo {

FacilityRepository::FacilityRepository(SyncEngine *engine, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_uploads(new UploadQueue(engine, this))
{
    if (m_engine && m_engine->localStore()) {
        connect(m_engine->localStore(), &LocalStore::collectionChanged,
                this, &FacilityRepository::recordsChanged);
    }
    connect(m_uploads, &UploadQueue::uploadFinished,
            this, &FacilityRepository::uploadCompleted);
}

FacilityRepository::~FacilityRepository()
{
    m_syncPool.waitForDone();
    m_uploads->waitForDone();
}

FacilityList FacilityRepository::getRecords(const QString &locationCode) const
{
    if (!m_engine) {
        return FacilityList();
    }
    return m_engine->records(locationCode);
}

QFuture<SyncResult> FacilityRepository::requestSync(const QString &locationCode)
{
    const QString code = SyncEngine::normalizeLocationCode(locationCode);

    return QtConcurrent::run(&m_syncPool, [this, code]() {
        SyncResult result;
        if (!m_engine) {
            result.locationCode = code;
            result.errorMessage = "No engine configured";
            return result;
        }

        result = m_engine->syncLocation(code);
        emit syncCompleted(result);

        if (result.success && !result.cancelled && m_autoUpload) {
            m_uploads->enqueue(code);
        }
        return result;
    });
}

EditResult FacilityRepository::submitEdit(const FacilityRecord &record)
{
    if (!m_engine) {
        return EditResult::failure(EditError::StorageFailure, "No engine configured");
    }

    const EditResult result = m_engine->submitEdit(record);
    if (result.success && m_autoUpload) {
        m_uploads->enqueue(result.record.locationCode);
    } else if (!result.success) {
        qDebug() << "[FacilityRepository] Edit rejected:" << result.errorMessage;
    }
    return result;
}

EditResult FacilityRepository::deleteRecord(const QString &locationCode, const QString &name)
{
    if (!m_engine) {
        return EditResult::failure(EditError::StorageFailure, "No engine configured");
    }

    const EditResult result = m_engine->deleteRecord(locationCode, name);
    if (result.success && m_autoUpload) {
        m_uploads->enqueue(locationCode);
    }
    return result;
}

bool FacilityRepository::waitForIdle(int msecs)
{
    if (!m_syncPool.waitForDone(msecs)) {
        return false;
    }
    return m_uploads->waitForDone(msecs);
}

} // namespace Fbo
