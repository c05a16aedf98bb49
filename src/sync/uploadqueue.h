#ifndef UPLOADQUEUE_H
#define UPLOADQUEUE_H

#include <QObject>
#include <QString>
#include <QSet>
#include <QMutex>
#include <QThreadPool>
#include "synctypes.h"

namespace Fbo {

class SyncEngine;

/**
 * @brief Outbox that pushes local changes upstream in the background
 *
 * Each request runs SyncEngine::pushPending() on the queue's own thread
 * pool, after the local commit that caused it. Requests for a location
 * that is already being pushed are coalesced into one more run once the
 * current push finishes. A failed push never affects the local data; the
 * records simply stay pending for the next request.
 */
class UploadQueue : public QObject
{
    Q_OBJECT

public:
    /**
     * @param engine Engine to push through (not owned, must outlive the queue)
     */
    explicit UploadQueue(SyncEngine *engine, QObject *parent = nullptr);
    ~UploadQueue();

    /**
     * @brief Schedule a push for one location
     */
    void enqueue(const QString &locationCode);

    /**
     * @brief Schedule every location that has pending uploads or deletions
     * @return Number of locations scheduled
     */
    int enqueueAllPending();

    /**
     * @brief Block until all scheduled pushes have finished
     * @return false on timeout
     */
    bool waitForDone(int msecs = -1);

    bool isIdle() const;

    void setMaxThreadCount(int count) { m_pool.setMaxThreadCount(count); }

signals:
    void uploadFinished(const QString &locationCode, const Fbo::SyncStats &stats);

private:
    void run(const QString &locationCode);

    SyncEngine *m_engine;
    QThreadPool m_pool;

    mutable QMutex m_mutex;
    QSet<QString> m_inFlight;
    QSet<QString> m_rerun;
};

} // namespace Fbo

#endif // UPLOADQUEUE_H
