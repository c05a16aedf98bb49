#ifndef FACILITYREPOSITORY_H
#define FACILITYREPOSITORY_H

#include <QObject>
#include <QString>
#include <QFuture>
#include <QThreadPool>
#include "synctypes.h"

namespace Fbo {

class SyncEngine;
class UploadQueue;

/**
 * @brief Query and command surface for consumers of facility data
 *
 * Reads are synchronous and never touch the network. Syncs run on the
 * repository's thread pool. Every successful local commit is followed
 * by a background push through the UploadQueue.
 *
 * recordsChanged() fires whenever a location's stored collection is
 * replaced, whichever operation caused it.
 */
class FacilityRepository : public QObject
{
    Q_OBJECT

public:
    /**
     * @param engine Configured engine (not owned, must outlive the repository)
     */
    explicit FacilityRepository(SyncEngine *engine, QObject *parent = nullptr);
    ~FacilityRepository();

    /**
     * @brief Deduplicated stored records for a location
     */
    FacilityList getRecords(const QString &locationCode) const;

    /**
     * @brief Sync a location in the background
     *
     * The returned future always finishes; remote failures show up as
     * SyncResult::remoteAvailable == false.
     */
    QFuture<SyncResult> requestSync(const QString &locationCode);

    EditResult submitEdit(const FacilityRecord &record);
    EditResult deleteRecord(const QString &locationCode, const QString &name);

    /**
     * @brief Push local changes automatically after commits (default on)
     */
    void setAutoUpload(bool enabled) { m_autoUpload = enabled; }
    bool autoUpload() const { return m_autoUpload; }

    UploadQueue* uploadQueue() const { return m_uploads; }

    /**
     * @brief Block until running syncs and uploads have finished
     */
    bool waitForIdle(int msecs = -1);

signals:
    void recordsChanged(const QString &locationCode);
    void syncCompleted(const Fbo::SyncResult &result);
    void uploadCompleted(const QString &locationCode, const Fbo::SyncStats &stats);

private:
    SyncEngine *m_engine;
    UploadQueue *m_uploads;
    QThreadPool m_syncPool;
    bool m_autoUpload = true;
};

} // namespace Fbo

#endif // FACILITYREPOSITORY_H
