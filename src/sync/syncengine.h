#ifndef SYNCENGINE_H
#define SYNCENGINE_H

#include <QObject>
#include <QString>
#include <QList>
#include <QStringList>
#include <atomic>
#include <functional>
#include "synctypes.h"
#include "locationlocks.h"

namespace Fbo {

class LocalStore;
class RemoteStore;
class SyncState;

/**
 * @brief Main sync orchestrator
 *
 * The SyncEngine coordinates:
 *   - Local Store reads and whole-collection write-backs
 *   - Remote fetches and the upload outbox
 *   - Bundled dataset imports and their versioning
 *   - The interactive edit path (submitEdit / deleteRecord)
 *
 * All public operations are synchronous and may be called from worker
 * threads. Work on one location is serialized by a per-location lock;
 * different locations proceed in parallel.
 *
 * Usage:
 * @code
 * SyncEngine engine;
 * engine.setLocalStore(new JsonFileStore(profile.storeDirectoryPath()));
 * engine.setSyncState(new SyncState(profile.stateDirectoryPath()));
 * engine.setRemoteStore(new FileRemoteStore(profile.remotePath()));
 *
 * engine.importBaselineFile(profile.datasetPath(), profile.datasetVersion());
 * SyncResult result = engine.syncLocation("KSFO");
 * engine.pushPending("KSFO");
 * @endcode
 */
class SyncEngine : public QObject
{
    Q_OBJECT

public:
    explicit SyncEngine(QObject *parent = nullptr);
    ~SyncEngine();

    // ========== Configuration ==========

    /**
     * @brief Set the Local Store. The engine takes ownership.
     */
    void setLocalStore(LocalStore *store);
    LocalStore* localStore() const { return m_store; }

    /**
     * @brief Set the remote store. The engine takes ownership.
     *
     * Without a remote store every sync degrades to local data.
     */
    void setRemoteStore(RemoteStore *remote);
    RemoteStore* remoteStore() const { return m_remote; }

    /**
     * @brief Set the sync metadata. The engine takes ownership.
     */
    void setSyncState(SyncState *state);
    SyncState* syncState() const { return m_state; }

    /**
     * @brief Label stamped as updatedBy on local edits that carry none
     */
    void setDeviceLabel(const QString &label);
    QString deviceLabel() const { return m_deviceLabel; }

    /**
     * @brief Set a callback consulted at cancellation points
     *
     * Must be set before operations start running.
     */
    void setCancelCheck(std::function<bool()> check) { m_cancelCheck = std::move(check); }

    /**
     * @brief Cancel running and future syncs until clearCancel()
     */
    void cancelSync() { m_cancelled = true; }
    void clearCancel() { m_cancelled = false; }

    // ========== Sync Operations ==========

    /**
     * @brief Fetch, reconcile and persist one location
     *
     * A failed or missing remote degrades to the local collection, which
     * is still written back (deduplicated). A cancelled sync writes nothing.
     */
    SyncResult syncLocation(const QString &locationCode);

    /**
     * @brief Push pending local records and queued deletions upstream
     *
     * Failures stay queued. Never touches records that changed while the
     * push was in flight, apart from recording their remote identifier.
     */
    SyncStats pushPending(const QString &locationCode);

    /**
     * @brief Locations with pending uploads or queued deletions
     */
    QStringList locationsWithPendingWork() const;

    // ========== Bundled Dataset ==========

    /**
     * @brief Fold dataset rows into the Local Store once per version
     * @param rows Split CSV rows, optionally starting with the header
     * @param datasetVersion Only runs when greater than the recorded version
     * @param importedAt Timestamp for the imported records (now if invalid)
     */
    ImportResult importBaseline(const QList<QStringList> &rows, int datasetVersion,
                                const QDateTime &importedAt = QDateTime());

    /**
     * @brief importBaseline() reading the rows from a CSV file
     *
     * The file is not opened when the recorded version is already current.
     * Without importedAt the records are dated by the file's modification time.
     */
    ImportResult importBaselineFile(const QString &filePath, int datasetVersion,
                                    const QDateTime &importedAt = QDateTime());

    // ========== Interactive Edits ==========

    /**
     * @brief Commit a locally created or edited record
     */
    EditResult submitEdit(const FacilityRecord &record);

    /**
     * @brief Delete an unverified record by name
     */
    EditResult deleteRecord(const QString &locationCode, const QString &name);

    // ========== Queries ==========

    /**
     * @brief Deduplicated Local Store contents. No network access.
     */
    FacilityList records(const QString &locationCode) const;

    /**
     * @brief Near-duplicate groups in the cached remote snapshot
     *
     * The preferred record of each group comes first.
     */
    QList<FacilityList> remoteDuplicates(const QString &locationCode) const;

    /**
     * @brief Delete a redundant copy from the remote store
     *
     * Refuses verified records and the preferred record of a group.
     */
    EditResult deleteRemoteDuplicate(const QString &locationCode, const QString &remoteId);

    /**
     * @brief Canonical form of a location code
     */
    static QString normalizeLocationCode(const QString &code);

    static bool isValidLocationCode(const QString &code);

signals:
    void syncStarted(const QString &locationCode);
    void syncFinished(const Fbo::SyncResult &result);
    void pushFinished(const QString &locationCode, const Fbo::SyncStats &stats);
    void importFinished(const Fbo::ImportResult &result);
    void recordCommitted(const QString &locationCode, const QString &name);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    bool isCancelled() const;
    ImportResult applyBaseline(const FacilityList &records, int datasetVersion);
    FacilityRecord prepareEdit(const FacilityRecord &record, const QDateTime &now) const;
    static int indexOfName(const FacilityList &records, const QString &name);
    static int indexOfRemoteId(const FacilityList &records, const QString &remoteId);

    LocalStore *m_store = nullptr;
    RemoteStore *m_remote = nullptr;
    SyncState *m_state = nullptr;

    LocationLocks m_locks;
    QString m_deviceLabel;

    std::function<bool()> m_cancelCheck;
    std::atomic<bool> m_cancelled{false};
};

} // namespace Fbo

#endif // SYNCENGINE_H
