#ifndef SYNCSTATE_H
#define SYNCSTATE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QMap>
#include <QList>
#include <QStringList>
#include <QMutex>
#include <QJsonObject>
#include "synctypes.h"

namespace Fbo {

/**
 * @brief Sync metadata kept next to the Local Store
 *
 * State is stored in a single document:
 *   <stateDir>/state.json
 *     ├── datasetVersion   - last bundled dataset version imported
 *     ├── locations        - per location: last sync time, remote snapshot
 *     └── pendingDeletes   - remote deletions waiting to be pushed
 *
 * All accessors lock an internal mutex, so the engine may use one
 * instance from several worker threads.
 */
class SyncState : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct a SyncState stored in a directory
     * @param stateDir Directory holding state.json (created on save)
     * @param parent Parent QObject
     */
    explicit SyncState(const QString &stateDir, QObject *parent = nullptr);
    ~SyncState();

    // ========== Dataset Versioning ==========

    /**
     * @brief Version of the bundled dataset last imported (0 = never)
     */
    int datasetVersion() const;

    /**
     * @brief Record a newly imported dataset version
     *
     * A version greater than the stored one also drops every cached
     * remote snapshot. Merged local records are not touched.
     *
     * @return true if the version was bumped
     */
    bool setDatasetVersion(int version);

    /**
     * @brief Whether a dataset of the given version still has to be imported
     */
    bool needsImport(int version) const;

    // ========== Per-location Metadata ==========

    /**
     * @brief Timestamp of the last sync that reached the remote store
     */
    QDateTime lastSyncTime(const QString &locationCode) const;
    void setLastSyncTime(const QString &locationCode, const QDateTime &time);

    /**
     * @brief Cache the raw remote records of a successful fetch
     * @return true when the content differs from the cached snapshot
     */
    bool setRemoteSnapshot(const QString &locationCode, const FacilityList &records,
                           const QDateTime &fetchedAt);

    RemoteSnapshot remoteSnapshot(const QString &locationCode) const;
    bool hasRemoteSnapshot(const QString &locationCode) const;

    /**
     * @brief Drop the cached snapshot of one location
     */
    void removeRemoteSnapshot(const QString &locationCode);

    QStringList knownLocations() const;

    // ========== Deletion Outbox ==========

    void queueDeletion(const PendingDeletion &deletion);
    QList<PendingDeletion> pendingDeletions(const QString &locationCode) const;
    void removePendingDeletion(const QString &locationCode, const QString &remoteId);
    int pendingDeletionCount() const;
    QStringList locationsWithPendingDeletions() const;

    // ========== Persistence ==========

    /**
     * @brief Load state from disk
     * @return true if loaded successfully (or if no previous state exists)
     */
    bool load();

    /**
     * @brief Save state to disk
     * @return true if saved successfully
     */
    bool save();

    /**
     * @brief Clear all state (use with caution)
     */
    void clear();

    QString statePath() const;
    QString stateFilePath() const;

    /**
     * @brief Content hash for change detection
     */
    static QString calculateHash(const QByteArray &data);

signals:
    void stateChanged();
    void errorOccurred(const QString &error);

private:
    struct LocationState {
        QDateTime lastSync;
        RemoteSnapshot snapshot;
    };

    QJsonObject locationToJson(const LocationState &state) const;
    LocationState locationFromJson(const QJsonObject &json) const;
    void markDirty();

    QString m_stateDir;

    mutable QMutex m_mutex;
    int m_datasetVersion = 0;
    QMap<QString, LocationState> m_locations;
    QList<PendingDeletion> m_pendingDeletes;
    bool m_dirty = false;
};

} // namespace Fbo

#endif // SYNCSTATE_H
