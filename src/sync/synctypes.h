#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include "../model/facilityrecord.h"

/**
 * @file synctypes.h
 * @brief Common types and enums for the reconciliation engine
 */

namespace Fbo {

/**
 * @brief Errors reported by the interactive edit path
 *
 * Remote failures are deliberately absent: they degrade to local data
 * and never reach the caller as an error.
 */
enum class EditError {
    None,               ///< Edit committed
    InvalidRecord,      ///< Missing location code or name
    DuplicateConflict,  ///< New name collides with another source's unverified record
    ProtectedRecord,    ///< Verified records cannot be deleted
    NotFound,           ///< No record with that name at that location
    StorageFailure      ///< Local store write failed
};

/**
 * @brief Outcome of submitEdit() / deleteRecord()
 */
struct EditResult {
    bool success = false;
    EditError error = EditError::None;
    QString errorMessage;
    bool merged = false;        ///< Edit was folded into an existing record
    FacilityRecord record;      ///< Stored record after the edit (not set for deletes)

    static EditResult failure(EditError error, const QString &message) {
        EditResult result;
        result.error = error;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Summary of record-level changes
 */
struct SyncStats {
    int created = 0;        ///< Records only the incoming side knew about
    int updated = 0;        ///< Existing records whose content changed
    int unchanged = 0;      ///< Existing records left as they were
    int pushed = 0;         ///< Records sent upstream
    int deleted = 0;        ///< Remote deletions completed
    int failed = 0;         ///< Pushes/deletions left queued for later

    int total() const { return created + updated + unchanged; }

    QString summary() const {
        return QString("Created: %1, Updated: %2, Unchanged: %3, Pushed: %4, Deleted: %5, Failed: %6")
            .arg(created).arg(updated).arg(unchanged).arg(pushed).arg(deleted).arg(failed);
    }
};

/**
 * @brief Result of syncLocation()
 *
 * success is false only when the local store could not be written.
 * A failed remote fetch sets remoteAvailable = false and still succeeds.
 */
struct SyncResult {
    QString locationCode;
    bool success = false;
    bool remoteAvailable = false;
    bool cancelled = false;
    QString errorMessage;       ///< Local failure, or the swallowed remote error
    SyncStats stats;
    FacilityList records;       ///< Collection as persisted (or as read, when cancelled)
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }
};

/**
 * @brief Result of a bundled dataset import
 */
struct ImportResult {
    bool success = false;
    bool ran = false;           ///< false when the stored version was already current
    int datasetVersion = 0;
    int imported = 0;           ///< Rows turned into records
    int skipped = 0;            ///< Rows skipped for any reason (includes malformed)
    int malformed = 0;          ///< Wrong field count or unparseable number
    int locations = 0;          ///< Location collections reconciled
    QString errorMessage;
};

/**
 * @brief Raw answer of a remote query
 */
struct FetchResult {
    bool success = false;
    QString errorMessage;
    FacilityList records;
};

/**
 * @brief Remote deletion waiting in the outbox
 */
struct PendingDeletion {
    QString locationCode;
    QString remoteId;
    QDateTime requestedAt;
};

/**
 * @brief Remote records as last fetched, before any merging
 *
 * Kept per location in SyncState. Cleared on a dataset version bump so
 * duplicates fixed by a newer dataset are not fed back in.
 */
struct RemoteSnapshot {
    QDateTime fetchedAt;
    QString contentHash;        ///< Hash of the serialized records
    FacilityList records;

    bool isValid() const { return fetchedAt.isValid(); }
};

} // namespace Fbo

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(Fbo::SyncResult)
Q_DECLARE_METATYPE(Fbo::SyncStats)
Q_DECLARE_METATYPE(Fbo::ImportResult)

#endif // SYNCTYPES_H
