#ifndef REMOTESTORE_H
#define REMOTESTORE_H

#include <QObject>
#include <QString>
#include "synctypes.h"

namespace Fbo {

/**
 * @brief Abstract interface for the collaborative record store
 *
 * The remote side is a plain record store: query by location, insert,
 * update by identifier and delete by identifier. Every call may fail
 * or be slow. Callers treat failures as "no data" or "retry later" and
 * never as fatal.
 *
 * Implementations are called from worker threads and must be
 * thread-safe.
 */
class RemoteStore : public QObject
{
    Q_OBJECT

public:
    explicit RemoteStore(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RemoteStore() = default;

    // ========== Store Identity ==========

    /**
     * @brief Unique identifier for this store type, e.g. "file"
     */
    virtual QString storeId() const = 0;

    /**
     * @brief Human-readable name for display
     */
    virtual QString displayName() const = 0;

    /**
     * @brief Check if the store is reachable and configured
     */
    virtual bool isAvailable() const = 0;

    // ========== Record Operations ==========

    /**
     * @brief Query every record filed under a location
     */
    virtual FetchResult fetchRecords(const QString &locationCode) = 0;

    /**
     * @brief Insert a record that has no remote identifier yet
     * @return Assigned remote identifier, empty on failure
     */
    virtual QString insertRecord(const FacilityRecord &record) = 0;

    /**
     * @brief Replace the record with record.remoteId
     * @return true on success
     */
    virtual bool updateRecord(const FacilityRecord &record) = 0;

    /**
     * @brief Delete a record by identifier
     * @return true on success (also when it was already gone)
     */
    virtual bool deleteRecord(const QString &locationCode, const QString &remoteId) = 0;

signals:
    void recordInserted(const QString &remoteId);
    void recordUpdated(const QString &remoteId);
    void recordDeleted(const QString &remoteId);
    void errorOccurred(const QString &error);
};

} // namespace Fbo

#endif // REMOTESTORE_H
