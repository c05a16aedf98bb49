#ifndef LOCALSTORE_H
#define LOCALSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "../model/facilityrecord.h"

namespace Fbo {

/**
 * @brief Durable per-location collections of merged facility records
 *
 * Source of truth between runs. A collection is always replaced as a
 * whole; there is no field-level mutation, so a reader never sees a
 * partially merged record.
 *
 * Implementations must be safe to call from worker threads. Callers
 * serialize writes to one location through LocationLocks.
 */
class LocalStore : public QObject
{
    Q_OBJECT

public:
    explicit LocalStore(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~LocalStore() = default;

    /**
     * @brief Identifier of this store type, e.g. "json-file"
     */
    virtual QString storeId() const = 0;

    /**
     * @brief Current collection for a location (empty when none)
     */
    virtual FacilityList loadCollection(const QString &locationCode) const = 0;

    /**
     * @brief Replace the collection for a location
     * @return true when the new collection is durable
     */
    virtual bool saveCollection(const QString &locationCode, const FacilityList &records) = 0;

    /**
     * @brief Remove the collection for a location entirely
     */
    virtual bool removeCollection(const QString &locationCode) = 0;

    /**
     * @brief All location codes that have a stored collection
     */
    virtual QStringList locationCodes() const = 0;

    virtual bool hasCollection(const QString &locationCode) const {
        return locationCodes().contains(locationCode);
    }

signals:
    void collectionChanged(const QString &locationCode);
    void errorOccurred(const QString &error);
};

} // namespace Fbo

#endif // LOCALSTORE_H
