#ifndef MOCKREMOTESTORE_H
#define MOCKREMOTESTORE_H

#include <QMutex>
#include <QMap>
#include "sync/remotestore.h"

/**
 * @brief In-memory RemoteStore with programmable failures for tests
 */
class MockRemoteStore : public Fbo::RemoteStore
{
    Q_OBJECT

public:
    explicit MockRemoteStore(QObject *parent = nullptr) : Fbo::RemoteStore(parent) {}

    QString storeId() const override { return "mock"; }
    QString displayName() const override { return "Mock"; }
    bool isAvailable() const override { return !failFetch; }

    Fbo::FetchResult fetchRecords(const QString &locationCode) override
    {
        QMutexLocker locker(&m_mutex);
        fetchCalls++;

        Fbo::FetchResult result;
        if (failFetch) {
            result.errorMessage = "simulated network failure";
            return result;
        }
        for (const Fbo::FacilityRecord &record : m_records) {
            if (record.locationCode == locationCode || returnAllLocations) {
                result.records.append(record);
            }
        }
        result.success = true;
        return result;
    }

    QString insertRecord(const Fbo::FacilityRecord &record) override
    {
        QMutexLocker locker(&m_mutex);
        insertCalls++;
        if (failInsert) {
            return QString();
        }
        Fbo::FacilityRecord stored = record;
        stored.remoteId = QString("r%1").arg(++m_nextId);
        stored.pendingUpload = false;
        m_records.insert(stored.remoteId, stored);
        return stored.remoteId;
    }

    bool updateRecord(const Fbo::FacilityRecord &record) override
    {
        QMutexLocker locker(&m_mutex);
        updateCalls++;
        if (failUpdate || !m_records.contains(record.remoteId)) {
            return false;
        }
        Fbo::FacilityRecord stored = record;
        stored.pendingUpload = false;
        m_records.insert(record.remoteId, stored);
        return true;
    }

    bool deleteRecord(const QString &locationCode, const QString &remoteId) override
    {
        Q_UNUSED(locationCode);
        QMutexLocker locker(&m_mutex);
        deleteCalls++;
        if (failDelete) {
            return false;
        }
        m_records.remove(remoteId);
        return true;
    }

    /**
     * @brief Put a record on the remote side, assigning an id if needed
     */
    QString seed(Fbo::FacilityRecord record)
    {
        QMutexLocker locker(&m_mutex);
        if (record.remoteId.isEmpty()) {
            record.remoteId = QString("r%1").arg(++m_nextId);
        }
        m_records.insert(record.remoteId, record);
        return record.remoteId;
    }

    Fbo::FacilityList allRecords() const
    {
        QMutexLocker locker(&m_mutex);
        return m_records.values();
    }

    bool contains(const QString &remoteId) const
    {
        QMutexLocker locker(&m_mutex);
        return m_records.contains(remoteId);
    }

    bool failFetch = false;
    bool failInsert = false;
    bool failUpdate = false;
    bool failDelete = false;
    bool returnAllLocations = false;

    int fetchCalls = 0;
    int insertCalls = 0;
    int updateCalls = 0;
    int deleteCalls = 0;

private:
    mutable QMutex m_mutex;
    QMap<QString, Fbo::FacilityRecord> m_records;   // remote id -> record
    int m_nextId = 0;
};

#endif // MOCKREMOTESTORE_H
