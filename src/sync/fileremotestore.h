#ifndef FILEREMOTESTORE_H
#define FILEREMOTESTORE_H

#include "remotestore.h"
#include <QMutex>

namespace Fbo {

/**
 * @brief Remote store backed by a shared directory
 *
 * Layout:
 *   <rootPath>/
 *   ├── KSFO/
 *   │   ├── <uuid>.json
 *   │   └── <uuid>.json
 *   └── KOAK/
 *
 * One file per record, named after its remote identifier. Several
 * profiles pointing at the same directory behave like clients of one
 * collaborative backend.
 */
class FileRemoteStore : public RemoteStore
{
    Q_OBJECT

public:
    explicit FileRemoteStore(const QString &rootPath, QObject *parent = nullptr);
    ~FileRemoteStore() override = default;

    QString storeId() const override { return "file"; }
    QString displayName() const override { return "Shared Folder"; }
    bool isAvailable() const override;

    FetchResult fetchRecords(const QString &locationCode) override;
    QString insertRecord(const FacilityRecord &record) override;
    bool updateRecord(const FacilityRecord &record) override;
    bool deleteRecord(const QString &locationCode, const QString &remoteId) override;

    QString rootPath() const { return m_rootPath; }

    /**
     * @brief Generate a new remote identifier
     */
    static QString generateId();

private:
    QString locationPath(const QString &locationCode) const;
    QString recordPath(const QString &locationCode, const QString &remoteId) const;
    bool writeRecord(const QString &path, const FacilityRecord &record);
    static bool isSafeId(const QString &remoteId);

    QString m_rootPath;
    QMutex m_mutex;
};

} // namespace Fbo

#endif // FILEREMOTESTORE_H
