#ifndef JSONFILESTORE_H
#define JSONFILESTORE_H

#include "localstore.h"
#include <QHash>
#include <QReadWriteLock>

namespace Fbo {

/**
 * @brief LocalStore keeping one JSON document per location
 *
 * Layout:
 *   <basePath>/
 *   ├── KSFO.json
 *   ├── KOAK.json
 *   └── ...
 *
 * Every document is { "locationCode": ..., "savedAt": ..., "records": [...] }.
 * Writes go through QSaveFile so a crash leaves either the old or the new
 * collection, never a truncated one. All documents are read once at
 * construction and served from memory afterwards.
 */
class JsonFileStore : public LocalStore
{
    Q_OBJECT

public:
    explicit JsonFileStore(const QString &basePath, QObject *parent = nullptr);
    ~JsonFileStore() override = default;

    QString storeId() const override { return "json-file"; }

    FacilityList loadCollection(const QString &locationCode) const override;
    bool saveCollection(const QString &locationCode, const FacilityList &records) override;
    bool removeCollection(const QString &locationCode) override;
    QStringList locationCodes() const override;
    bool hasCollection(const QString &locationCode) const override;

    QString basePath() const { return m_basePath; }

    /**
     * @brief Drop the cache and re-read every document from disk
     * @return Number of collections loaded
     */
    int reload();

    /**
     * @brief File name used for a location, e.g. "KSFO.json"
     */
    static QString fileNameFor(const QString &locationCode);

private:
    QString collectionPath(const QString &locationCode) const;
    static QString sanitizeCode(const QString &locationCode);
    bool readDocument(const QString &filePath, QString *code, FacilityList *records);

    QString m_basePath;
    mutable QReadWriteLock m_lock;
    QHash<QString, FacilityList> m_cache;   // location code -> collection
};

} // namespace Fbo

#endif // JSONFILESTORE_H
