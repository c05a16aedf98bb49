#include "jsonfilestore.h"
#include "../mappers/facilitymapper.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QDebug>

namespace Fbo {

JsonFileStore::JsonFileStore(const QString &basePath, QObject *parent)
    : LocalStore(parent)
    , m_basePath(basePath)
{
    QDir dir(m_basePath);
    if (!dir.exists() && !dir.mkpath(".")) {
        qWarning() << "[JsonFileStore] Failed to create store directory:" << m_basePath;
    }
    reload();
}

int JsonFileStore::reload()
{
    QHash<QString, FacilityList> loaded;

    QDirIterator it(m_basePath, QStringList() << "*.json", QDir::Files);
    while (it.hasNext()) {
        const QString filePath = it.next();

        QString code;
        FacilityList records;
        if (!readDocument(filePath, &code, &records)) {
            continue;
        }
        loaded.insert(code, records);
    }

    {
        QWriteLocker locker(&m_lock);
        m_cache = loaded;
    }

    qDebug() << "[JsonFileStore] Loaded" << loaded.size() << "collections from" << m_basePath;
    return loaded.size();
}

bool JsonFileStore::readDocument(const QString &filePath, QString *code, FacilityList *records)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open collection: %1").arg(filePath));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        emit errorOccurred(QString("Failed to parse collection %1: %2")
                           .arg(filePath, parseError.errorString()));
        return false;
    }

    const QJsonObject root = doc.object();
    *code = root["locationCode"].toString().trimmed().toUpper();
    if (code->isEmpty()) {
        *code = QFileInfo(filePath).completeBaseName().toUpper();
    }
    *records = FacilityMapper::fromJsonArray(root["records"].toArray());
    return true;
}

FacilityList JsonFileStore::loadCollection(const QString &locationCode) const
{
    QReadLocker locker(&m_lock);
    return m_cache.value(locationCode.trimmed().toUpper());
}

bool JsonFileStore::saveCollection(const QString &locationCode, const FacilityList &records)
{
    const QString code = locationCode.trimmed().toUpper();
    if (code.isEmpty()) {
        emit errorOccurred("Cannot save collection with empty location code");
        return false;
    }

    QJsonObject root;
    root["locationCode"] = code;
    root["savedAt"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    root["records"] = FacilityMapper::toJsonArray(records);

    {
        QWriteLocker locker(&m_lock);

        QDir dir(m_basePath);
        if (!dir.exists() && !dir.mkpath(".")) {
            emit errorOccurred(QString("Failed to create store directory: %1").arg(m_basePath));
            return false;
        }

        const QString path = collectionPath(code);
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            emit errorOccurred(QString("Failed to write collection: %1").arg(path));
            return false;
        }

        file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
        if (!file.commit()) {
            emit errorOccurred(QString("Failed to commit collection %1: %2")
                               .arg(path, file.errorString()));
            return false;
        }

        m_cache.insert(code, records);
    }

    qDebug() << "[JsonFileStore] Saved" << records.size() << "records for" << code;
    emit collectionChanged(code);
    return true;
}

bool JsonFileStore::removeCollection(const QString &locationCode)
{
    const QString code = locationCode.trimmed().toUpper();

    {
        QWriteLocker locker(&m_lock);
        const QString path = collectionPath(code);
        if (QFile::exists(path) && !QFile::remove(path)) {
            emit errorOccurred(QString("Failed to remove collection: %1").arg(path));
            return false;
        }
        if (m_cache.remove(code) == 0) {
            return true;
        }
    }

    emit collectionChanged(code);
    return true;
}

QStringList JsonFileStore::locationCodes() const
{
    QReadLocker locker(&m_lock);
    QStringList codes = m_cache.keys();
    codes.sort();
    return codes;
}

bool JsonFileStore::hasCollection(const QString &locationCode) const
{
    QReadLocker locker(&m_lock);
    return m_cache.contains(locationCode.trimmed().toUpper());
}

QString JsonFileStore::fileNameFor(const QString &locationCode)
{
    return sanitizeCode(locationCode) + ".json";
}

QString JsonFileStore::collectionPath(const QString &locationCode) const
{
    return QDir(m_basePath).filePath(fileNameFor(locationCode));
}

QString JsonFileStore::sanitizeCode(const QString &locationCode)
{
    QString result = locationCode.trimmed().toUpper();

    // Location codes are alphanumeric; anything else must not reach the path
    static const QString invalid = "/\\:*?\"<>|. ";
    for (const QChar &c : invalid) {
        result.replace(c, '_');
    }
    return result;
}

} // namespace Fbo
