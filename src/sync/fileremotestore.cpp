#include "fileremotestore.h"
#include "../mappers/facilitymapper.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QUuid>
#include <QDebug>

namespace Fbo {

FileRemoteStore::FileRemoteStore(const QString &rootPath, QObject *parent)
    : RemoteStore(parent)
    , m_rootPath(rootPath)
{
}

bool FileRemoteStore::isAvailable() const
{
    if (m_rootPath.isEmpty()) {
        return false;
    }
    QDir dir(m_rootPath);
    return dir.exists() || dir.mkpath(".");
}

FetchResult FileRemoteStore::fetchRecords(const QString &locationCode)
{
    FetchResult result;

    if (!isAvailable()) {
        result.errorMessage = QString("Remote folder not available: %1").arg(m_rootPath);
        emit errorOccurred(result.errorMessage);
        return result;
    }

    QMutexLocker locker(&m_mutex);

    const QString path = locationPath(locationCode);
    if (!QDir(path).exists()) {
        result.success = true;  // Nothing filed under this location yet
        return result;
    }

    QDirIterator it(path, QStringList() << "*.json", QDir::Files);
    while (it.hasNext()) {
        const QString filePath = it.next();

        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            result.errorMessage = QString("Failed to read remote record: %1").arg(filePath);
            locker.unlock();
            emit errorOccurred(result.errorMessage);
            return result;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qWarning() << "[FileRemoteStore] Skipping unreadable record" << filePath
                       << parseError.errorString();
            continue;
        }

        FacilityRecord record = FacilityMapper::fromJson(doc.object());
        record.remoteId = QFileInfo(filePath).completeBaseName();
        record.pendingUpload = false;
        result.records.append(record);
    }

    result.success = true;
    qDebug() << "[FileRemoteStore] Fetched" << result.records.size()
             << "records for" << locationCode;
    return result;
}

QString FileRemoteStore::insertRecord(const FacilityRecord &record)
{
    if (record.locationCode.isEmpty()) {
        emit errorOccurred("Cannot insert record without location code");
        return QString();
    }
    if (!isAvailable()) {
        emit errorOccurred(QString("Remote folder not available: %1").arg(m_rootPath));
        return QString();
    }

    const QString remoteId = generateId();
    FacilityRecord stored = record;
    stored.remoteId = remoteId;
    stored.pendingUpload = false;

    {
        QMutexLocker locker(&m_mutex);
        QDir dir(locationPath(record.locationCode));
        if (!dir.exists() && !dir.mkpath(".")) {
            locker.unlock();
            emit errorOccurred(QString("Failed to create remote location: %1").arg(dir.path()));
            return QString();
        }
        if (!writeRecord(recordPath(record.locationCode, remoteId), stored)) {
            return QString();
        }
    }

    emit recordInserted(remoteId);
    return remoteId;
}

bool FileRemoteStore::updateRecord(const FacilityRecord &record)
{
    if (!isSafeId(record.remoteId)) {
        emit errorOccurred(QString("Cannot update record with invalid ID: %1").arg(record.remoteId));
        return false;
    }

    FacilityRecord stored = record;
    stored.pendingUpload = false;

    {
        QMutexLocker locker(&m_mutex);
        const QString path = recordPath(record.locationCode, record.remoteId);
        if (!QFile::exists(path)) {
            locker.unlock();
            emit errorOccurred(QString("Remote record not found: %1").arg(record.remoteId));
            return false;
        }
        if (!writeRecord(path, stored)) {
            return false;
        }
    }

    emit recordUpdated(record.remoteId);
    return true;
}

bool FileRemoteStore::deleteRecord(const QString &locationCode, const QString &remoteId)
{
    if (!isSafeId(remoteId)) {
        emit errorOccurred(QString("Cannot delete record with invalid ID: %1").arg(remoteId));
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        const QString path = recordPath(locationCode, remoteId);
        if (QFile::exists(path) && !QFile::remove(path)) {
            locker.unlock();
            emit errorOccurred(QString("Failed to delete remote record: %1").arg(path));
            return false;
        }
    }

    emit recordDeleted(remoteId);
    return true;
}

QString FileRemoteStore::generateId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString FileRemoteStore::locationPath(const QString &locationCode) const
{
    return QDir(m_rootPath).filePath(locationCode.trimmed().toUpper());
}

QString FileRemoteStore::recordPath(const QString &locationCode, const QString &remoteId) const
{
    return QDir(locationPath(locationCode)).filePath(remoteId + ".json");
}

bool FileRemoteStore::writeRecord(const QString &path, const FacilityRecord &record)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to write remote record: %1").arg(path));
        return false;
    }

    file.write(QJsonDocument(FacilityMapper::toJson(record)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit remote record %1: %2")
                           .arg(path, file.errorString()));
        return false;
    }
    return true;
}

bool FileRemoteStore::isSafeId(const QString &remoteId)
{
    if (remoteId.isEmpty()) {
        return false;
    }
    for (const QChar &c : remoteId) {
        if (!c.isLetterOrNumber() && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace Fbo
