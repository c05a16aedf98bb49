#include "syncstate.h"
#include "../mappers/facilitymapper.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QCryptographicHash>
#include <QDebug>

#include <algorithm>

namespace Fbo {

namespace {
const int StateFormatVersion = 1;
}

SyncState::SyncState(const QString &stateDir, QObject *parent)
    : QObject(parent)
    , m_stateDir(stateDir)
{
}

SyncState::~SyncState()
{
    // Auto-save on destruction
    bool dirty;
    {
        QMutexLocker locker(&m_mutex);
        dirty = m_dirty;
    }
    if (dirty) {
        save();
    }
}

void SyncState::markDirty()
{
    m_dirty = true;
}

// ========== Dataset Versioning ==========

int SyncState::datasetVersion() const
{
    QMutexLocker locker(&m_mutex);
    return m_datasetVersion;
}

bool SyncState::setDatasetVersion(int version)
{
    {
        QMutexLocker locker(&m_mutex);
        if (version <= m_datasetVersion) {
            return false;
        }

        qDebug() << "[SyncState] Dataset version" << m_datasetVersion << "->" << version
                 << "- dropping" << m_locations.size() << "remote snapshots";

        m_datasetVersion = version;
        for (auto it = m_locations.begin(); it != m_locations.end(); ++it) {
            it->snapshot = RemoteSnapshot();
        }
        markDirty();
    }
    emit stateChanged();
    return true;
}

bool SyncState::needsImport(int version) const
{
    QMutexLocker locker(&m_mutex);
    return version > m_datasetVersion;
}

// ========== Per-location Metadata ==========

QDateTime SyncState::lastSyncTime(const QString &locationCode) const
{
    QMutexLocker locker(&m_mutex);
    return m_locations.value(locationCode).lastSync;
}

void SyncState::setLastSyncTime(const QString &locationCode, const QDateTime &time)
{
    {
        QMutexLocker locker(&m_mutex);
        m_locations[locationCode].lastSync = time;
        markDirty();
    }
    emit stateChanged();
}

bool SyncState::setRemoteSnapshot(const QString &locationCode, const FacilityList &records,
                                  const QDateTime &fetchedAt)
{
    const QByteArray serialized =
        QJsonDocument(FacilityMapper::toJsonArray(records)).toJson(QJsonDocument::Compact);
    const QString hash = calculateHash(serialized);

    bool changed;
    {
        QMutexLocker locker(&m_mutex);
        RemoteSnapshot &snapshot = m_locations[locationCode].snapshot;
        changed = snapshot.contentHash != hash;
        snapshot.fetchedAt = fetchedAt;
        snapshot.contentHash = hash;
        snapshot.records = records;
        markDirty();
    }
    emit stateChanged();
    return changed;
}

RemoteSnapshot SyncState::remoteSnapshot(const QString &locationCode) const
{
    QMutexLocker locker(&m_mutex);
    return m_locations.value(locationCode).snapshot;
}

bool SyncState::hasRemoteSnapshot(const QString &locationCode) const
{
    QMutexLocker locker(&m_mutex);
    return m_locations.value(locationCode).snapshot.isValid();
}

void SyncState::removeRemoteSnapshot(const QString &locationCode)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_locations.contains(locationCode)) {
            return;
        }
        m_locations[locationCode].snapshot = RemoteSnapshot();
        markDirty();
    }
    emit stateChanged();
}

QStringList SyncState::knownLocations() const
{
    QMutexLocker locker(&m_mutex);
    return m_locations.keys();
}

// ========== Deletion Outbox ==========

void SyncState::queueDeletion(const PendingDeletion &deletion)
{
    {
        QMutexLocker locker(&m_mutex);
        for (const PendingDeletion &queued : m_pendingDeletes) {
            if (queued.locationCode == deletion.locationCode
                && queued.remoteId == deletion.remoteId) {
                return;  // Already queued
            }
        }
        m_pendingDeletes.append(deletion);
        markDirty();
    }
    emit stateChanged();
}

QList<PendingDeletion> SyncState::pendingDeletions(const QString &locationCode) const
{
    QMutexLocker locker(&m_mutex);
    QList<PendingDeletion> result;
    for (const PendingDeletion &deletion : m_pendingDeletes) {
        if (deletion.locationCode == locationCode) {
            result.append(deletion);
        }
    }
    return result;
}

void SyncState::removePendingDeletion(const QString &locationCode, const QString &remoteId)
{
    {
        QMutexLocker locker(&m_mutex);
        const qsizetype before = m_pendingDeletes.size();
        m_pendingDeletes.erase(
            std::remove_if(m_pendingDeletes.begin(), m_pendingDeletes.end(),
                           [&](const PendingDeletion &d) {
                               return d.locationCode == locationCode && d.remoteId == remoteId;
                           }),
            m_pendingDeletes.end());
        if (m_pendingDeletes.size() == before) {
            return;
        }
        markDirty();
    }
    emit stateChanged();
}

int SyncState::pendingDeletionCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_pendingDeletes.size());
}

QStringList SyncState::locationsWithPendingDeletions() const
{
    QMutexLocker locker(&m_mutex);
    QStringList codes;
    for (const PendingDeletion &deletion : m_pendingDeletes) {
        if (!codes.contains(deletion.locationCode)) {
            codes << deletion.locationCode;
        }
    }
    return codes;
}

// ========== Persistence ==========

bool SyncState::load()
{
    QFile file(stateFilePath());
    if (!file.exists()) {
        // No previous state - this is fine for first run
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open state file: %1").arg(stateFilePath()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse state: %1").arg(parseError.errorString()));
        return false;
    }

    const QJsonObject root = doc.object();

    QMutexLocker locker(&m_mutex);
    m_datasetVersion = root["datasetVersion"].toInt();

    m_locations.clear();
    const QJsonObject locations = root["locations"].toObject();
    for (auto it = locations.begin(); it != locations.end(); ++it) {
        m_locations.insert(it.key(), locationFromJson(it.value().toObject()));
    }

    m_pendingDeletes.clear();
    const QJsonArray deletes = root["pendingDeletes"].toArray();
    for (const QJsonValue &val : deletes) {
        const QJsonObject obj = val.toObject();
        PendingDeletion deletion;
        deletion.locationCode = obj["locationCode"].toString();
        deletion.remoteId = obj["remoteId"].toString();
        deletion.requestedAt = QDateTime::fromString(obj["requestedAt"].toString(), Qt::ISODateWithMs);
        if (!deletion.locationCode.isEmpty() && !deletion.remoteId.isEmpty()) {
            m_pendingDeletes.append(deletion);
        }
    }
    m_dirty = false;

    qDebug() << "[SyncState] Loaded dataset version" << m_datasetVersion
             << "with" << m_locations.size() << "locations and"
             << m_pendingDeletes.size() << "pending deletions";
    return true;
}

bool SyncState::save()
{
    QDir dir(m_stateDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(m_stateDir));
        return false;
    }

    QMutexLocker locker(&m_mutex);

    QJsonObject root;
    root["version"] = StateFormatVersion;
    root["datasetVersion"] = m_datasetVersion;

    QJsonObject locations;
    for (auto it = m_locations.cbegin(); it != m_locations.cend(); ++it) {
        locations[it.key()] = locationToJson(it.value());
    }
    root["locations"] = locations;

    QJsonArray deletes;
    for (const PendingDeletion &deletion : m_pendingDeletes) {
        QJsonObject obj;
        obj["locationCode"] = deletion.locationCode;
        obj["remoteId"] = deletion.remoteId;
        obj["requestedAt"] = deletion.requestedAt.toUTC().toString(Qt::ISODateWithMs);
        deletes.append(obj);
    }
    root["pendingDeletes"] = deletes;

    QSaveFile file(stateFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        locker.unlock();
        emit errorOccurred(QString("Failed to save state: %1").arg(stateFilePath()));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        locker.unlock();
        emit errorOccurred(QString("Failed to commit state: %1").arg(file.errorString()));
        return false;
    }
    m_dirty = false;

    qDebug() << "[SyncState] Saved state for" << m_locations.size() << "locations";
    return true;
}

void SyncState::clear()
{
    {
        QMutexLocker locker(&m_mutex);
        m_datasetVersion = 0;
        m_locations.clear();
        m_pendingDeletes.clear();
        markDirty();
    }
    emit stateChanged();
}

QString SyncState::statePath() const
{
    return m_stateDir;
}

QString SyncState::stateFilePath() const
{
    return QDir(m_stateDir).filePath("state.json");
}

QString SyncState::calculateHash(const QByteArray &data)
{
    return QString::fromLatin1(
        QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex().left(16));
}

QJsonObject SyncState::locationToJson(const LocationState &state) const
{
    QJsonObject obj;
    if (state.lastSync.isValid()) {
        obj["lastSync"] = state.lastSync.toUTC().toString(Qt::ISODateWithMs);
    }
    if (state.snapshot.isValid()) {
        QJsonObject snapshot;
        snapshot["fetchedAt"] = state.snapshot.fetchedAt.toUTC().toString(Qt::ISODateWithMs);
        snapshot["hash"] = state.snapshot.contentHash;
        snapshot["records"] = FacilityMapper::toJsonArray(state.snapshot.records);
        obj["remoteSnapshot"] = snapshot;
    }
    return obj;
}

SyncState::LocationState SyncState::locationFromJson(const QJsonObject &json) const
{
    LocationState state;
    state.lastSync = QDateTime::fromString(json["lastSync"].toString(), Qt::ISODateWithMs);

    const QJsonObject snapshot = json["remoteSnapshot"].toObject();
    if (!snapshot.isEmpty()) {
        state.snapshot.fetchedAt = QDateTime::fromString(snapshot["fetchedAt"].toString(), Qt::ISODateWithMs);
        state.snapshot.contentHash = snapshot["hash"].toString();
        state.snapshot.records = FacilityMapper::fromJsonArray(snapshot["records"].toArray());
    }
    return state;
}

} // namespace Fbo
