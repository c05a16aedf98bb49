#include "syncengine.h"
#include "localstore.h"
#include "remotestore.h"
#include "syncstate.h"
#include "reconciler.h"
#include "deduplicator.h"
#include "fieldmergepolicy.h"
#include "namenormalizer.h"
#include "baselineimporter.h"

#include <QHash>
#include <QFileInfo>
#include <QDebug>

namespace Fbo {

namespace {
const char *DefaultDeviceLabel = "local-device";

struct PushedRecord {
    QString remoteId;
    QDateTime lastUpdated;
};
}

SyncEngine::SyncEngine(QObject *parent)
    : QObject(parent)
    , m_deviceLabel(DefaultDeviceLabel)
{
    qRegisterMetaType<Fbo::SyncResult>();
    qRegisterMetaType<Fbo::SyncStats>();
    qRegisterMetaType<Fbo::ImportResult>();
}

SyncEngine::~SyncEngine()
{
    if (m_state) {
        m_state->save();
    }
}

// ========== Configuration ==========

void SyncEngine::setLocalStore(LocalStore *store)
{
    delete m_store;
    m_store = store;

    if (m_store) {
        m_store->setParent(this);
        connect(m_store, &LocalStore::errorOccurred, this, &SyncEngine::errorOccurred);
    }
}

void SyncEngine::setRemoteStore(RemoteStore *remote)
{
    delete m_remote;
    m_remote = remote;

    if (m_remote) {
        m_remote->setParent(this);
        // Remote errors are expected and never fatal; report them as log lines
        connect(m_remote, &RemoteStore::errorOccurred, this, [this](const QString &error) {
            emit logMessage(QString("Remote: %1").arg(error));
        });
    }
}

void SyncEngine::setSyncState(SyncState *state)
{
    delete m_state;
    m_state = state;

    if (m_state) {
        m_state->setParent(this);
        connect(m_state, &SyncState::errorOccurred, this, &SyncEngine::errorOccurred);
    }
}

void SyncEngine::setDeviceLabel(const QString &label)
{
    const QString trimmed = label.trimmed();
    if (trimmed.isEmpty() || trimmed == FacilityRecord::ImportLabel) {
        m_deviceLabel = DefaultDeviceLabel;
    } else {
        m_deviceLabel = trimmed;
    }
}

bool SyncEngine::isCancelled() const
{
    if (m_cancelled) {
        return true;
    }
    return m_cancelCheck && m_cancelCheck();
}

QString SyncEngine::normalizeLocationCode(const QString &code)
{
    return code.trimmed().toUpper();
}

bool SyncEngine::isValidLocationCode(const QString &code)
{
    return FacilityRecord::isValidLocationCode(code);
}

// ========== Sync Operations ==========

SyncResult SyncEngine::syncLocation(const QString &locationCode)
{
    SyncResult result;
    result.locationCode = normalizeLocationCode(locationCode);
    result.startTime = QDateTime::currentDateTimeUtc();

    if (!m_store) {
        result.errorMessage = "No local store configured";
        result.endTime = QDateTime::currentDateTimeUtc();
        emit errorOccurred(result.errorMessage);
        return result;
    }

    if (!isValidLocationCode(result.locationCode)) {
        result.errorMessage = QString("Invalid location code: %1").arg(locationCode);
        result.endTime = QDateTime::currentDateTimeUtc();
        emit errorOccurred(result.errorMessage);
        return result;
    }

    const QString code = result.locationCode;
    emit syncStarted(code);

    {
        LocationLocker locker(m_locks, code);

        const FacilityList local = m_store->loadCollection(code);

        FacilityList incoming;
        if (m_remote) {
            const FetchResult fetch = m_remote->fetchRecords(code);
            if (fetch.success) {
                result.remoteAvailable = true;
                for (const FacilityRecord &record : fetch.records) {
                    if (normalizeLocationCode(record.locationCode) == code) {
                        incoming.append(record);
                    } else {
                        qDebug() << "[SyncEngine] Ignoring remote record filed under"
                                 << record.locationCode << "while syncing" << code;
                    }
                }
            } else {
                result.errorMessage = fetch.errorMessage;
                qWarning() << "[SyncEngine] Remote fetch failed for" << code
                           << "- using local data:" << fetch.errorMessage;
                emit logMessage(QString("%1: remote unavailable, showing local data").arg(code));
            }
        } else {
            result.errorMessage = "No remote store configured";
        }

        if (isCancelled()) {
            result.cancelled = true;
            result.records = local;
            result.endTime = QDateTime::currentDateTimeUtc();
            emit logMessage(QString("%1: sync cancelled").arg(code));
            emit syncFinished(result);
            return result;
        }

        const FacilityList merged = Reconciler::reconcile(local, incoming, result.stats);

        if (!m_store->saveCollection(code, merged)) {
            result.errorMessage = QString("Failed to save collection for %1").arg(code);
            result.records = local;
            result.endTime = QDateTime::currentDateTimeUtc();
            emit errorOccurred(result.errorMessage);
            emit syncFinished(result);
            return result;
        }

        if (result.remoteAvailable && m_state) {
            const QDateTime now = QDateTime::currentDateTimeUtc();
            m_state->setRemoteSnapshot(code, incoming, now);
            m_state->setLastSyncTime(code, now);
        }

        result.records = merged;
        result.success = true;
    }

    if (m_state) {
        m_state->save();
    }

    result.endTime = QDateTime::currentDateTimeUtc();

    qDebug() << "[SyncEngine] Synced" << code << "-" << result.stats.summary()
             << "in" << result.durationMs() << "ms";
    emit logMessage(QString("%1: %2").arg(code, result.stats.summary()));
    emit syncFinished(result);
    return result;
}

SyncStats SyncEngine::pushPending(const QString &locationCode)
{
    SyncStats stats;
    const QString code = normalizeLocationCode(locationCode);

    if (!m_store) {
        emit errorOccurred("No local store configured");
        return stats;
    }

    FacilityList pending;
    {
        LocationLocker locker(m_locks, code);
        for (const FacilityRecord &record : m_store->loadCollection(code)) {
            if (record.pendingUpload) {
                pending.append(record);
            }
        }
    }
    const QList<PendingDeletion> deletions = m_state ? m_state->pendingDeletions(code)
                                                     : QList<PendingDeletion>();

    if (pending.isEmpty() && deletions.isEmpty()) {
        emit pushFinished(code, stats);
        return stats;
    }

    if (!m_remote) {
        stats.failed = static_cast<int>(pending.size() + deletions.size());
        emit logMessage(QString("%1: no remote store, %2 changes stay queued").arg(code).arg(stats.failed));
        emit pushFinished(code, stats);
        return stats;
    }

    // Network calls run without the location lock so reads and edits
    // are not held up by a slow remote.
    QHash<QString, PushedRecord> pushed;     // normalized name -> outcome
    for (const FacilityRecord &record : pending) {
        if (isCancelled()) {
            stats.failed++;
            continue;
        }

        PushedRecord outcome;
        outcome.lastUpdated = record.lastUpdated;

        if (record.remoteId.isEmpty()) {
            outcome.remoteId = m_remote->insertRecord(record);
            if (outcome.remoteId.isEmpty()) {
                stats.failed++;
                continue;
            }
        } else {
            if (!m_remote->updateRecord(record)) {
                stats.failed++;
                continue;
            }
            outcome.remoteId = record.remoteId;
        }

        stats.pushed++;
        pushed.insert(NameNormalizer::normalize(record.name), outcome);
    }

    for (const PendingDeletion &deletion : deletions) {
        if (!isCancelled() && m_remote->deleteRecord(deletion.locationCode, deletion.remoteId)) {
            m_state->removePendingDeletion(deletion.locationCode, deletion.remoteId);
            stats.deleted++;
        } else {
            stats.failed++;
        }
    }

    if (!pushed.isEmpty()) {
        LocationLocker locker(m_locks, code);

        FacilityList current = m_store->loadCollection(code);
        bool changed = false;
        for (FacilityRecord &record : current) {
            const auto it = pushed.constFind(NameNormalizer::normalize(record.name));
            if (it == pushed.constEnd()) {
                continue;
            }
            if (record.remoteId.isEmpty()) {
                record.remoteId = it->remoteId;
                changed = true;
            }
            // Edited again while in flight: keep it queued
            if (record.pendingUpload && record.lastUpdated == it->lastUpdated) {
                record.pendingUpload = false;
                changed = true;
            }
        }

        if (changed && !m_store->saveCollection(code, current)) {
            emit errorOccurred(QString("Failed to record upload results for %1").arg(code));
        }
    }

    if (m_state) {
        m_state->save();
    }

    qDebug() << "[SyncEngine] Push for" << code << "-" << stats.summary();
    emit logMessage(QString("%1: pushed %2, deleted %3, %4 queued for retry")
                    .arg(code).arg(stats.pushed).arg(stats.deleted).arg(stats.failed));
    emit pushFinished(code, stats);
    return stats;
}

QStringList SyncEngine::locationsWithPendingWork() const
{
    QStringList codes;
    if (!m_store) {
        return codes;
    }

    for (const QString &code : m_store->locationCodes()) {
        for (const FacilityRecord &record : m_store->loadCollection(code)) {
            if (record.pendingUpload) {
                codes << code;
                break;
            }
        }
    }

    if (m_state) {
        for (const QString &code : m_state->locationsWithPendingDeletions()) {
            if (!codes.contains(code)) {
                codes << code;
            }
        }
    }

    codes.sort();
    return codes;
}

// ========== Bundled Dataset ==========

ImportResult SyncEngine::importBaseline(const QList<QStringList> &rows, int datasetVersion,
                                        const QDateTime &importedAt)
{
    ImportResult result;
    result.datasetVersion = datasetVersion;

    if (!m_store || !m_state) {
        result.errorMessage = "Engine is not configured for imports";
        emit errorOccurred(result.errorMessage);
        return result;
    }

    if (!m_state->needsImport(datasetVersion)) {
        result.success = true;
        qDebug() << "[SyncEngine] Dataset version" << datasetVersion << "already imported";
        return result;
    }

    const QDateTime stamp = importedAt.isValid() ? importedAt : QDateTime::currentDateTimeUtc();
    const BaselineImporter::ParseResult parsed = BaselineImporter::parseRows(rows, stamp);

    result = applyBaseline(parsed.records, datasetVersion);
    result.skipped = parsed.skipped;
    result.malformed = parsed.malformed;

    for (const QString &error : parsed.errors) {
        qDebug() << "[SyncEngine] Skipped dataset row," << error;
    }

    emit importFinished(result);
    return result;
}

ImportResult SyncEngine::importBaselineFile(const QString &filePath, int datasetVersion,
                                            const QDateTime &importedAt)
{
    ImportResult result;
    result.datasetVersion = datasetVersion;

    if (!m_store || !m_state) {
        result.errorMessage = "Engine is not configured for imports";
        emit errorOccurred(result.errorMessage);
        return result;
    }

    if (!m_state->needsImport(datasetVersion)) {
        result.success = true;
        return result;
    }

    // Bundled prices are as old as the dataset file, not the moment of import
    QDateTime stamp = importedAt;
    if (!stamp.isValid()) {
        stamp = QFileInfo(filePath).lastModified().toUTC();
    }
    BaselineImporter::ParseResult parsed;
    QString error;
    if (!BaselineImporter::parseFile(filePath, stamp, &parsed, &error)) {
        result.errorMessage = error;
        emit errorOccurred(error);
        return result;
    }

    result = applyBaseline(parsed.records, datasetVersion);
    result.skipped = parsed.skipped;
    result.malformed = parsed.malformed;

    emit importFinished(result);
    return result;
}

ImportResult SyncEngine::applyBaseline(const FacilityList &records, int datasetVersion)
{
    ImportResult result;
    result.datasetVersion = datasetVersion;
    result.ran = true;
    result.imported = static_cast<int>(records.size());

    const QMap<QString, FacilityList> byLocation = BaselineImporter::groupByLocation(records);

    for (auto it = byLocation.constBegin(); it != byLocation.constEnd(); ++it) {
        LocationLocker locker(m_locks, it.key());

        const FacilityList local = m_store->loadCollection(it.key());
        const FacilityList merged = Reconciler::reconcile(local, it.value());

        if (!m_store->saveCollection(it.key(), merged)) {
            // Version stays unrecorded so the next start retries the import
            result.errorMessage = QString("Failed to save collection for %1").arg(it.key());
            emit errorOccurred(result.errorMessage);
            return result;
        }
        result.locations++;
    }

    m_state->setDatasetVersion(datasetVersion);
    if (!m_state->save()) {
        result.errorMessage = "Failed to record dataset version";
        return result;
    }

    result.success = true;
    emit logMessage(QString("Imported dataset version %1: %2 records in %3 locations")
                    .arg(datasetVersion).arg(result.imported).arg(result.locations));
    return result;
}

// ========== Interactive Edits ==========

FacilityRecord SyncEngine::prepareEdit(const FacilityRecord &record, const QDateTime &now) const
{
    FacilityRecord edit = record;
    edit.locationCode = normalizeLocationCode(edit.locationCode);
    edit.name = edit.name.trimmed();

    // The import label is reserved for the bundled dataset
    if (!edit.isInteractiveSource()) {
        edit.updatedBy = m_deviceLabel;
    }

    edit.isVerified = false;
    edit.pendingUpload = true;
    edit.lastUpdated = now;

    if (edit.hasFuelPrice() && !edit.fuelPriceDate.isValid()) {
        edit.fuelPriceDate = now;
        if (edit.fuelPriceReporter.isEmpty()) {
            edit.fuelPriceReporter = edit.updatedBy;
        }
    }
    if (!edit.rampFee.has_value()) {
        edit.rampFeeWaived = false;
    }
    edit.normalizeFuelPair();
    return edit;
}

EditResult SyncEngine::submitEdit(const FacilityRecord &record)
{
    if (!m_store) {
        return EditResult::failure(EditError::StorageFailure, "No local store configured");
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    const FacilityRecord edit = prepareEdit(record, now);

    if (edit.name.isEmpty()) {
        return EditResult::failure(EditError::InvalidRecord, "Facility name is required");
    }
    if (!isValidLocationCode(edit.locationCode)) {
        return EditResult::failure(EditError::InvalidRecord,
                                   QString("Invalid location code: %1").arg(record.locationCode));
    }

    const QString code = edit.locationCode;
    EditResult result;

    {
        LocationLocker locker(m_locks, code);
        FacilityList local = Deduplicator::deduplicate(m_store->loadCollection(code));

        const int byName = indexOfName(local, edit.name);
        const int byId = indexOfRemoteId(local, edit.remoteId);

        FacilityRecord stored;

        if (byId >= 0 && byName >= 0 && byId != byName) {
            // Renaming onto another facility would leave two records with one remote id
            return EditResult::failure(
                EditError::DuplicateConflict,
                QString("Cannot rename %1 to \"%2\": that name belongs to another facility at %3")
                    .arg(local.at(byId).name, local.at(byName).name, code));
        }

        if (byId >= 0) {
            // Edit of a known record, possibly renamed
            const FacilityRecord &existing = local.at(byId);
            stored = FieldMergePolicy::mergeFields(existing, edit);
            if (!existing.isVerified) {
                stored.name = edit.name;
            }
            result.merged = existing.isVerified;
            local[byId] = stored;
        } else if (byName >= 0) {
            const FacilityRecord &existing = local.at(byName);
            const bool sameSource = existing.updatedBy == edit.updatedBy;

            if (existing.isVerified) {
                // Contributions to verified data are absorbed, never rejected
                stored = FieldMergePolicy::mergeFields(existing, edit);
                result.merged = true;
            } else if (sameSource) {
                stored = FieldMergePolicy::mergeFields(existing, edit);
            } else {
                return EditResult::failure(
                    EditError::DuplicateConflict,
                    QString("\"%1\" already exists at %2 (added by %3); edit that entry instead")
                        .arg(existing.name, code,
                             existing.updatedBy.isEmpty() ? QString("another source")
                                                          : existing.updatedBy));
            }
            local[byName] = stored;
        } else {
            stored = edit;
            local.append(stored);
        }

        const FacilityList collection = Deduplicator::deduplicate(local);
        if (!m_store->saveCollection(code, collection)) {
            return EditResult::failure(EditError::StorageFailure,
                                       QString("Failed to save collection for %1").arg(code));
        }

        const int index = indexOfName(collection, stored.name);
        result.record = index >= 0 ? collection.at(index) : stored;
        result.success = true;
    }

    qDebug() << "[SyncEngine] Committed edit" << result.record.description()
             << (result.merged ? "(merged into verified record)" : "");
    emit logMessage(QString("%1: saved %2%3").arg(code, result.record.name,
                    result.merged ? QString(" (merged into verified record)") : QString()));
    emit recordCommitted(code, result.record.name);
    return result;
}

EditResult SyncEngine::deleteRecord(const QString &locationCode, const QString &name)
{
    if (!m_store) {
        return EditResult::failure(EditError::StorageFailure, "No local store configured");
    }

    const QString code = normalizeLocationCode(locationCode);
    FacilityRecord removed;

    {
        LocationLocker locker(m_locks, code);
        FacilityList local = m_store->loadCollection(code);

        const int index = indexOfName(local, name);
        if (index < 0) {
            return EditResult::failure(EditError::NotFound,
                                       QString("No facility named \"%1\" at %2").arg(name, code));
        }

        if (local.at(index).isVerified) {
            return EditResult::failure(
                EditError::ProtectedRecord,
                QString("\"%1\" at %2 is verified and cannot be deleted")
                    .arg(local.at(index).name, code));
        }

        removed = local.takeAt(index);
        if (!m_store->saveCollection(code, local)) {
            return EditResult::failure(EditError::StorageFailure,
                                       QString("Failed to save collection for %1").arg(code));
        }
    }

    if (!removed.remoteId.isEmpty() && m_state) {
        PendingDeletion deletion;
        deletion.locationCode = code;
        deletion.remoteId = removed.remoteId;
        deletion.requestedAt = QDateTime::currentDateTimeUtc();
        m_state->queueDeletion(deletion);
        m_state->save();
    }

    emit logMessage(QString("%1: deleted %2").arg(code, removed.name));

    EditResult result;
    result.success = true;
    return result;
}

// ========== Queries ==========

FacilityList SyncEngine::records(const QString &locationCode) const
{
    if (!m_store) {
        return FacilityList();
    }
    return Deduplicator::deduplicate(m_store->loadCollection(normalizeLocationCode(locationCode)));
}

QList<FacilityList> SyncEngine::remoteDuplicates(const QString &locationCode) const
{
    if (!m_state) {
        return QList<FacilityList>();
    }
    const RemoteSnapshot snapshot = m_state->remoteSnapshot(normalizeLocationCode(locationCode));
    return Deduplicator::duplicateGroups(snapshot.records);
}

EditResult SyncEngine::deleteRemoteDuplicate(const QString &locationCode, const QString &remoteId)
{
    const QString code = normalizeLocationCode(locationCode);

    if (!m_state) {
        return EditResult::failure(EditError::StorageFailure, "No sync state configured");
    }

    LocationLocker locker(m_locks, code);

    const QList<FacilityList> groups = remoteDuplicates(code);
    for (const FacilityList &group : groups) {
        const int index = indexOfRemoteId(group, remoteId);
        if (index < 0) {
            continue;
        }

        const FacilityRecord &target = group.at(index);
        if (target.isVerified) {
            return EditResult::failure(EditError::ProtectedRecord,
                                       QString("Remote record %1 is verified").arg(remoteId));
        }
        if (index == 0) {
            return EditResult::failure(
                EditError::ProtectedRecord,
                QString("Remote record %1 is the preferred copy of \"%2\"").arg(remoteId, target.name));
        }

        if (m_remote && m_remote->deleteRecord(code, remoteId)) {
            const RemoteSnapshot snapshot = m_state->remoteSnapshot(code);
            FacilityList remaining = snapshot.records;
            const int cached = indexOfRemoteId(remaining, remoteId);
            if (cached >= 0) {
                remaining.removeAt(cached);
            }
            m_state->setRemoteSnapshot(code, remaining, snapshot.fetchedAt);
        } else {
            PendingDeletion deletion;
            deletion.locationCode = code;
            deletion.remoteId = remoteId;
            deletion.requestedAt = QDateTime::currentDateTimeUtc();
            m_state->queueDeletion(deletion);
        }
        m_state->save();

        emit logMessage(QString("%1: removed remote duplicate %2 of %3")
                        .arg(code, remoteId, group.first().name));

        EditResult result;
        result.success = true;
        result.record = target;
        return result;
    }

    return EditResult::failure(EditError::NotFound,
                               QString("%1 is not part of a duplicate group at %2").arg(remoteId, code));
}

int SyncEngine::indexOfName(const FacilityList &records, const QString &name)
{
    const QString key = NameNormalizer::normalize(name);
    for (int i = 0; i < records.size(); ++i) {
        if (NameNormalizer::normalize(records.at(i).name) == key) {
            return i;
        }
    }
    return -1;
}

int SyncEngine::indexOfRemoteId(const FacilityList &records, const QString &remoteId)
{
    if (remoteId.isEmpty()) {
        return -1;
    }
    for (int i = 0; i < records.size(); ++i) {
        if (records.at(i).remoteId == remoteId) {
            return i;
        }
    }
    return -1;
}

} // namespace Fbo
