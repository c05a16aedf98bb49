#include "commandhandler.h"
#include "consolelog.h"
#include "../settings.h"
#include "../mappers/facilitymapper.h"
#include "../sync/syncengine.h"
#include "../sync/syncstate.h"
#include "../sync/jsonfilestore.h"
#include "../sync/fileremotestore.h"
#include "../sync/facilityrepository.h"
#include "../sync/uploadqueue.h"
#include "../sync/namenormalizer.h"

#include <QDir>
#include <QFileInfo>
#include <QFuture>
#include <QDebug>
#include <cstdio>

using namespace Fbo;

CommandHandler::CommandHandler(QObject *parent)
    : QObject(parent)
    , m_out(stdout)
{
}

CommandHandler::~CommandHandler()
{
    // Repository first: it waits for uploads running on the engine
    m_repository.reset();
    m_engine.reset();
}

const QStringList &CommandHandler::amenityNames()
{
    static const QStringList names = {
        "crew-cars", "lounge", "catering", "maintenance", "hangars",
        "deice", "oxygen", "gpu", "lav"
    };
    return names;
}

bool CommandHandler::openProfile(const QString &path)
{
    if (path.isEmpty()) {
        emit errorOccurred("No profile given and no default profile configured");
        return false;
    }

    m_profile = Profile(path);
    if (!m_profile.exists()) {
        emit errorOccurred(QString("No profile at %1 (run 'qfbosync init' first)").arg(path));
        return false;
    }

    m_repository.reset();
    m_engine = std::make_unique<SyncEngine>();
    if (m_log) {
        connect(m_engine.get(), &SyncEngine::logMessage, m_log, &ConsoleLog::logInfo, Qt::DirectConnection);
        connect(m_engine.get(), &SyncEngine::errorOccurred, m_log, &ConsoleLog::logError, Qt::DirectConnection);
    }

    m_engine->setLocalStore(new JsonFileStore(m_profile.storeDirectoryPath()));

    auto *state = new SyncState(m_profile.stateDirectoryPath());
    m_engine->setSyncState(state);
    if (!state->load()) {
        emit errorOccurred("Sync state is unreadable; starting from empty state");
    }

    if (m_profile.hasRemote()) {
        m_engine->setRemoteStore(new FileRemoteStore(m_profile.remotePath()));
    }
    m_engine->setDeviceLabel(m_profile.deviceLabel());

    m_repository = std::make_unique<FacilityRepository>(m_engine.get());
    m_repository->uploadQueue()->setMaxThreadCount(Settings::instance().uploadThreads());

    Settings::instance().addRecentProfile(path);
    qDebug() << "[CommandHandler] Opened profile" << m_profile.name()
             << "as" << m_profile.deviceLabel();

    return importConfiguredDataset() == 0;
}

int CommandHandler::importConfiguredDataset()
{
    const QString datasetPath = m_profile.datasetPath();
    if (datasetPath.isEmpty() || m_profile.datasetVersion() <= 0) {
        return 0;
    }

    const ImportResult result = m_engine->importBaselineFile(datasetPath, m_profile.datasetVersion());
    if (!result.success) {
        emit errorOccurred(QString("Bundled dataset import failed: %1").arg(result.errorMessage));
        return 1;
    }
    if (result.ran && result.skipped > 0) {
        emit logMessage(QString("Skipped %1 dataset rows (%2 malformed)")
                        .arg(result.skipped).arg(result.malformed));
    }
    return 0;
}

// ========== Commands ==========

int CommandHandler::runInit(const QString &path, const QString &remotePath,
                            const QString &datasetPath, int datasetVersion,
                            const QString &deviceLabel)
{
    Profile profile(path);
    if (!remotePath.isEmpty()) {
        profile.setRemotePath(remotePath);
    }
    if (!datasetPath.isEmpty()) {
        profile.setDatasetPath(datasetPath);
        profile.setDatasetVersion(datasetVersion > 0 ? datasetVersion : 1);
    }
    if (!deviceLabel.isEmpty() && !profile.setDeviceLabel(deviceLabel)) {
        emit errorOccurred(QString("\"%1\" cannot be used as device label").arg(deviceLabel));
        return 2;
    }

    if (!profile.initialize()) {
        emit errorOccurred(QString("Failed to initialize profile at %1").arg(path));
        return 1;
    }

    if (Settings::instance().defaultProfilePath().isEmpty()) {
        Settings::instance().setDefaultProfilePath(QFileInfo(path).absoluteFilePath());
    }

    emit logMessage(QString("Initialized profile %1 (device label %2)")
                    .arg(profile.name(), profile.deviceLabel()));
    return 0;
}

int CommandHandler::runImport(const QString &csvPath, int datasetVersion)
{
    const int version = datasetVersion > 0
        ? datasetVersion
        : m_engine->syncState()->datasetVersion() + 1;

    const ImportResult result = m_engine->importBaselineFile(csvPath, version);
    if (!result.success) {
        emit errorOccurred(result.errorMessage);
        return 1;
    }
    if (!result.ran) {
        emit logMessage(QString("Dataset version %1 is already imported").arg(version));
        return 0;
    }

    m_out << QString("Imported %1 records into %2 locations (version %3), skipped %4 rows, %5 malformed")
                 .arg(result.imported).arg(result.locations).arg(result.datasetVersion)
                 .arg(result.skipped).arg(result.malformed)
          << Qt::endl;
    return 0;
}

int CommandHandler::runList(const QString &locationCode)
{
    const QString code = SyncEngine::normalizeLocationCode(locationCode);
    if (!SyncEngine::isValidLocationCode(code)) {
        emit errorOccurred(QString("Invalid location code: %1").arg(locationCode));
        return 2;
    }

    if (m_profile.syncOnStart()) {
        m_repository->requestSync(code).waitForFinished();
    }

    const FacilityList records = m_repository->getRecords(code);
    if (records.isEmpty()) {
        m_out << "No facilities stored for " << code << Qt::endl;
        return 0;
    }

    for (const FacilityRecord &record : records) {
        printRecord(record);
    }
    return 0;
}

int CommandHandler::runSync(const QStringList &locationCodes)
{
    QStringList codes = locationCodes;
    if (codes.isEmpty()) {
        codes = m_engine->localStore()->locationCodes();
    }

    QList<QFuture<SyncResult>> futures;
    for (const QString &code : codes) {
        futures << m_repository->requestSync(code);
    }

    int exitCode = 0;
    for (QFuture<SyncResult> &future : futures) {
        const SyncResult result = future.result();
        if (!result.success) {
            emit errorOccurred(QString("%1: %2").arg(result.locationCode, result.errorMessage));
            exitCode = 1;
            continue;
        }
        if (!result.remoteAvailable && m_log) {
            m_log->logWarning(QString("%1: %2").arg(result.locationCode, result.errorMessage));
        }
        m_out << result.locationCode << ": " << result.records.size() << " facilities"
              << (result.remoteAvailable ? "" : " (remote unavailable, local data)")
              << " - " << result.stats.summary() << Qt::endl;
    }

    m_repository->waitForIdle();
    return exitCode;
}

int CommandHandler::runEdit(const QString &locationCode, const QString &name,
                            const EditOptions &options)
{
    const QString code = SyncEngine::normalizeLocationCode(locationCode);

    // Start from the stored record so unspecified fields are kept
    FacilityRecord record;
    bool found = false;
    const QString key = NameNormalizer::normalize(name);
    for (const FacilityRecord &stored : m_repository->getRecords(code)) {
        if (NameNormalizer::normalize(stored.name) == key) {
            record = stored;
            found = true;
            break;
        }
    }
    if (!found) {
        record.locationCode = code;
        record.name = name.trimmed();
    }

    record.updatedBy = m_profile.deviceLabel();
    if (!applyOptions(record, options)) {
        return 2;
    }

    const EditResult result = m_repository->submitEdit(record);
    if (!result.success) {
        emit errorOccurred(result.errorMessage);
        return 1;
    }

    if (result.merged) {
        emit logMessage(QString("Merged into verified facility \"%1\"").arg(result.record.name));
    }
    printRecord(result.record);
    m_repository->waitForIdle();
    return 0;
}

int CommandHandler::runDelete(const QString &locationCode, const QString &name)
{
    const EditResult result = m_repository->deleteRecord(locationCode, name);
    if (!result.success) {
        emit errorOccurred(result.errorMessage);
        return 1;
    }

    m_repository->waitForIdle();
    return 0;
}

int CommandHandler::runPush(const QStringList &locationCodes)
{
    QStringList codes = locationCodes;
    if (codes.isEmpty()) {
        codes = m_engine->locationsWithPendingWork();
    }

    int failed = 0;
    for (const QString &code : codes) {
        const SyncStats stats = m_engine->pushPending(code);
        m_out << SyncEngine::normalizeLocationCode(code) << ": pushed " << stats.pushed
              << ", deleted " << stats.deleted << ", queued " << stats.failed << Qt::endl;
        failed += stats.failed;
    }
    return failed > 0 ? 1 : 0;
}

int CommandHandler::runProfiles()
{
    const QString defaultPath = Settings::instance().defaultProfilePath();
    const QStringList recent = Settings::instance().recentProfiles();

    if (recent.isEmpty() && defaultPath.isEmpty()) {
        m_out << "No profiles used yet" << Qt::endl;
        return 0;
    }

    QStringList paths = recent;
    if (!defaultPath.isEmpty() && !paths.contains(defaultPath)) {
        paths.prepend(defaultPath);
    }
    for (const QString &path : paths) {
        const Profile profile(path);
        m_out << (path == defaultPath ? "* " : "  ") << profile.name() << "  " << path;
        if (!profile.exists()) {
            m_out << "  (missing)";
        }
        m_out << Qt::endl;
    }
    return 0;
}

int CommandHandler::runDupes(const QString &locationCode, const QString &deleteId)
{
    const QString code = SyncEngine::normalizeLocationCode(locationCode);

    if (!deleteId.isEmpty()) {
        const EditResult result = m_engine->deleteRemoteDuplicate(code, deleteId);
        if (!result.success) {
            emit errorOccurred(result.errorMessage);
            return 1;
        }
        m_out << "Removed " << deleteId << " (" << result.record.name << ")" << Qt::endl;
        return 0;
    }

    const QList<FacilityList> groups = m_engine->remoteDuplicates(code);
    if (groups.isEmpty()) {
        m_out << "No remote duplicates cached for " << code << Qt::endl;
        return 0;
    }

    for (const FacilityList &group : groups) {
        m_out << group.first().name << ":" << Qt::endl;
        for (int i = 0; i < group.size(); ++i) {
            const FacilityRecord &record = group.at(i);
            m_out << "  " << (i == 0 ? "* " : "  ") << record.remoteId << "  " << record.name
                  << (record.isVerified ? "  [verified]" : "")
                  << "  " << record.lastUpdated.toString(Qt::ISODate) << Qt::endl;
        }
    }
    return 0;
}

// ========== Helpers ==========

bool CommandHandler::applyOptions(FacilityRecord &record, const EditOptions &options)
{
    if (!options.phoneNumber.isEmpty()) record.phoneNumber = options.phoneNumber;
    if (!options.radioFrequency.isEmpty()) record.radioFrequency = options.radioFrequency;
    if (!options.website.isEmpty()) record.website = options.website;

    struct Amount {
        const QString &text;
        std::optional<double> *target;
        const char *option;
    };
    const Amount amounts[] = {
        { options.jetAPrice, &record.jetAPrice, "--jet-a" },
        { options.avgasPrice, &record.avgasPrice, "--avgas" },
        { options.handlingFee, &record.handlingFee, "--handling-fee" },
        { options.overnightFee, &record.overnightFee, "--overnight-fee" },
        { options.rampFee, &record.rampFee, "--ramp-fee" },
    };

    bool fuelChanged = false;
    for (const Amount &amount : amounts) {
        if (amount.text.isEmpty()) {
            continue;
        }
        bool ok = false;
        const std::optional<double> value = FacilityMapper::parseAmount(amount.text, &ok);
        if (!ok || !value.has_value()) {
            emit errorOccurred(QString("%1 expects a number, got \"%2\"").arg(amount.option, amount.text));
            return false;
        }
        *amount.target = value;
        if (amount.target == &record.jetAPrice || amount.target == &record.avgasPrice) {
            fuelChanged = true;
        }
    }

    if (fuelChanged) {
        // New observation: the engine stamps date and reporter
        record.fuelPriceDate = QDateTime();
        record.fuelPriceReporter.clear();
    }

    if (options.rampFeeWaived) {
        if (!record.rampFee.has_value()) {
            emit errorOccurred("--ramp-fee-waived needs a ramp fee");
            return false;
        }
        record.rampFeeWaived = true;
    }

    for (const QString &amenity : options.amenities) {
        const QString name = amenity.trimmed().toLower();
        if (name == "crew-cars") record.hasCrewCars = true;
        else if (name == "lounge") record.hasCrewLounge = true;
        else if (name == "catering") record.hasCatering = true;
        else if (name == "maintenance") record.hasMaintenance = true;
        else if (name == "hangars") record.hasHangars = true;
        else if (name == "deice") record.hasDeice = true;
        else if (name == "oxygen") record.hasOxygen = true;
        else if (name == "gpu") record.hasGPU = true;
        else if (name == "lav") record.hasLav = true;
        else {
            emit errorOccurred(QString("Unknown amenity \"%1\" (expected one of: %2)")
                               .arg(amenity, amenityNames().join(", ")));
            return false;
        }
    }

    return true;
}

void CommandHandler::printRecord(const FacilityRecord &record)
{
    auto money = [](const std::optional<double> &value) {
        return value.has_value() ? QString("$%1").arg(*value, 0, 'f', 2) : QString("-");
    };

    m_out << record.locationCode << "  " << record.name
          << (record.isVerified ? "  [verified]" : "")
          << (record.pendingUpload ? "  [pending upload]" : "") << Qt::endl;

    if (!record.phoneNumber.isEmpty() || !record.radioFrequency.isEmpty()) {
        m_out << "    phone " << (record.phoneNumber.isEmpty() ? "-" : record.phoneNumber)
              << "   unicom " << (record.radioFrequency.isEmpty() ? "-" : record.radioFrequency)
              << Qt::endl;
    }
    if (!record.website.isEmpty()) {
        m_out << "    " << record.website << Qt::endl;
    }
    if (record.hasFuelPrice()) {
        m_out << "    Jet-A " << money(record.jetAPrice) << "   100LL " << money(record.avgasPrice)
              << "   (" << record.fuelPriceDate.toString(Qt::ISODate);
        if (!record.fuelPriceReporter.isEmpty()) {
            m_out << " by " << record.fuelPriceReporter;
        }
        m_out << ")" << Qt::endl;
    }
    if (record.handlingFee || record.overnightFee || record.rampFee) {
        m_out << "    handling " << money(record.handlingFee)
              << "   overnight " << money(record.overnightFee)
              << "   ramp " << money(record.rampFee)
              << (record.rampFeeWaived ? " (waivable)" : "") << Qt::endl;
    }
    const QString amenities = record.amenitiesSummary();
    if (!amenities.isEmpty()) {
        m_out << "    " << amenities << Qt::endl;
    }
    if (record.hasRating()) {
        m_out << "    rating " << (record.averageRating ? QString::number(*record.averageRating, 'f', 1) : QString("-"))
              << " (" << record.ratingCount.value_or(0) << " reviews)" << Qt::endl;
    }
    m_out << "    updated " << record.lastUpdated.toString(Qt::ISODate)
          << " by " << (record.updatedBy.isEmpty() ? "unknown" : record.updatedBy) << Qt::endl;
}
