#ifndef COMMANDHANDLER_H
#define COMMANDHANDLER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <memory>

#include "../profile.h"
#include "../model/facilityrecord.h"

class ConsoleLog;

namespace Fbo {
class SyncEngine;
class FacilityRepository;
}

/**
 * @brief Runs the qfbosync commands against one profile
 *
 * Every run* method returns a process exit code: 0 on success, 1 when
 * the operation was rejected or failed, 2 for usage errors.
 */
class CommandHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Field changes requested on the command line
     */
    struct EditOptions {
        QString phoneNumber;
        QString radioFrequency;
        QString website;
        QString jetAPrice;
        QString avgasPrice;
        QString handlingFee;
        QString overnightFee;
        QString rampFee;
        bool rampFeeWaived = false;
        QStringList amenities;      ///< crew-cars, lounge, catering, ...
    };

    explicit CommandHandler(QObject *parent = nullptr);
    ~CommandHandler();

    void setLog(ConsoleLog *log) { m_log = log; }

    /**
     * @brief Load the profile and build the engine around it
     */
    bool openProfile(const QString &path);

    // Commands
    int runInit(const QString &path, const QString &remotePath, const QString &datasetPath,
                int datasetVersion, const QString &deviceLabel);
    int runImport(const QString &csvPath, int datasetVersion);
    int runList(const QString &locationCode);
    int runSync(const QStringList &locationCodes);
    int runEdit(const QString &locationCode, const QString &name, const EditOptions &options);
    int runDelete(const QString &locationCode, const QString &name);
    int runPush(const QStringList &locationCodes);
    int runDupes(const QString &locationCode, const QString &deleteId);
    int runProfiles();

    /**
     * @brief Names accepted by --amenity
     */
    static const QStringList &amenityNames();

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    bool applyOptions(Fbo::FacilityRecord &record, const EditOptions &options);
    void printRecord(const Fbo::FacilityRecord &record);
    int importConfiguredDataset();

    Profile m_profile;
    std::unique_ptr<Fbo::SyncEngine> m_engine;
    std::unique_ptr<Fbo::FacilityRepository> m_repository;
    ConsoleLog *m_log = nullptr;
    QTextStream m_out;
};

#endif // COMMANDHANDLER_H
