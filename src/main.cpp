#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDebug>

#include "qfbosync_version.h"
#include "settings.h"
#include "app/consolelog.h"
#include "app/commandhandler.h"

namespace {

const char *CommandSummary =
    "Commands:\n"
    "  init                   Create a profile in the --profile folder\n"
    "  import <csv>           Fold a bundled dataset into the local store\n"
    "  list <CODE>            Show stored facilities for a location\n"
    "  sync [CODE...]         Reconcile locations with the remote store\n"
    "  edit <CODE> <NAME>     Create or edit a facility\n"
    "  delete <CODE> <NAME>   Delete an unverified facility\n"
    "  push [CODE...]         Upload pending local changes\n"
    "  dupes <CODE>           List near-duplicates in the cached remote data\n"
    "  profiles               List the default and recently used profiles";

int usageError(ConsoleLog &log, const QString &message)
{
    log.logError(message);
    return 2;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("QFboSync");
    QCoreApplication::setApplicationName("QFboSync");
    QCoreApplication::setApplicationVersion(QFBOSYNC_VERSION_STRING);

    QCommandLineParser parser;
    parser.setApplicationDescription(QString("Airport facility (FBO) data sync\n\n%1").arg(CommandSummary));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption profileOption({"p", "profile"}, "Profile data folder.", "dir");
    QCommandLineOption verboseOption({"v", "verbose"}, "Print debug output.");
    QCommandLineOption quietOption({"q", "quiet"}, "Only print warnings and errors.");
    QCommandLineOption versionNumberOption("dataset-version", "Dataset version for import/init.", "n");
    QCommandLineOption remoteOption("remote", "Shared remote folder (init).", "dir");
    QCommandLineOption datasetOption("dataset", "Bundled dataset file (init).", "csv");
    QCommandLineOption labelOption("device-label", "Label recorded on local edits (init).", "label");
    QCommandLineOption phoneOption("phone", "Phone number (edit).", "text");
    QCommandLineOption unicomOption("unicom", "Radio frequency (edit).", "text");
    QCommandLineOption websiteOption("website", "Website (edit).", "url");
    QCommandLineOption jetOption("jet-a", "Jet-A price (edit).", "price");
    QCommandLineOption avgasOption("avgas", "100LL price (edit).", "price");
    QCommandLineOption handlingOption("handling-fee", "Handling fee (edit).", "amount");
    QCommandLineOption overnightOption("overnight-fee", "Overnight fee (edit).", "amount");
    QCommandLineOption rampOption("ramp-fee", "Ramp fee (edit).", "amount");
    QCommandLineOption waivedOption("ramp-fee-waived", "Ramp fee is waived with fuel purchase (edit).");
    QCommandLineOption amenityOption("amenity",
        QString("Confirm an amenity, repeatable (edit): %1.").arg(CommandHandler::amenityNames().join(", ")),
        "name");
    QCommandLineOption deleteOption("delete", "Remove a remote duplicate by id (dupes).", "id");

    parser.addOptions({profileOption, verboseOption, quietOption, versionNumberOption, remoteOption,
                       datasetOption, labelOption, phoneOption, unicomOption, websiteOption,
                       jetOption, avgasOption, handlingOption, overnightOption, rampOption,
                       waivedOption, amenityOption, deleteOption});
    parser.addPositionalArgument("command", "Command to run, see above.");
    parser.process(app);

    Settings &settings = Settings::instance();
    ConsoleLog::configureLogging(parser.isSet(verboseOption) || settings.debugLogging());

    ConsoleLog log;
    log.setQuiet(parser.isSet(quietOption));
    CommandHandler handler;
    handler.setLog(&log);
    QObject::connect(&handler, &CommandHandler::logMessage, &log, &ConsoleLog::logInfo);
    QObject::connect(&handler, &CommandHandler::errorOccurred, &log, &ConsoleLog::logError);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(2);
    }

    const QString command = args.takeFirst();
    const QString profilePath = parser.isSet(profileOption)
        ? parser.value(profileOption)
        : settings.defaultProfilePath();

    int datasetVersion = 0;
    if (parser.isSet(versionNumberOption)) {
        bool ok = false;
        datasetVersion = parser.value(versionNumberOption).toInt(&ok);
        if (!ok || datasetVersion <= 0) {
            return usageError(log, "--dataset-version expects a positive number");
        }
    }

    if (command == "init") {
        if (profilePath.isEmpty()) {
            return usageError(log, "init needs --profile");
        }
        const int result = handler.runInit(profilePath, parser.value(remoteOption),
                                           parser.value(datasetOption), datasetVersion,
                                           parser.value(labelOption));
        settings.sync();
        return result;
    }

    if (command == "profiles") {
        return handler.runProfiles();
    }

    static const QStringList knownCommands = {
        "import", "list", "sync", "edit", "delete", "push", "dupes"
    };
    if (!knownCommands.contains(command)) {
        return usageError(log, QString("Unknown command \"%1\"").arg(command));
    }

    if (!handler.openProfile(profilePath)) {
        return 1;
    }

    int result = 0;
    if (command == "import") {
        if (args.size() != 1) {
            return usageError(log, "usage: import <csv> [--dataset-version N]");
        }
        result = handler.runImport(args.first(), datasetVersion);
    } else if (command == "list") {
        if (args.size() != 1) {
            return usageError(log, "usage: list <CODE>");
        }
        result = handler.runList(args.first());
    } else if (command == "sync") {
        result = handler.runSync(args);
    } else if (command == "edit") {
        if (args.size() != 2) {
            return usageError(log, "usage: edit <CODE> <NAME> [field options]");
        }
        CommandHandler::EditOptions options;
        options.phoneNumber = parser.value(phoneOption);
        options.radioFrequency = parser.value(unicomOption);
        options.website = parser.value(websiteOption);
        options.jetAPrice = parser.value(jetOption);
        options.avgasPrice = parser.value(avgasOption);
        options.handlingFee = parser.value(handlingOption);
        options.overnightFee = parser.value(overnightOption);
        options.rampFee = parser.value(rampOption);
        options.rampFeeWaived = parser.isSet(waivedOption);
        options.amenities = parser.values(amenityOption);
        result = handler.runEdit(args.at(0), args.at(1), options);
    } else if (command == "delete") {
        if (args.size() != 2) {
            return usageError(log, "usage: delete <CODE> <NAME>");
        }
        result = handler.runDelete(args.at(0), args.at(1));
    } else if (command == "push") {
        result = handler.runPush(args);
    } else if (command == "dupes") {
        if (args.size() != 1) {
            return usageError(log, "usage: dupes <CODE> [--delete ID]");
        }
        result = handler.runDupes(args.first(), parser.value(deleteOption));
    }

    settings.sync();
    return result;
}
