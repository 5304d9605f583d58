#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTextStream>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDir>
#include <QDebug>

#include "ledgersync_version.h"
#include "settings.h"
#include "profile.h"
#include "app/replicationservice.h"
#include "model/recordkinds.h"
#include "remote/folderremote.h"
#include "store/localstore.h"
#include "store/storeinitializer.h"
#include "sync/availabilityprobe.h"
#include "sync/preferencegate.h"
#include "sync/synccoordinator.h"

using namespace LedgerSync;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString availabilitySourceName(AvailabilityProbe::Source source)
{
    switch (source) {
    case AvailabilityProbe::Source::ConfigFile:         return "replication.json";
    case AvailabilityProbe::Source::BuildConfiguration: return "build configuration";
    case AvailabilityProbe::Source::None:               break;
    }
    return "not configured";
}

int runStatus(ReplicationService &service)
{
    service.start(false);

    const AvailabilityProbe &probe = service.availability();
    out() << "Data folder:      " << service.profile().dataFolderPath() << Qt::endl;
    out() << "Device id:        " << service.profile().deviceId() << Qt::endl;
    out() << "Availability:     " << (probe.isAvailable() ? "available" : "unavailable")
          << " (" << availabilitySourceName(probe.source()) << ")" << Qt::endl;
    if (probe.isAvailable()) {
        out() << "Container:        " << probe.containerIdentifier() << Qt::endl;
    }
    out() << "Preference:       " << (service.replicationEnabled() ? "enabled" : "disabled") << Qt::endl;
    out() << "Should replicate: " << (service.preferences()->shouldReplicate() ? "yes" : "no") << Qt::endl;

    StoreHandle *handle = service.storeHandle();
    out() << "Store:            " << storeStrategyName(handle->strategy())
          << (handle->isReplicating() ? ", replicating" : ", local only") << Qt::endl;
    for (const StrategyFailure &failure : handle->failures()) {
        out() << "  " << storeStrategyName(failure.strategy) << " failed: "
              << errorKindName(failure.error) << " - " << failure.message << Qt::endl;
    }

    StoreSummary summary = service.store()->summary();
    for (auto it = summary.counts.constBegin(); it != summary.counts.constEnd(); ++it) {
        out() << "  " << it.key() << ": " << it.value() << Qt::endl;
    }
    out() << "Pending changes:  " << summary.pendingChanges << Qt::endl;

    if (service.remote()) {
        out() << "Remote folder:    " << service.remoteFolder() << Qt::endl;
        out() << "Account:          " << accountStatusDescription(service.remote()->accountStatus()) << Qt::endl;
    }
    return 0;
}

int runSetEnabled(ReplicationService &service, bool enabled)
{
    service.setReplicationEnabled(enabled);
    out() << "Replication " << (enabled ? "enabled" : "disabled")
          << ". Takes effect on next start." << Qt::endl;
    if (enabled && !service.availability().isAvailable()) {
        err() << "Warning: remote replication is not configured for this install." << Qt::endl;
    }
    return 0;
}

int runSync(QCoreApplication &app, ReplicationService &service)
{
    int exitCode = 0;
    QObject::connect(&service, &ReplicationService::statusChanged,
                     &app, [&](const SyncStatus &status) {
        if (status.state == SyncStatus::Settled) {
            out() << status.outcome.summary() << Qt::endl;
            app.quit();
        } else if (status.state == SyncStatus::Failed) {
            err() << status.outcome.summary() << Qt::endl;
            exitCode = 1;
            app.quit();
        }
    });

    service.start(true);

    if (!service.isReplicating()) {
        err() << "Replication is not active: "
              << (service.replicationEnabled() ? "the store could not be opened for replication"
                                               : "enable it first with 'ledgersync enable'")
              << Qt::endl;
        return 1;
    }
    if (!service.coordinator()->isRunning()) {
        err() << "No remote account folder configured (use --remote or init-remote)" << Qt::endl;
        return 1;
    }

    app.exec();
    return exitCode;
}

int runAddExpense(ReplicationService &service, const QStringList &args)
{
    if (args.isEmpty()) {
        err() << "Usage: ledgersync add-expense <amount> [notes]" << Qt::endl;
        return 2;
    }

    bool ok = false;
    const double amount = args.first().toDouble(&ok);
    if (!ok) {
        err() << "Invalid amount: " << args.first() << Qt::endl;
        return 2;
    }

    service.start(false);
    const QString id = service.addExpense(amount, args.mid(1).join(' '));
    if (id.isEmpty()) {
        err() << "Failed to save expense: " << service.store()->errorString() << Qt::endl;
        return 1;
    }
    out() << id << Qt::endl;
    return 0;
}

int runList(ReplicationService &service, const QStringList &args)
{
    service.start(false);

    const QString kind = args.isEmpty() ? Records::Expense : args.first();
    if (!service.store()->schema().contains(kind)) {
        err() << "Unknown record kind: " << kind << Qt::endl;
        return 2;
    }

    const QList<SyncRecord> records = service.store()->fetch(kind);
    for (const SyncRecord &record : records) {
        QJsonObject fields = QJsonObject::fromVariantMap(record.fields);
        out() << record.id << "  "
              << QString::fromUtf8(QJsonDocument(fields).toJson(QJsonDocument::Compact))
              << Qt::endl;
    }
    return 0;
}

int runInitRemote(ReplicationService &service)
{
    const QString folder = service.remoteFolder();
    if (folder.isEmpty()) {
        err() << "Usage: ledgersync --remote <dir> init-remote" << Qt::endl;
        return 2;
    }

    QString error;
    if (!FolderRemote::initializeAccount(folder, &error)) {
        err() << error << Qt::endl;
        return 1;
    }

    Profile &profile = service.profile();
    if (!profile.exists()) {
        profile.initialize();
    }
    profile.setRemoteAccountFolder(folder);
    if (!profile.save()) {
        err() << "Failed to save profile " << profile.configFilePath() << Qt::endl;
        return 1;
    }

    if (!service.availability().isAvailable()) {
        AvailabilityProbe::writeConfigFile(profile.replicationConfigPath(),
                                           QStringLiteral("ledgersync.folder"));
    }

    out() << "Remote account ready in " << QDir(folder).absolutePath() << Qt::endl;
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("LedgerSync");
    app.setApplicationVersion(LEDGERSYNC_VERSION);
    app.setOrganizationName("LedgerSync");

    QCommandLineParser parser;
    parser.setApplicationDescription("Local-first expense data with optional replication");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption dataOption("data", "Profile data folder.", "dir");
    QCommandLineOption remoteOption("remote", "Remote account folder.", "dir");
    QCommandLineOption verboseOption({"v", "verbose"}, "Print debug output.");
    parser.addOption(dataOption);
    parser.addOption(remoteOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("command",
        "status | enable | disable | sync | add-expense <amount> [notes] | list [kind] | init-remote");

    parser.process(app);

    Settings settings;

    if (!parser.isSet(verboseOption) && !settings.debugLogging()) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }

    const QString dataFolder = parser.isSet(dataOption) ? parser.value(dataOption)
                                                         : settings.defaultDataFolder();

    ReplicationService service(&settings, dataFolder);
    if (parser.isSet(remoteOption)) {
        service.setRemoteFolder(QDir::cleanPath(parser.value(remoteOption)));
    }
    QObject::connect(&service, &ReplicationService::logMessage,
                     [](const QString &message) { qDebug().noquote() << message; });

    const QString command = positional.first();
    const QStringList args = positional.mid(1);

    if (command == "status")
        return runStatus(service);
    if (command == "enable")
        return runSetEnabled(service, true);
    if (command == "disable")
        return runSetEnabled(service, false);
    if (command == "sync")
        return runSync(app, service);
    if (command == "add-expense")
        return runAddExpense(service, args);
    if (command == "list")
        return runList(service, args);
    if (command == "init-remote")
        return runInitRemote(service);

    err() << "Unknown command: " << command << Qt::endl;
    parser.showHelp(2);
}
