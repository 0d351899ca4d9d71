#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QEventLoop>
#include <QLocale>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QTextStream>
#include <QThread>
#include <QDebug>
#include <algorithm>

#include "qdocksync_version.h"
#include "settings.h"
#include "device/connectionsupervisor.h"
#include "device/hotplugmonitor.h"
#include "device/localdevicedriver.h"
#include "device/transportserializer.h"
#include "sync/importworker.h"
#include "sync/jsonrecordingcatalog.h"
#include "sync/localrecordingstorage.h"
#include "sync/syncorchestrator.h"

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

struct RunOptions {
    QString deviceDirectory;
    QString storageDirectory;
    QString catalogPath;
};

int runConfig(const QStringList &args)
{
    Settings &settings = Settings::instance();

    if (args.isEmpty()) {
        for (const QString &key : Settings::keys()) {
            out() << key << " = " << settings.valueAsString(key) << "\n";
        }
        out().flush();
        return 0;
    }

    const QString key = args.at(0);
    if (args.size() == 1) {
        if (!Settings::keys().contains(key)) {
            err() << "Unknown setting: " << key << "\n";
            return 1;
        }
        out() << settings.valueAsString(key) << "\n";
        out().flush();
        return 0;
    }

    QString error;
    if (!settings.setFromString(key, args.mid(1).join(' '), &error)) {
        err() << error << "\n";
        return 1;
    }
    settings.sync();
    out() << key << " = " << settings.valueAsString(key) << "\n";
    out().flush();
    return 0;
}

} // namespace

/**
 * @brief Composition root for the command line front end
 *
 * Builds the one transport, supervisor, catalog, storage and orchestrator
 * for the process and runs a single command against them. Imports run on
 * a dedicated thread through Sync::ImportWorker; the main thread waits in
 * a local event loop so queued progress signals keep flowing.
 */
class CommandRunner : public QObject
{
    Q_OBJECT

public:
    explicit CommandRunner(const RunOptions &options, QObject *parent = nullptr)
        : QObject(parent)
        , m_options(options)
    {
        Settings &settings = Settings::instance();

        const QString devicePath = options.deviceDirectory;
        m_transport = new TransportSerializer([devicePath]() -> DeviceDriver * {
            return new LocalDeviceDriver(devicePath);
        });

        m_supervisor = new ConnectionSupervisor(m_transport);
        m_supervisor->setRetryPolicy(settings.retryPolicy());
        m_supervisor->setBatteryPollInterval(settings.batteryPollIntervalMs());

        m_monitor = new DirectoryHotplugMonitor(devicePath);
        m_supervisor->setHotplugMonitor(m_monitor);

        m_catalog = new Sync::JsonRecordingCatalog(options.catalogPath);
        m_storage = new Sync::LocalRecordingStorage(options.storageDirectory);
        m_orchestrator = new Sync::SyncOrchestrator(m_transport, m_catalog, m_storage);

        connect(m_supervisor, &ConnectionSupervisor::logMessage, this, &CommandRunner::printLog);
        connect(m_supervisor, &ConnectionSupervisor::batteryStatusChanged,
                this, &CommandRunner::onBatteryStatus);
        connect(m_orchestrator, &Sync::SyncOrchestrator::progressUpdated,
                this, &CommandRunner::onProgress);
        connect(m_orchestrator, &Sync::SyncOrchestrator::fileProcessed,
                this, &CommandRunner::onFileProcessed);

        // Import thread
        m_importThread = new QThread(this);
        m_importWorker = new Sync::ImportWorker(m_orchestrator);
        m_importWorker->moveToThread(m_importThread);
        connect(m_importThread, &QThread::finished, m_importWorker, &QObject::deleteLater);
        connect(m_importWorker, &Sync::ImportWorker::logMessage, this, &CommandRunner::printLog);
        m_importThread->start();
    }

    ~CommandRunner() override
    {
        m_monitor->stop();

        m_importThread->quit();
        if (!m_importThread->wait(5000)) {
            qWarning() << "[CommandRunner] Import thread did not finish in 5s, waiting...";
            m_importThread->wait();
        }

        // Reverse construction order; the supervisor stops its workers first
        delete m_supervisor;
        delete m_orchestrator;
        delete m_storage;
        delete m_catalog;
        delete m_monitor;
        delete m_transport;
    }

    bool prepare()
    {
        if (!m_catalog->load()) {
            err() << "Could not load catalog: " << m_catalog->lastError() << "\n";
            return false;
        }
        return true;
    }

    // ========== Commands ==========

    int runStatus()
    {
        if (!waitForDevice()) return 1;

        const DeviceSession session = m_supervisor->session();
        const StorageInfo storage = m_supervisor->storageInfo();
        const QLocale locale;

        out() << "Model:     " << deviceModelName(session.model) << "\n"
              << "Serial:    " << session.serialNumber << "\n"
              << "Firmware:  " << session.firmwareVersion
              << " (" << session.firmwareNumber << ")\n"
              << "Storage:   " << locale.formattedDataSize(storage.usedBytes()) << " used of "
              << locale.formattedDataSize(storage.totalBytes) << "\n";

        if (session.supportsBattery) {
            const TransportResult<BatteryStatus> battery = m_transport->getBatteryStatus();
            if (battery.ok()) {
                out() << "Battery:   " << battery.value.percentage << "% ("
                      << batteryStateName(battery.value.state) << ")\n";
            } else {
                out() << "Battery:   unavailable (" << battery.errorMessage << ")\n";
            }
        }

        out() << "Catalog:   " << m_catalog->count() << " recording(s)\n";
        out().flush();
        return 0;
    }

    int runList()
    {
        if (!waitForDevice()) return 1;

        const TransportResult<QList<RemoteFileEntry>> listing = m_transport->listFiles();
        if (!listing.ok()) {
            err() << "Could not list recordings: " << listing.errorMessage << "\n";
            return 1;
        }

        const QLocale locale;
        for (const RemoteFileEntry &entry : listing.value) {
            Sync::RecordingRecord record;
            const bool known = m_catalog->fetchByFilename(entry.filename, &record);
            QString marker = "new";
            if (known) {
                marker = (!record.hasKnownSize() || record.fileSizeBytes == entry.size)
                    ? "imported" : "changed";
            }

            out() << QString("%1  %2  %3s  %4  [%5]\n")
                .arg(entry.filename, -32)
                .arg(locale.formattedDataSize(entry.size), 10)
                .arg(entry.durationSeconds, 6)
                .arg(recordingModeName(entry.mode), -8)
                .arg(marker);
        }
        out() << listing.value.size() << " recording(s) on device\n";
        out().flush();
        return 0;
    }

    int runSync(const QStringList &names)
    {
        if (!waitForDevice()) return 1;
        if (names.isEmpty()) {
            return printImportResult(runDeviceImport());
        }

        const TransportResult<QList<RemoteFileEntry>> listing = m_transport->listFiles();
        if (!listing.ok()) {
            err() << "Could not list recordings: " << listing.errorMessage << "\n";
            return 1;
        }

        QList<RemoteFileEntry> selected;
        for (const QString &name : names) {
            auto it = std::find_if(listing.value.cbegin(), listing.value.cend(),
                                   [&name](const RemoteFileEntry &entry) {
                                       return entry.filename == name;
                                   });
            if (it == listing.value.cend()) {
                err() << "Not on device: " << name << "\n";
                return 1;
            }
            selected.append(*it);
        }
        return printImportResult(runDeviceImport(&selected));
    }

    int runImport(const QStringList &paths)
    {
        if (paths.isEmpty()) {
            err() << "No files given\n";
            return 1;
        }

        Sync::ManualImportResult result;
        QEventLoop loop;
        connect(m_importWorker, &Sync::ImportWorker::manualImportFinished, &loop,
                [&](const Sync::ManualImportResult &r) {
                    result = r;
                    loop.quit();
                });

        Sync::ImportWorker *worker = m_importWorker;
        QMetaObject::invokeMethod(worker, [worker, paths]() {
            worker->doImportFiles(paths);
        }, Qt::QueuedConnection);
        loop.exec();

        for (const Sync::RecordingRecord &record : result.imported) {
            out() << "Imported " << record.filename << "\n";
        }
        for (const QString &failure : result.failures) {
            err() << "Failed   " << failure << "\n";
        }
        out() << result.imported.size() << " imported, "
              << result.failures.size() << " failed\n";
        out().flush();
        return result.success() ? 0 : 1;
    }

    int runDelete(const QString &filename)
    {
        if (!waitForDevice()) return 1;

        const TransportStatus status = m_transport->deleteFile(filename);
        if (!status.ok()) {
            err() << "Could not delete " << filename << ": " << status.errorMessage << "\n";
            return 1;
        }

        // The local copy, if any, is now the only one
        Sync::RecordingRecord record;
        if (m_catalog->fetchByFilename(filename, &record)
            && record.syncStatus == Sync::SyncStatus::Synced) {
            if (!m_catalog->updateSyncStatus(record.id, Sync::SyncStatus::LocalOnly)) {
                err() << "Deleted from device, but the catalog was not updated: "
                      << m_catalog->lastError() << "\n";
                return 1;
            }
        }

        out() << "Deleted " << filename << " from device\n";
        out().flush();
        return 0;
    }

    int runWatch()
    {
        connect(m_supervisor, &ConnectionSupervisor::deviceReady, this, [this]() {
            if (m_importRunning) {
                return;
            }
            printImportResult(runDeviceImport());
        });
        connect(m_supervisor, &ConnectionSupervisor::stateChanged, this,
                [](const ConnectionState &state) {
                    if (state.kind == ConnectionState::ConnectionFailed) {
                        err() << state.toString() << "\n";
                        err().flush();
                    }
                });

        out() << "Watching " << QDir::toNativeSeparators(m_options.deviceDirectory)
              << " (Ctrl+C to stop)\n";
        out().flush();
        m_monitor->start();
        return QCoreApplication::exec();
    }

private slots:
    void printLog(const QString &message)
    {
        qInfo().noquote() << message;
    }

    void onBatteryStatus(const BatteryStatus &status)
    {
        qInfo().noquote() << QString("Battery %1% (%2)")
            .arg(status.percentage).arg(batteryStateName(status.state));
    }

    void onProgress(quint64 deviceId, const Sync::ImportProgress &progress)
    {
        Q_UNUSED(deviceId)
        if (progress.state != Sync::ImportState::Importing) {
            qDebug().noquote() << "[CommandRunner] Import" << Sync::importStateName(progress.state);
            return;
        }
        out() << QString("\r[%1/%2] %3  %4  %5 remaining    ")
            .arg(progress.filesCompleted).arg(progress.filesTotal)
            .arg(progress.formattedBytes(), progress.formattedSpeed(),
                 progress.formattedTimeRemaining());
        out().flush();
    }

    void onFileProcessed(quint64 deviceId, const QString &filename,
                         Sync::FileOutcome outcome, const QString &detail)
    {
        Q_UNUSED(deviceId)
        QString label;
        switch (outcome) {
        case Sync::FileOutcome::Downloaded: label = "Downloaded"; break;
        case Sync::FileOutcome::Skipped:    label = "Skipped   "; break;
        case Sync::FileOutcome::Failed:     label = "Failed    "; break;
        }
        out() << "\r" << label << " " << filename;
        if (!detail.isEmpty()) {
            out() << ": " << detail;
        }
        out() << "\n";
        out().flush();
    }

private:
    bool waitForDevice()
    {
        m_monitor->start();
        if (!m_monitor->isAttached()) {
            err() << "No recorder found at " << QDir::toNativeSeparators(m_options.deviceDirectory) << "\n";
            return false;
        }

        if (!m_supervisor->isConnected()
            && m_supervisor->state().kind != ConnectionState::ConnectionFailed) {
            QEventLoop loop;
            connect(m_supervisor, &ConnectionSupervisor::stateChanged, &loop,
                    [&loop](const ConnectionState &state) {
                        if (state.kind == ConnectionState::Connected
                            || state.kind == ConnectionState::ConnectionFailed) {
                            loop.quit();
                        }
                    });
            loop.exec();
        }

        if (!m_supervisor->isConnected()) {
            err() << m_supervisor->state().toString() << "\n";
            return false;
        }
        return true;
    }

    Sync::ImportResult runDeviceImport(const QList<RemoteFileEntry> *subset = nullptr)
    {
        m_importRunning = true;

        Sync::ImportResult result;
        QEventLoop loop;
        QMetaObject::Connection finished = connect(
            m_importWorker, &Sync::ImportWorker::importFinished, &loop,
            [&](const Sync::ImportResult &r) {
                result = r;
                loop.quit();
            });

        const quint64 deviceId = m_supervisor->attachedDeviceId();
        Sync::ImportWorker *worker = m_importWorker;
        if (subset) {
            const QList<RemoteFileEntry> files = *subset;
            QMetaObject::invokeMethod(worker, [worker, deviceId, files]() {
                worker->doImportDeviceFiles(deviceId, files);
            }, Qt::QueuedConnection);
        } else {
            QMetaObject::invokeMethod(worker, [worker, deviceId]() {
                worker->doImportFromDevice(deviceId);
            }, Qt::QueuedConnection);
        }
        loop.exec();

        disconnect(finished);
        m_importRunning = false;
        return result;
    }

    int printImportResult(const Sync::ImportResult &result)
    {
        out() << "\n";
        if (result.rejected || (!result.success && !result.cancelled && result.stats.total == 0)) {
            err() << result.errorMessage << "\n";
            err().flush();
            return 1;
        }
        if (result.cancelled) {
            out() << result.errorMessage << "\n";
        }

        out() << result.stats.summary() << " in "
              << QString::number(result.durationMs() / 1000.0, 'f', 1) << "s\n";
        if (!result.failures.isEmpty()) {
            err() << result.errorMessage << "\n";
        }
        out().flush();
        err().flush();
        return result.success ? 0 : 1;
    }

    RunOptions m_options;

    TransportSerializer *m_transport = nullptr;
    ConnectionSupervisor *m_supervisor = nullptr;
    DirectoryHotplugMonitor *m_monitor = nullptr;
    Sync::JsonRecordingCatalog *m_catalog = nullptr;
    Sync::LocalRecordingStorage *m_storage = nullptr;
    Sync::SyncOrchestrator *m_orchestrator = nullptr;

    QThread *m_importThread = nullptr;
    Sync::ImportWorker *m_importWorker = nullptr;
    bool m_importRunning = false;
};

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("QDockSync");
    app.setApplicationVersion(QDOCKSYNC_VERSION_STRING);
    app.setOrganizationName("QDockSync");
    app.setOrganizationDomain("qdocksync.org");

    QCommandLineParser parser;
    parser.setApplicationDescription("Copy recordings from a USB audio recorder into local storage");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "status | list | sync [names...] | import <files...> | delete <name> | watch | config [key [value]]");

    QCommandLineOption deviceDirOption("device-dir", "Directory of the mounted recorder.", "path");
    QCommandLineOption storageDirOption("storage-dir", "Directory recordings are stored in.", "path");
    QCommandLineOption catalogOption("catalog", "Catalog file.", "file");
    QCommandLineOption debugOption("debug", "Enable debug output.");
    parser.addOption(deviceDirOption);
    parser.addOption(storageDirOption);
    parser.addOption(catalogOption);
    parser.addOption(debugOption);
    parser.process(app);

    Settings &settings = Settings::instance();

    const bool debug = parser.isSet(debugOption) || settings.debugLogging();
    QLoggingCategory::setFilterRules(debug ? "*.debug=true" : "*.debug=false");

    RunOptions options;
    options.deviceDirectory = parser.isSet(deviceDirOption)
        ? parser.value(deviceDirOption) : settings.deviceDirectory();
    options.storageDirectory = parser.isSet(storageDirOption)
        ? parser.value(storageDirOption) : settings.storageDirectory();
    options.catalogPath = parser.isSet(catalogOption)
        ? parser.value(catalogOption) : settings.catalogPath();

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const QString command = args.first();
    if (command == "config") {
        return runConfig(args.mid(1));
    }
    if (command != "import" && options.deviceDirectory.isEmpty()) {
        err() << "No device directory configured (use --device-dir)\n";
        return 1;
    }

    CommandRunner runner(options);
    if (!runner.prepare()) {
        return 1;
    }

    if (command == "status") {
        return runner.runStatus();
    } else if (command == "list") {
        return runner.runList();
    } else if (command == "sync") {
        return runner.runSync(args.mid(1));
    } else if (command == "import") {
        return runner.runImport(args.mid(1));
    } else if (command == "delete") {
        if (args.size() != 2) {
            err() << "Usage: qdocksync delete <name>\n";
            return 1;
        }
        return runner.runDelete(args.at(1));
    } else if (command == "watch") {
        return runner.runWatch();
    }

    err() << "Unknown command: " << command << "\n";
    parser.showHelp(1);
}

#include "main.moc"
