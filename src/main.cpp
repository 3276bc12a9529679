#include "config.h"
#include "logger.h"
#include "database.h"
#include "fingerprint.h"
#include "placementresolver.h"
#include "encryptor.h"
#include "devicelister.h"
#include "uploadassembler.h"
#include "ingestioncoordinator.h"
#include <csignal>
#include <iostream>
#include <iomanip>
#include <ctime>
#include <vector>
#include <string>

using namespace MediaVault;

namespace {

CancellationToken g_stopToken;

void handleInterrupt(int) {
    g_stopToken.cancel();
}

void printUsage() {
    std::cout <<
        "Usage: media_vault [--config <file>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  backup <mount> [--scheduled] [--device-name <name>]\n"
        "  verify [fingerprint]\n"
        "  restore <fingerprint> <destination>\n"
        "  stats\n"
        "  history [limit]\n"
        "  sweep\n"
        "  decrypt <input> <output>\n";
}

std::string formatTime(int64_t epoch) {
    if (epoch == 0) {
        return "-";
    }
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

// Componentes del pipeline construidos a partir de la configuración
struct Application {
    Database database;
    FingerprintEngine fingerprints;
    PlacementResolver resolver;
    Encryptor encryptor;
    IngestionCoordinator coordinator;
    UploadAssembler assembler;

    explicit Application(const Config& config)
        : fingerprints(config.useFastHash() ? HashMode::Fast : HashMode::Full,
                       config.fastHashSampleSize())
        , resolver(&database, config.backupRoot())
        , coordinator(&database, fingerprints, resolver, &encryptor,
                      CoordinatorOptions{config.backupRoot(), config.encryptedRoot(),
                                         config.encryptOriginals(), config.maxConcurrentIngestions()})
        , assembler(&database, fingerprints,
                    AssemblerOptions{config.tempRoot(), config.maxUploadSize(), config.uploadChunkSize()})
    {
    }
};

int runBackupCommand(Application& app, const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 2;
    }

    std::string mount = args[0];
    std::string deviceName;
    SyncKind kind = SyncKind::Manual;

    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--scheduled") {
            kind = SyncKind::Scheduled;
        } else if (args[i] == "--device-name" && i + 1 < args.size()) {
            deviceName = args[++i];
        } else {
            std::cerr << "Unknown option: " << args[i] << std::endl;
            return 2;
        }
    }

    DeviceInfo device = DirectoryDeviceLister::describe(mount, deviceName);
    if (device.mediaRoot.empty()) {
        std::cerr << "No DCIM folder found under " << mount << std::endl;
        return 1;
    }

    DirectoryDeviceLister lister;
    BackupReport report = app.coordinator.runBackup(lister, device, kind, g_stopToken,
        [](const BackupProgress& progress) {
            if (progress.status != BackupStatus::Running || progress.currentFile.empty()) {
                return;
            }
            std::cout << "\r[" << std::fixed << std::setprecision(1) << progress.percentage() << "%] "
                      << progress.processedFiles << "/" << progress.totalFiles << " "
                      << progress.currentFile << std::string(20, ' ') << std::flush;
        });

    const BackupProgress& progress = report.progress;
    std::cout << "\nBackup " << backupStatusToString(progress.status) << ": "
              << progress.backedUpFiles << " new, " << progress.skippedFiles << " skipped, "
              << progress.failedFiles << " failed" << std::endl;

    for (const auto& failure : report.failures) {
        std::cout << "  FAILED " << failure.path << " [" << ingestErrorToString(failure.error)
                  << "] " << failure.message << std::endl;
    }

    if (progress.status == BackupStatus::Failed) {
        std::cerr << report.errorMessage << std::endl;
        return 1;
    }
    return progress.failedFiles > 0 ? 3 : 0;
}

int runVerifyCommand(Application& app, const std::vector<std::string>& args) {
    if (!args.empty()) {
        VerifyResult result = app.coordinator.verify(args[0]);
        std::cout << (result.ok ? "OK" : "FAILED: " + result.message) << std::endl;
        return result.ok ? 0 : 1;
    }

    VerifySummary summary = app.coordinator.verifyAll();
    std::cout << "Verified " << summary.checked << " files, " << summary.passed << " OK" << std::endl;
    for (const auto& fingerprint : summary.failedFingerprints) {
        std::cout << "  FAILED " << fingerprint << std::endl;
    }
    return summary.failedFingerprints.empty() ? 0 : 1;
}

int runRestoreCommand(Application& app, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return 2;
    }

    std::string error;
    if (!app.coordinator.restore(args[0], args[1], error)) {
        std::cerr << "Restore failed: " << error << std::endl;
        return 1;
    }
    std::cout << "Restored to " << args[1] << std::endl;
    return 0;
}

int runStatsCommand(Application& app) {
    BackupStatistics stats = app.coordinator.statistics();
    std::cout << "Files backed up:   " << stats.totalFiles << "\n"
              << "Storage used:      " << std::fixed << std::setprecision(2)
              << (stats.totalBytes / (1024.0 * 1024.0 * 1024.0)) << " GB\n"
              << "Backup runs:       " << stats.syncs.totalSyncs << "\n"
              << "Successful runs:   " << stats.syncs.successfulSyncs << "\n"
              << "Files from runs:   " << stats.syncs.totalFilesBackedUp << std::endl;
    return 0;
}

int runHistoryCommand(Application& app, const std::vector<std::string>& args) {
    int limit = 10;
    if (!args.empty()) {
        try {
            limit = std::stoi(args[0]);
        } catch (const std::exception&) {
            std::cerr << "Invalid limit: " << args[0] << std::endl;
            return 2;
        }
    }

    for (const auto& sync : app.database.getRecentSyncs(limit)) {
        std::cout << formatTime(sync.startedAt) << "  " << std::setw(9) << syncKindToString(sync.kind)
                  << "  " << std::setw(11) << syncStatusToString(sync.status)
                  << "  new=" << sync.filesBackedUp << " skipped=" << sync.filesSkipped
                  << " failed=" << sync.filesFailed << "  " << sync.durationSeconds << "s"
                  << (sync.errorMessage.empty() ? "" : "  " + sync.errorMessage) << std::endl;
    }
    return 0;
}

int runSweepCommand(Application& app, const Config& config) {
    ReconcileReport reconciled = app.assembler.reconcile();
    int expired = app.assembler.sweepStaleSessions(config.sessionRetentionHours());
    int purged = app.assembler.purgeTerminalSessions(config.completedSessionRetentionDays());

    std::cout << "Paused " << reconciled.pausedSessions << " sessions, removed "
              << reconciled.removedArtifacts << " artifacts, expired " << expired
              << " sessions, purged " << purged << " sessions" << std::endl;
    return 0;
}

int runDecryptCommand(Application& app, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return 2;
    }
    if (!app.encryptor.decryptFile(args[0], args[1])) {
        std::cerr << "Decryption failed: " << app.encryptor.lastError() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage();
        return args.empty() ? 2 : 0;
    }

    Config& config = Config::instance();
    if (!configPath.empty()) {
        config.reload(configPath);
    }

    Logger& logger = Logger::instance();
    logger.setLogLevel(Logger::parseLevel(config.logLevel()));
    logger.setLogFile(config.logPath());

    if (!config.isValid()) {
        std::cerr << "Invalid configuration: " << config.validationError() << std::endl;
        return 2;
    }

    LOG_INFO("=============================================================");
    LOG_INFO("MediaVault - backup root: " + config.backupRoot());
    LOG_INFO("Fingerprint mode: " + std::string(config.useFastHash() ? "fast" : "full"));
    LOG_INFO("=============================================================");

    Application app(config);

    if (!app.database.initialize(config.databasePath())) {
        std::cerr << "Cannot open metadata store at " << config.databasePath() << std::endl;
        return 1;
    }

    std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    bool needsKey = config.encryptOriginals() || command == "decrypt" || command == "restore";
    if (needsKey) {
        if (!app.encryptor.loadOrCreateKey(config.keyPath()) || !app.encryptor.verifyKey()) {
            std::cerr << "Encryption key unavailable: " << app.encryptor.lastError() << std::endl;
            if (config.encryptOriginals() || command == "decrypt") {
                return 1;
            }
        }
    }

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    if (command == "backup") return runBackupCommand(app, rest);
    if (command == "verify") return runVerifyCommand(app, rest);
    if (command == "restore") return runRestoreCommand(app, rest);
    if (command == "stats") return runStatsCommand(app);
    if (command == "history") return runHistoryCommand(app, rest);
    if (command == "sweep") return runSweepCommand(app, config);
    if (command == "decrypt") return runDecryptCommand(app, rest);

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 2;
}
