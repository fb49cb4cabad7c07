#include "main/backup_main.hpp"
#include "backup/backup_runner.hpp"
#include "backup/snapshot_store.hpp"
#include "common/command_runner.hpp"
#include "common/logger.hpp"
#include "transport/remote_shell.hpp"
#include <iostream>
#include <memory>
#include <string>

void printBackupUsage() {
    std::cout << "Usage: appliance-backup backup [options] [<host>[:<port>]]\n"
              << "Take a snapshot of an appliance. The host defaults to 'hostname'\n"
              << "from the configuration file.\n"
              << "\n"
              << "Options:\n"
              << "  -v, --verbose  Verbose output\n"
              << "  -h, --help     Show this help message\n";
}

int backupMain(int argc, char* argv[], const AppConfig& config) {
    std::string host = config.hostname;
    bool hostGiven = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printBackupUsage();
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            Logger::setLogLevel(LogLevel::DEBUG);
        } else if (!arg.empty() && arg[0] != '-' && !hostGiven) {
            host = arg;
            hostGiven = true;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << std::endl;
            printBackupUsage();
            return 1;
        }
    }

    if (host.empty()) {
        std::cerr << "Error: No host given and no 'hostname' configured" << std::endl;
        printBackupUsage();
        return 1;
    }

    auto runner = std::make_shared<ProcessRunner>();
    auto shell = std::make_shared<RemoteShell>(runner, config.ssh, config.rsyncChecksum);
    auto store = std::make_shared<SnapshotStore>(config.dataDir);

    BackupRunner backup(shell, store, config);
    backup.setProgressCallback([](const std::string& step, int progress) {
        Logger::info("Backup progress: " + std::to_string(progress) + "% (" + step + ")");
    });

    Snapshot snapshot;
    if (!backup.run(host, snapshot)) {
        Logger::error("Backup of " + host + " failed: " + backup.getLastError());
        return 1;
    }

    std::cout << snapshot.id << std::endl;
    return 0;
}

int listMain(int argc, char* argv[], const AppConfig& config) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: appliance-backup list\n"
                      << "List committed snapshots, oldest first.\n";
            return 0;
        }
        std::cerr << "Error: Unexpected argument: " << arg << std::endl;
        return 1;
    }

    SnapshotStore store(config.dataDir);
    auto current = store.currentId();
    for (const auto& id : store.list()) {
        Snapshot snapshot;
        if (!store.resolve(id, snapshot)) {
            Logger::warning(store.getLastError());
            continue;
        }
        std::cout << id << "  " << (snapshot.strategy.empty() ? "-" : snapshot.strategy)
                  << "  " << (snapshot.version.empty() ? "-" : snapshot.version)
                  << (current && *current == id ? "  (current)" : "") << "\n";
    }
    return 0;
}
