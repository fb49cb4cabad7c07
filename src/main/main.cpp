#include "main/backup_main.hpp"
#include "main/restore_main.hpp"
#include "common/app_config.hpp"
#include "common/interrupt.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

namespace {

const char* kVersion = "1.0.0";
constexpr int kExitInterrupted = 130;

void printUsage() {
    std::cout << "Usage: appliance-backup [--config <path>] <command> [options]\n"
              << "Commands:\n"
              << "  backup    - Take a snapshot of an appliance\n"
              << "  restore   - Restore a snapshot onto an appliance\n"
              << "  list      - List committed snapshots\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>  Configuration file (default: $APPLIANCE_BACKUP_CONFIG,\n"
              << "                   then /etc/appliance-backup/backup.json)\n"
              << "  -h, --help       Show this help message\n"
              << "  --version        Show version information\n"
              << "\n"
              << "Run 'appliance-backup <command> --help' for command options.\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configOverride;
    int first = 1;

    for (; first < argc; first++) {
        std::string arg = argv[first];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "--version") {
            std::cout << "appliance-backup version " << kVersion << "\n";
            return 0;
        } else if (arg == "--config") {
            if (first + 1 >= argc) {
                std::cerr << "Error: --config requires a path" << std::endl;
                return 1;
            }
            configOverride = argv[++first];
        } else {
            break;
        }
    }

    if (first >= argc) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return 1;
    }

    std::string command = argv[first];
    if (command != "backup" && command != "restore" && command != "list") {
        std::cerr << "Error: Unknown command: " << command << std::endl;
        printUsage();
        return 1;
    }

    AppConfig config;
    try {
        config = AppConfig::load(AppConfig::resolvePath(configOverride), !configOverride.empty());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!Logger::initialize(config.logPath, LogLevel::INFO)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }
    Interrupt::install();

    int status = 1;
    try {
        if (command == "backup") {
            status = backupMain(argc - first, argv + first, config);
        } else if (command == "restore") {
            status = restoreMain(argc - first, argv + first, config);
        } else {
            status = listMain(argc - first, argv + first, config);
        }
    } catch (const InterruptedError& e) {
        Logger::error(std::string(e.what()) + ", stopped");
        status = kExitInterrupted;
    } catch (const std::exception& e) {
        Logger::fatal("Error in main: " + std::string(e.what()));
        status = 1;
    }

    Logger::shutdown();
    return status;
}
