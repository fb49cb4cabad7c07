#include "main/restore_main.hpp"
#include "backup/snapshot_store.hpp"
#include "common/command_runner.hpp"
#include "common/logger.hpp"
#include "restore/restore_cli.hpp"
#include "restore/restore_orchestrator.hpp"
#include "transport/remote_shell.hpp"
#include <iostream>
#include <memory>
#include <string>

int restoreMain(int argc, char* argv[], const AppConfig& config) {
    RestoreOptions options;
    bool help = false;
    std::string error;
    if (!RestoreCLI::parseArgs(argc, argv, options, help, error)) {
        std::cerr << "Error: " << error << std::endl;
        RestoreCLI::printUsage(std::cerr);
        return 1;
    }
    if (help) {
        RestoreCLI::printUsage(std::cout);
        return 0;
    }
    if (options.verbose) {
        Logger::setLogLevel(LogLevel::DEBUG);
    }

    auto runner = std::make_shared<ProcessRunner>();
    auto shell = std::make_shared<RemoteShell>(runner, config.ssh, config.rsyncChecksum);
    auto store = std::make_shared<SnapshotStore>(config.dataDir);

    RestoreOrchestrator orchestrator(shell, store, config);
    orchestrator.setConfirmCallback([](const RestoreSession& session) {
        return RestoreCLI::confirm(std::cin, std::cout, session);
    });

    if (orchestrator.run(options)) {
        return 0;
    }

    const RestoreSession& session = orchestrator.getSession();
    switch (orchestrator.getState()) {
        case RestoreState::Aborted:
            return kExitAborted;
        default:
            if (!session.failedStep.empty()) {
                std::cerr << "Error: restore step '" << session.failedStep << "' failed" << std::endl;
            } else {
                std::cerr << "Error: " << orchestrator.getLastError() << std::endl;
            }
            return 1;
    }
}
