#pragma once

#include "backup/snapshot.hpp"
#include "common/backup_status.hpp"
#include "transport/remote_shell.hpp"
#include <string>

struct RestoreOptions {
    std::string host;
    std::string snapshotId;      // empty: current
    bool force{false};           // -f, skip the confirmation prompt
    bool restoreSettings{false}; // -c
    bool verbose{false};
};

// Everything decided about one restore before the first destructive step.
// Flags and strategy are fixed once validation is over.
struct RestoreSession {
    SshEndpoint target;
    Snapshot snapshot;
    std::string targetVersion;
    BackupStrategy strategy{BackupStrategy::Rsync};

    bool isCluster{false};
    bool isConfigured{false};
    bool isReplicated{false};
    bool inMaintenance{false};
    bool restoreSettings{false};

    RestoreState state{RestoreState::Init};
    std::string failedStep;
};
