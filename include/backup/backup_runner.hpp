#pragma once

#include "backup/snapshot_store.hpp"
#include "common/app_config.hpp"
#include "common/datastore.hpp"
#include "transport/remote_shell.hpp"
#include "transport/target_inspector.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

using BackupProgressCallback = std::function<void(const std::string& step, int progress)>;

// Captures one appliance into a new snapshot. Any failure discards the
// snapshot and leaves `current` where it was.
class BackupRunner {
public:
    BackupRunner(std::shared_ptr<RemoteShell> shell,
                 std::shared_ptr<SnapshotStore> store,
                 const AppConfig& config);

    bool run(const std::string& host, Snapshot& snapshot);

    void setProgressCallback(BackupProgressCallback callback) { progressCallback_ = callback; }
    std::string getLastError() const { return lastError_; }

    // Whether a datastore is captured at all with the given strategy.
    static bool captures(Datastore datastore, BackupStrategy strategy);

private:
    bool chooseStrategy(const TargetInfo& info, BackupStrategy& strategy);
    bool backupDatastore(const SshEndpoint& target, Datastore datastore,
                         BackupStrategy strategy, const Snapshot& snapshot);
    bool exportStream(const SshEndpoint& target, const std::string& tool,
                      const std::string& localPath, const std::string& name);
    void exportSettingsExtras(const SshEndpoint& target, const Snapshot& snapshot);
    bool pullDirectory(const SshEndpoint& target, Datastore datastore, const Snapshot& snapshot);
    bool pullFromCluster(const SshEndpoint& target, Datastore datastore, const Snapshot& snapshot);
    std::optional<std::string> linkBase(const std::string& entry) const;
    void reportProgress(const std::string& step, int progress);

    std::shared_ptr<RemoteShell> shell_;
    std::shared_ptr<SnapshotStore> store_;
    AppConfig config_;
    BackupProgressCallback progressCallback_;
    std::string lastError_;
};
