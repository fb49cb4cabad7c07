#include "backup/backup_runner.hpp"
#include "common/interrupt.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "common/version.hpp"
#include "transport/topology_resolver.hpp"
#include "transport/tunnel_transport.hpp"
#include <filesystem>

namespace fs = std::filesystem;

BackupRunner::BackupRunner(std::shared_ptr<RemoteShell> shell,
                           std::shared_ptr<SnapshotStore> store,
                           const AppConfig& config)
    : shell_(shell)
    , store_(store)
    , config_(config) {
}

bool BackupRunner::captures(Datastore datastore, BackupStrategy strategy) {
    bool cluster = strategy == BackupStrategy::Cluster;
    switch (datastore) {
        case Datastore::Assets:
        case Datastore::Hookshot:
        case Datastore::SearchIndices:  // rebuilt from repositories on restore
        case Datastore::SshHostKeys:
            return !cluster;
        default:
            return true;
    }
}

bool BackupRunner::run(const std::string& host, Snapshot& snapshot) {
    SshEndpoint target;
    std::string error;
    if (!SshEndpoint::parse(host, shell_->getSettings(), target, error)) {
        lastError_ = error;
        return false;
    }

    TargetInspector inspector(shell_, config_.remote);
    TargetInfo info;
    if (!inspector.inspect(target, info)) {
        lastError_ = inspector.getLastError();
        return false;
    }

    auto version = ApplianceVersion::parse(info.version);
    auto supported = ApplianceVersion::parse(config_.versions.supportedMin);
    if (!version) {
        lastError_ = "Unrecognised appliance version '" + info.version + "' on " + target.host;
        return false;
    }
    if (*version < *supported) {
        lastError_ = "Appliance version " + info.version + " on " + target.host +
                     " is older than the minimum supported " + config_.versions.supportedMin;
        return false;
    }

    BackupStrategy strategy;
    if (!chooseStrategy(info, strategy)) {
        return false;
    }

    if (!store_->begin(snapshot)) {
        lastError_ = store_->getLastError();
        return false;
    }
    PendingSnapshot pending(*store_, snapshot);

    if (!store_->recordMetadata(snapshot, strategy, info.version)) {
        lastError_ = store_->getLastError();
        return false;
    }

    Logger::info("Backing up " + target.host + " (" + info.version + ") into snapshot " +
                 snapshot.id + " using " + strategyToString(strategy) + " strategy");

    const auto& datastores = allDatastores();
    size_t done = 0;
    for (Datastore datastore : datastores) {
        Interrupt::checkpoint();
        const std::string& name = datastoreName(datastore);
        if (captures(datastore, strategy)) {
            reportProgress(name, static_cast<int>(done * 100 / datastores.size()));
            if (!backupDatastore(target, datastore, strategy, snapshot)) {
                lastError_ = "Backup of " + name + " failed: " + lastError_;
                return false;
            }
        }
        ++done;
    }

    size_t linked = 0;
    if (!store_->linkDuplicates(snapshot, linked)) {
        lastError_ = store_->getLastError();
        return false;
    }

    if (!pending.commit()) {
        lastError_ = store_->getLastError();
        return false;
    }
    reportProgress("complete", 100);

    uintmax_t unique = 0;
    if (store_->uniqueBytes(snapshot, unique)) {
        Logger::info("Snapshot " + snapshot.id + " added " + std::to_string(unique) + " byte(s)");
    }

    std::vector<std::string> removed;
    if (!store_->prune(static_cast<size_t>(config_.numSnapshots), removed)) {
        Logger::warning("Pruning old snapshots failed: " + store_->getLastError());
    }
    return true;
}

bool BackupRunner::chooseStrategy(const TargetInfo& info, BackupStrategy& strategy) {
    if (info.isCluster) {
        if (!config_.backupStrategy.empty() && config_.backupStrategy != "cluster") {
            Logger::warning("Ignoring backup_strategy '" + config_.backupStrategy +
                            "': cluster targets are always backed up with the cluster strategy");
        }
        strategy = BackupStrategy::Cluster;
        return true;
    }

    if (config_.backupStrategy.empty()) {
        strategy = BackupStrategy::Rsync;
        return true;
    }

    auto configured = parseStrategy(config_.backupStrategy);
    if (!configured || *configured == BackupStrategy::Cluster) {
        lastError_ = "backup_strategy '" + config_.backupStrategy +
                     "' cannot be used for a standalone appliance";
        return false;
    }
    strategy = *configured;
    return true;
}

bool BackupRunner::backupDatastore(const SshEndpoint& target, Datastore datastore,
                                   BackupStrategy strategy, const Snapshot& snapshot) {
    const DatastoreLayout& layout = datastoreLayout(datastore);
    fs::path root = snapshot.path;

    if (!layout.directory) {
        if (!exportStream(target, layout.exportTool, (root / layout.entry).string(), layout.name)) {
            return false;
        }
        if (datastore == Datastore::Settings) {
            exportSettingsExtras(target, snapshot);
        }
        return true;
    }

    if (strategy == BackupStrategy::Cluster && !layout.clusterRole.empty()) {
        return pullFromCluster(target, datastore, snapshot);
    }
    if (strategy == BackupStrategy::Tarball && !layout.tarball.empty()) {
        return exportStream(target, layout.exportTool, (root / layout.tarball).string(), layout.name);
    }
    return pullDirectory(target, datastore, snapshot);
}

bool BackupRunner::exportStream(const SshEndpoint& target, const std::string& tool,
                                const std::string& localPath, const std::string& name) {
    Logger::debug("Exporting " + name + " to " + localPath);
    CommandResult result = shell_->exec(target, tool, "", localPath);
    if (!result.ok()) {
        lastError_ = tool + " on " + target.host + " exited with status " +
                     std::to_string(result.exitCode);
        return false;
    }
    return true;
}

void BackupRunner::exportSettingsExtras(const SshEndpoint& target, const Snapshot& snapshot) {
    for (const auto& extra : settingsExtras()) {
        fs::path path = fs::path(snapshot.path) / extra.entry;
        CommandResult result = shell_->exec(target, extra.exportTool, "", path.string());
        if (!result.ok()) {
            Logger::warning("Skipping " + extra.entry + ": " + extra.exportTool +
                            " exited with status " + std::to_string(result.exitCode));
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
}

std::optional<std::string> BackupRunner::linkBase(const std::string& entry) const {
    // `current` still names the previous snapshot until this one commits
    std::optional<std::string> dedupBase = store_->dedupBase();
    if (!dedupBase) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::path base = fs::absolute(fs::path(*dedupBase) / entry, ec);
    if (ec || !fs::is_directory(base, ec)) {
        return std::nullopt;
    }
    return base.string();
}

bool BackupRunner::pullDirectory(const SshEndpoint& target, Datastore datastore,
                                 const Snapshot& snapshot) {
    const DatastoreLayout& layout = datastoreLayout(datastore);
    std::string remote = remoteDirectory(datastore, config_.remote);

    if (datastore != Datastore::Repositories) {
        bool exists = false;
        if (!shell_->pathExists(target, remote, exists)) {
            lastError_ = shell_->getLastError();
            return false;
        }
        if (!exists) {
            Logger::info("No " + layout.name + " data on " + target.host + ", skipping");
            return true;
        }
    }

    fs::path local = fs::path(snapshot.path) / layout.entry;
    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        lastError_ = "Failed to create " + local.string() + ": " + ec.message();
        return false;
    }

    TransferSpec spec;
    spec.direction = TransferDirection::Pull;
    spec.localPath = local.string();
    spec.remotePath = remote;
    spec.dedupBase = linkBase(layout.entry);

    CommandResult result = shell_->transfer(target, spec);
    if (!result.ok()) {
        lastError_ = "rsync from " + target.host + ":" + remote + " exited with status " +
                     std::to_string(result.exitCode);
        return false;
    }
    return true;
}

bool BackupRunner::pullFromCluster(const SshEndpoint& target, Datastore datastore,
                                   const Snapshot& snapshot) {
    const DatastoreLayout& layout = datastoreLayout(datastore);
    std::string remote = remoteDirectory(datastore, config_.remote);

    TopologyResolver resolver(shell_, target, config_.ssh.memberPort);
    std::vector<Node> members = resolver.membersWithRole(layout.clusterRole);
    if (members.empty()) {
        Logger::info("No online " + layout.clusterRole + " members, skipping " + layout.name);
        return true;
    }

    fs::path local = fs::path(snapshot.path) / layout.entry;
    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        lastError_ = "Failed to create " + local.string() + ": " + ec.message();
        return false;
    }
    std::optional<std::string> base = linkBase(layout.entry);

    TunnelTransport transport(shell_, config_);
    bool ok = transport.withTunnel(target, members, [&](const TunnelConfig& tunnel) {
        auto pull = [&](const Node& member) {
            return transport.transferOverTunnel(tunnel, member, TransferDirection::Pull,
                                                local.string(), remote, base);
        };

        // Hook configuration is identical on every git member
        if (datastore == Datastore::GitHooks) {
            auto hasHooks = [&](const Node& member) {
                return transport.runOverTunnel(tunnel, member,
                                               "test -d " + utils::shellQuote(remote)).ok();
            };
            return transport.firstSuccess(members, hasHooks, pull);
        }
        return transport.fanOut(members, pull);
    });

    if (!ok) {
        lastError_ = transport.getLastError();
    }
    return ok;
}

void BackupRunner::reportProgress(const std::string& step, int progress) {
    Logger::debug("Backup progress: " + step + " (" + std::to_string(progress) + "%)");
    if (progressCallback_) {
        progressCallback_(step, progress);
    }
}
