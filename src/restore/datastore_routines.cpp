#include "restore/datastore_routines.hpp"
#include "common/logger.hpp"
#include "transport/topology_resolver.hpp"
#include "transport/tunnel_transport.hpp"
#include <filesystem>

namespace fs = std::filesystem;

DatastoreRoutines::DatastoreRoutines(std::shared_ptr<RemoteShell> shell, const AppConfig& config)
    : shell_(shell)
    , config_(config) {
}

bool DatastoreRoutines::isRequired(Datastore datastore) {
    return datastore == Datastore::Mysql || datastore == Datastore::Repositories;
}

bool DatastoreRoutines::run(const DatastoreStep& step, const RestoreSession& session) {
    lastError_.clear();
    Logger::info("Restoring " + step.name + " (" + routineName(step.routine) + ")");

    switch (step.routine) {
        case Routine::ImportSettings: return importSettings(step, session);
        case Routine::ImportDump:     return importDump(step, session);
        case Routine::RsyncPush:      return rsyncPush(step, session);
        case Routine::TarballImport:  return tarballImport(step, session);
        case Routine::ClusterFanOut:  return clusterFanOut(step, session);
        case Routine::ClusterReindex: return clusterReindex(step, session);
    }

    lastError_ = "No routine for " + step.name;
    return false;
}

// Returns true when the step should be skipped, false when the missing data
// is an error (lastError_ set).
bool DatastoreRoutines::missing(const DatastoreStep& step, const std::string& path) {
    if (isRequired(step.datastore)) {
        lastError_ = "Snapshot has no " + step.name + " data (" + path + ")";
        return false;
    }
    Logger::info("Snapshot has no " + step.name + " data, skipping");
    return true;
}

bool DatastoreRoutines::streamInto(const RestoreSession& session, const std::string& tool,
                                   const std::string& localPath) {
    CommandResult result = shell_->exec(session.target, tool, localPath);
    if (!result.ok()) {
        lastError_ = tool + " on " + session.target.host + " exited with status " +
                     std::to_string(result.exitCode);
        return false;
    }
    return true;
}

bool DatastoreRoutines::importDump(const DatastoreStep& step, const RestoreSession& session) {
    const DatastoreLayout& layout = datastoreLayout(step.datastore);
    fs::path file = fs::path(session.snapshot.path) / layout.entry;
    if (!fs::exists(file)) {
        return missing(step, file.string());
    }
    return streamInto(session, layout.importTool, file.string());
}

bool DatastoreRoutines::importSettings(const DatastoreStep& step, const RestoreSession& session) {
    const DatastoreLayout& layout = datastoreLayout(step.datastore);
    fs::path file = fs::path(session.snapshot.path) / layout.entry;
    if (!fs::exists(file)) {
        lastError_ = "Settings restore requested but snapshot " + session.snapshot.id +
                     " has no " + layout.entry;
        return false;
    }
    if (!streamInto(session, layout.importTool, file.string())) {
        return false;
    }

    for (const auto& extra : settingsExtras()) {
        fs::path path = fs::path(session.snapshot.path) / extra.entry;
        if (!fs::exists(path)) {
            Logger::debug("Snapshot has no " + extra.entry);
            continue;
        }
        if (!streamInto(session, extra.importTool, path.string())) {
            return false;
        }
    }
    return true;
}

bool DatastoreRoutines::rsyncPush(const DatastoreStep& step, const RestoreSession& session) {
    const DatastoreLayout& layout = datastoreLayout(step.datastore);
    fs::path local = fs::path(session.snapshot.path) / layout.entry;
    if (!fs::is_directory(local)) {
        return missing(step, local.string());
    }

    TransferSpec spec;
    spec.direction = TransferDirection::Push;
    spec.localPath = local.string();
    spec.remotePath = remoteDirectory(step.datastore, config_.remote);
    spec.deleteExtraneous = true;

    CommandResult result = shell_->transfer(session.target, spec);
    if (!result.ok()) {
        lastError_ = "rsync to " + session.target.host + ":" + spec.remotePath +
                     " exited with status " + std::to_string(result.exitCode);
        return false;
    }
    return true;
}

bool DatastoreRoutines::tarballImport(const DatastoreStep& step, const RestoreSession& session) {
    const DatastoreLayout& layout = datastoreLayout(step.datastore);
    fs::path tarball = fs::path(session.snapshot.path) / layout.tarball;
    if (!fs::exists(tarball)) {
        return missing(step, tarball.string());
    }
    return streamInto(session, layout.importTool, tarball.string());
}

bool DatastoreRoutines::clusterFanOut(const DatastoreStep& step, const RestoreSession& session) {
    const DatastoreLayout& layout = datastoreLayout(step.datastore);
    fs::path local = fs::path(session.snapshot.path) / layout.entry;
    fs::path tarball = layout.tarball.empty() ? fs::path()
                                              : fs::path(session.snapshot.path) / layout.tarball;

    // Snapshots taken from a standalone appliance may carry a tarball instead
    bool useDirectory = fs::is_directory(local);
    if (!useDirectory && (tarball.empty() || !fs::exists(tarball))) {
        return missing(step, local.string());
    }

    TopologyResolver resolver(shell_, session.target, config_.ssh.memberPort);
    std::vector<Node> members = resolver.membersWithRole(layout.clusterRole);
    if (members.empty()) {
        Logger::info("No online " + layout.clusterRole + " members, nothing to restore for " +
                     step.name);
        return true;
    }

    std::string remote = remoteDirectory(step.datastore, config_.remote);
    TunnelTransport transport(shell_, config_);
    bool ok = transport.withTunnel(session.target, members, [&](const TunnelConfig& tunnel) {
        return transport.fanOut(members, [&](const Node& member) {
            if (useDirectory) {
                return transport.transferOverTunnel(tunnel, member, TransferDirection::Push,
                                                    local.string(), remote);
            }
            CommandResult result = transport.runOverTunnel(tunnel, member, layout.importTool,
                                                           tarball.string());
            if (!result.ok()) {
                Logger::error(layout.importTool + " on " + member.hostname +
                              " exited with status " + std::to_string(result.exitCode));
            }
            return result.ok();
        });
    });

    if (!ok) {
        lastError_ = transport.getLastError();
    }
    return ok;
}

bool DatastoreRoutines::clusterReindex(const DatastoreStep& step, const RestoreSession& session) {
    CommandResult result = shell_->exec(session.target, "appliance-es-reindex");
    if (!result.ok()) {
        lastError_ = "appliance-es-reindex on " + session.target.host + " exited with status " +
                     std::to_string(result.exitCode);
        return false;
    }
    Logger::debug("Queued reindex of " + step.name);
    return true;
}

bool DatastoreRoutines::applyConfiguration(const RestoreSession& session) {
    CommandResult result = shell_->exec(session.target, "appliance-config-apply");
    if (!result.ok()) {
        lastError_ = "appliance-config-apply on " + session.target.host + " exited with status " +
                     std::to_string(result.exitCode);
        return false;
    }
    return true;
}
