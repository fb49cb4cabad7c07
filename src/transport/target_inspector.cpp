#include "transport/target_inspector.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

TargetInspector::TargetInspector(std::shared_ptr<RemoteShell> shell, const RemoteLayout& layout)
    : shell_(shell)
    , layout_(layout) {
}

bool TargetInspector::inspect(const SshEndpoint& target, TargetInfo& info) {
    CommandResult release = shell_->exec(target, "cat " + utils::shellQuote(layout_.releaseFile));
    if (release.exitCode == RemoteShell::kSshConnectionFailure) {
        lastError_ = "Cannot connect to " + target.toString();
        return false;
    }
    if (!release.ok()) {
        lastError_ = "Cannot read " + layout_.releaseFile + " on " + target.host +
                     "; is this an appliance?";
        return false;
    }

    info.version = utils::trim(release.output);
    if (info.version.empty()) {
        lastError_ = layout_.releaseFile + " on " + target.host + " is empty";
        return false;
    }

    if (!probe(target, layout_.configuredFile, info.isConfigured) ||
        !probe(target, layout_.clusterFile, info.isCluster) ||
        !probe(target, layout_.maintenanceFile, info.inMaintenance) ||
        !probe(target, layout_.replicationFile, info.isReplicated)) {
        return false;
    }

    Logger::debug("Target " + target.host + ": version " + info.version +
                  (info.isConfigured ? ", configured" : ", unconfigured") +
                  (info.isCluster ? ", cluster" : ", standalone") +
                  (info.inMaintenance ? ", maintenance mode" : "") +
                  (info.isReplicated ? ", replicated" : ""));
    return true;
}

bool TargetInspector::probe(const SshEndpoint& target, const std::string& path, bool& flag) {
    if (!shell_->pathExists(target, path, flag)) {
        lastError_ = shell_->getLastError();
        return false;
    }
    return true;
}
