#include "restore/restore_orchestrator.hpp"
#include "common/interrupt.hpp"
#include "common/logger.hpp"
#include "common/version.hpp"
#include "transport/target_inspector.hpp"

RestoreOrchestrator::RestoreOrchestrator(std::shared_ptr<RemoteShell> shell,
                                         std::shared_ptr<SnapshotStore> store,
                                         const AppConfig& config)
    : shell_(shell)
    , store_(store)
    , config_(config)
    , routines_(shell, config)
    , reporter_(shell, config.remote.statusPath) {
}

void RestoreOrchestrator::transition(RestoreState state) {
    Logger::debug("Restore state " + restoreStateToString(session_.state) + " -> " +
                  restoreStateToString(state));
    session_.state = state;
}

bool RestoreOrchestrator::fail(const std::string& error) {
    lastError_ = error;
    Logger::error(error);
    transition(RestoreState::Failed);
    return false;
}

bool RestoreOrchestrator::run(const RestoreOptions& options) {
    session_ = RestoreSession();
    lastError_.clear();

    try {
        transition(RestoreState::Validating);
        if (!validate(options)) {
            return false;
        }
        if (!confirm(options)) {
            return false;
        }
        return restore();
    } catch (const InterruptedError& e) {
        lastError_ = e.what();
        transition(RestoreState::Failed);
        throw;
    }
}

bool RestoreOrchestrator::validate(const RestoreOptions& options) {
    std::string error;
    if (!SshEndpoint::parse(options.host, shell_->getSettings(), session_.target, error)) {
        return fail(error);
    }

    TargetInspector inspector(shell_, config_.remote);
    TargetInfo info;
    if (!inspector.inspect(session_.target, info)) {
        return fail(inspector.getLastError());
    }
    session_.targetVersion = info.version;
    session_.isCluster = info.isCluster;
    session_.isConfigured = info.isConfigured;
    session_.inMaintenance = info.inMaintenance;
    session_.isReplicated = info.isReplicated;

    auto targetVersion = ApplianceVersion::parse(info.version);
    if (!targetVersion) {
        return fail("Unrecognised appliance version '" + info.version + "' on " +
                    session_.target.host);
    }
    if (*targetVersion < *ApplianceVersion::parse(config_.versions.supportedMin)) {
        return fail("Appliance version " + info.version + " on " + session_.target.host +
                    " is not supported; " + config_.versions.supportedMin + " or later is required");
    }

    if (!store_->resolve(options.snapshotId, session_.snapshot)) {
        return fail(store_->getLastError());
    }
    if (!dispatcher_.resolveStrategy(session_)) {
        return fail(dispatcher_.getLastError());
    }

    auto snapshotVersion = ApplianceVersion::parse(session_.snapshot.version);
    if (!snapshotVersion) {
        return fail("Snapshot " + session_.snapshot.id + " has no valid recorded version");
    }
    if (snapshotVersion->newerFeatureReleaseThan(*targetVersion)) {
        return fail("Snapshot " + session_.snapshot.id + " was taken from " +
                    session_.snapshot.version + ", which is newer than " + info.version +
                    " on " + session_.target.host);
    }

    if (session_.isCluster) {
        auto minimum = ApplianceVersion::parse(config_.versions.clusterMinSnapshot);
        if (*snapshotVersion < *minimum) {
            return fail("Version mismatch: snapshot " + session_.snapshot.id + " (" +
                        session_.snapshot.version + ") is older than " +
                        config_.versions.clusterMinSnapshot +
                        ", the oldest version that can be restored to a cluster");
        }
    } else if (session_.strategy == BackupStrategy::Cluster) {
        return fail("Snapshot " + session_.snapshot.id +
                    " was taken from a cluster and cannot be restored to standalone appliance " +
                    session_.target.host);
    }

    if (session_.isConfigured && !session_.isCluster && !session_.inMaintenance) {
        return fail(session_.target.host + " is configured but not in maintenance mode; "
                    "enable maintenance mode before restoring");
    }

    session_.restoreSettings = options.restoreSettings;
    if (!session_.isConfigured && !session_.restoreSettings) {
        if (*targetVersion < *ApplianceVersion::parse(config_.versions.legacySettings)) {
            return fail(session_.target.host + " is unconfigured and runs " + info.version +
                        "; rerun with -c to restore settings explicitly");
        }
        Logger::info(session_.target.host + " is unconfigured, restoring settings as well");
        session_.restoreSettings = true;
    }

    RemoteStatus previous = reporter_.read(session_.target);
    if (previous == RemoteStatus::Restoring || previous == RemoteStatus::Failed) {
        Logger::warning("Previous restore to " + session_.target.host + " did not complete (" +
                        remoteStatusToString(previous) + ")");
    }

    if (session_.isReplicated) {
        Logger::warning(session_.target.host + " is part of a replication pair; "
                        "replication will be interrupted by this restore");
    }

    Logger::info("Restoring snapshot " + session_.snapshot.id + " (" + session_.snapshot.version +
                 ", " + strategyToString(session_.strategy) + ") to " + session_.target.host +
                 " (" + info.version + (session_.isCluster ? ", cluster" : ", standalone") + ")");
    return true;
}

bool RestoreOrchestrator::confirm(const RestoreOptions& options) {
    if (!session_.isConfigured || options.force) {
        return true;
    }
    if (!confirmCallback_ || !confirmCallback_(session_)) {
        lastError_ = "Restore aborted by operator";
        Logger::info(lastError_);
        transition(RestoreState::Aborted);
        return false;
    }
    return true;
}

bool RestoreOrchestrator::restore() {
    transition(RestoreState::Restoring);
    reporter_.publish(session_.target, RemoteStatus::Restoring);
    FailureStatusGuard guard(reporter_, session_.target);

    for (const auto& step : dispatcher_.plan(session_)) {
        Interrupt::checkpoint();
        if (!routines_.run(step, session_)) {
            session_.failedStep = step.name;
            return fail("Restore step '" + step.name + "' failed: " + routines_.getLastError());
        }
    }

    reporter_.publish(session_.target, RemoteStatus::Complete);
    guard.dismiss();

    if (session_.isConfigured && !session_.isCluster) {
        Logger::info("Applying configuration on " + session_.target.host);
        if (!routines_.applyConfiguration(session_)) {
            Logger::warning("Configuration apply reported problems: " + routines_.getLastError());
        }
    }

    // Host keys go last: the new keys invalidate the connection used above
    auto hostKeys = dispatcher_.finalStep(session_);
    if (hostKeys) {
        Interrupt::checkpoint();
        if (!routines_.run(*hostKeys, session_)) {
            session_.failedStep = hostKeys->name;
            return fail("Restore step '" + hostKeys->name + "' failed after data was restored: " +
                        routines_.getLastError());
        }
    }

    transition(RestoreState::Complete);
    Logger::info("Restore of snapshot " + session_.snapshot.id + " to " + session_.target.host +
                 " complete");
    return true;
}
