#include "restore/remote_status_reporter.hpp"
#include "common/interrupt.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

RemoteStatusReporter::RemoteStatusReporter(std::shared_ptr<RemoteShell> shell,
                                           const std::string& statusPath)
    : shell_(shell)
    , statusPath_(statusPath) {
}

bool RemoteStatusReporter::publish(const SshEndpoint& target, RemoteStatus status) {
    std::string value = remoteStatusToString(status);
    std::string command = "echo " + value + " | sudo tee " + utils::shellQuote(statusPath_) +
                          " >/dev/null";

    CommandResult result = shell_->exec(target, command);
    if (!result.ok()) {
        Logger::warning("Failed to publish restore status '" + value + "' to " + target.host +
                        ":" + statusPath_ + " (exit status " + std::to_string(result.exitCode) + ")");
        return false;
    }

    Logger::debug("Published restore status '" + value + "' to " + target.host);
    return true;
}

RemoteStatus RemoteStatusReporter::read(const SshEndpoint& target) {
    CommandResult result = shell_->exec(target, "cat " + utils::shellQuote(statusPath_));
    if (!result.ok()) {
        return RemoteStatus::Unknown;
    }
    return parseRemoteStatus(utils::trim(result.output));
}

FailureStatusGuard::FailureStatusGuard(RemoteStatusReporter& reporter, const SshEndpoint& target)
    : reporter_(reporter)
    , target_(target)
    , dismissed_(false) {
}

FailureStatusGuard::~FailureStatusGuard() {
    if (dismissed_) {
        return;
    }
    // Hold back an interrupt that is already unwinding the session so the
    // publish gets one attempt. A further signal can still cut it short and
    // leave `restoring` behind on the target.
    int pending = Interrupt::pendingSignal();
    Interrupt::reset();
    try {
        reporter_.publish(target_, RemoteStatus::Failed);
    } catch (const InterruptedError&) {
        Logger::error("Interrupted while publishing failed status to " + target_.host +
                      "; the target may still report 'restoring'");
    } catch (const std::exception& e) {
        Logger::error(std::string("Failed to publish failed status: ") + e.what());
    }
    if (pending != 0 && !Interrupt::requested()) {
        Interrupt::raise(pending);
    }
}
