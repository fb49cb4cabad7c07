#pragma once

#include "common/backup_status.hpp"
#include "transport/remote_shell.hpp"
#include <memory>
#include <string>

// Publishes the restore status to a well-known file on the target so other
// processes can tell a half-restored appliance apart.
class RemoteStatusReporter {
public:
    RemoteStatusReporter(std::shared_ptr<RemoteShell> shell, const std::string& statusPath);

    // Best effort: a failed write is logged and reported through the return
    // value only. Interrupts still propagate.
    bool publish(const SshEndpoint& target, RemoteStatus status);

    // Unknown when the file is missing, unreadable or holds another value.
    RemoteStatus read(const SshEndpoint& target);

private:
    std::shared_ptr<RemoteShell> shell_;
    std::string statusPath_;
};

// Publishes `failed` when the session leaves scope without dismiss().
class FailureStatusGuard {
public:
    FailureStatusGuard(RemoteStatusReporter& reporter, const SshEndpoint& target);
    ~FailureStatusGuard();

    FailureStatusGuard(const FailureStatusGuard&) = delete;
    FailureStatusGuard& operator=(const FailureStatusGuard&) = delete;

    void dismiss() { dismissed_ = true; }

private:
    RemoteStatusReporter& reporter_;
    SshEndpoint target_;
    bool dismissed_;
};
