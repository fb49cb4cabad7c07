#pragma once

#include "backup/snapshot_store.hpp"
#include "common/app_config.hpp"
#include "restore/datastore_dispatcher.hpp"
#include "restore/datastore_routines.hpp"
#include "restore/remote_status_reporter.hpp"
#include "restore/restore_session.hpp"
#include "transport/remote_shell.hpp"
#include <functional>
#include <memory>
#include <string>

// Returns true when the operator agrees to overwrite the target.
using ConfirmCallback = std::function<bool(const RestoreSession& session)>;

// Restores one snapshot onto one appliance:
//
//   Init -> Validating -> Restoring -> Complete
//              |  |           |
//              |  +-> Aborted +-> Failed
//              +-> Failed
//
// Nothing is written to the target before validation passes and the
// operator confirms. From `restoring` on, leaving the session any way other
// than through `complete` publishes `failed`.
class RestoreOrchestrator {
public:
    RestoreOrchestrator(std::shared_ptr<RemoteShell> shell,
                        std::shared_ptr<SnapshotStore> store,
                        const AppConfig& config);

    void setConfirmCallback(ConfirmCallback callback) { confirmCallback_ = callback; }

    // True only when the session reaches Complete. Throws InterruptedError
    // on a signal, after releasing scoped resources.
    bool run(const RestoreOptions& options);

    RestoreState getState() const { return session_.state; }
    const RestoreSession& getSession() const { return session_; }
    std::string getLastError() const { return lastError_; }

private:
    bool validate(const RestoreOptions& options);
    bool confirm(const RestoreOptions& options);
    bool restore();
    void transition(RestoreState state);
    bool fail(const std::string& error);

    std::shared_ptr<RemoteShell> shell_;
    std::shared_ptr<SnapshotStore> store_;
    AppConfig config_;
    DatastoreDispatcher dispatcher_;
    DatastoreRoutines routines_;
    RemoteStatusReporter reporter_;
    ConfirmCallback confirmCallback_;
    RestoreSession session_;
    std::string lastError_;
};
