#pragma once

#include "common/app_config.hpp"
#include "restore/datastore_dispatcher.hpp"
#include "restore/restore_session.hpp"
#include "transport/remote_shell.hpp"
#include <memory>
#include <string>

// Executes one restore step against the target. Datastores missing from the
// snapshot are skipped, except the ones every snapshot must carry.
class DatastoreRoutines {
public:
    DatastoreRoutines(std::shared_ptr<RemoteShell> shell, const AppConfig& config);

    bool run(const DatastoreStep& step, const RestoreSession& session);

    // Runs the appliance's configuration apply so migrations see the restored
    // data.
    bool applyConfiguration(const RestoreSession& session);

    std::string getLastError() const { return lastError_; }

    static bool isRequired(Datastore datastore);

private:
    bool importSettings(const DatastoreStep& step, const RestoreSession& session);
    bool importDump(const DatastoreStep& step, const RestoreSession& session);
    bool rsyncPush(const DatastoreStep& step, const RestoreSession& session);
    bool tarballImport(const DatastoreStep& step, const RestoreSession& session);
    bool clusterFanOut(const DatastoreStep& step, const RestoreSession& session);
    bool clusterReindex(const DatastoreStep& step, const RestoreSession& session);

    bool streamInto(const RestoreSession& session, const std::string& tool,
                    const std::string& localPath);
    bool missing(const DatastoreStep& step, const std::string& path);

    std::shared_ptr<RemoteShell> shell_;
    AppConfig config_;
    std::string lastError_;
};
