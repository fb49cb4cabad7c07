#pragma once

#include "backup/snapshot.hpp"
#include "common/datastore.hpp"
#include "restore/restore_session.hpp"
#include <optional>
#include <string>
#include <vector>

enum class Topology {
    Standalone,
    Cluster
};

// Concrete restore routines. Which one a step uses is decided by the
// dispatch table, never by the routines themselves.
enum class Routine {
    ImportSettings,   // settings import plus license and CA certificates
    ImportDump,       // stream a dump file into the appliance's import tool
    RsyncPush,        // mirror a snapshot directory onto the appliance
    TarballImport,    // stream a tarball into the appliance's import tool
    ClusterFanOut,    // push to every cluster member holding the role
    ClusterReindex    // rebuild search indices from restored repositories
};

std::string routineName(Routine routine);

struct DatastoreStep {
    Datastore datastore;
    std::string name;
    Routine routine;
    std::string rationale;
};

class DatastoreDispatcher {
public:
    // Sets session.strategy from the tag recorded in the snapshot. Fails on
    // a missing or unknown tag.
    bool resolveStrategy(RestoreSession& session);

    // Table lookup keyed by (datastore, topology, strategy). Cluster sessions
    // only consult cluster rows. No row means the step does not apply.
    std::optional<Routine> routineFor(Datastore datastore, const RestoreSession& session) const;

    // Steps to run in order, ssh host keys excluded.
    std::vector<DatastoreStep> plan(const RestoreSession& session) const;

    // The ssh host key step, run after `complete` is published.
    std::optional<DatastoreStep> finalStep(const RestoreSession& session) const;

    static const std::vector<Datastore>& restoreOrder();

    std::string getLastError() const { return lastError_; }

private:
    std::optional<DatastoreStep> makeStep(Datastore datastore, const RestoreSession& session) const;

    std::string lastError_;
};
