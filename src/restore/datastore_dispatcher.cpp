#include "restore/datastore_dispatcher.hpp"
#include "common/logger.hpp"
#include <map>

namespace {

struct RoutineRow {
    Datastore datastore;
    Topology topology;
    std::optional<BackupStrategy> strategy;  // nullopt: any strategy
    Routine routine;
};

const std::vector<RoutineRow>& routineTable() {
    static const std::vector<RoutineRow> table = {
        // Cluster targets restore through dedicated paths whatever the snapshot recorded
        {Datastore::Settings,       Topology::Cluster, std::nullopt, Routine::ImportSettings},
        {Datastore::Mysql,          Topology::Cluster, std::nullopt, Routine::ImportDump},
        {Datastore::Redis,          Topology::Cluster, std::nullopt, Routine::ImportDump},
        {Datastore::AuthorizedKeys, Topology::Cluster, std::nullopt, Routine::ImportDump},
        {Datastore::Repositories,   Topology::Cluster, std::nullopt, Routine::ClusterFanOut},
        {Datastore::Pages,          Topology::Cluster, std::nullopt, Routine::ClusterFanOut},
        {Datastore::Storage,        Topology::Cluster, std::nullopt, Routine::ClusterFanOut},
        {Datastore::GitHooks,       Topology::Cluster, std::nullopt, Routine::ClusterFanOut},
        {Datastore::SearchIndices,  Topology::Cluster, std::nullopt, Routine::ClusterReindex},

        {Datastore::Settings,       Topology::Standalone, std::nullopt, Routine::ImportSettings},
        {Datastore::Mysql,          Topology::Standalone, std::nullopt, Routine::ImportDump},
        {Datastore::Redis,          Topology::Standalone, std::nullopt, Routine::ImportDump},
        {Datastore::AuthorizedKeys, Topology::Standalone, std::nullopt, Routine::ImportDump},
        {Datastore::Repositories,   Topology::Standalone, BackupStrategy::Tarball, Routine::TarballImport},
        {Datastore::Repositories,   Topology::Standalone, std::nullopt, Routine::RsyncPush},
        {Datastore::Pages,          Topology::Standalone, std::nullopt, Routine::RsyncPush},
        {Datastore::Assets,         Topology::Standalone, std::nullopt, Routine::RsyncPush},
        {Datastore::Storage,        Topology::Standalone, std::nullopt, Routine::RsyncPush},
        {Datastore::Hookshot,       Topology::Standalone, std::nullopt, Routine::RsyncPush},
        {Datastore::GitHooks,       Topology::Standalone, std::nullopt, Routine::RsyncPush},
        {Datastore::SearchIndices,  Topology::Standalone, BackupStrategy::Tarball, Routine::TarballImport},
        {Datastore::SearchIndices,  Topology::Standalone, std::nullopt, Routine::RsyncPush},
        {Datastore::SshHostKeys,    Topology::Standalone, std::nullopt, Routine::ImportDump},
    };
    return table;
}

const std::map<Datastore, std::string>& rationales() {
    static const std::map<Datastore, std::string> table = {
        {Datastore::Settings, "configuration and license before any data"},
        {Datastore::Mysql, "metadata database first, other data references it"},
        {Datastore::Redis, "after the metadata it caches"},
        {Datastore::AuthorizedKeys, "credentials before repository access"},
        {Datastore::Repositories, "repository data before derived indices"},
        {Datastore::Pages, "after repositories they are built from"},
        {Datastore::Assets, "per-appliance blob data"},
        {Datastore::Storage, "blob data referenced by the database"},
        {Datastore::Hookshot, "webhook delivery state"},
        {Datastore::GitHooks, "shared hook configuration"},
        {Datastore::SearchIndices, "derived from repository data, after it"},
        {Datastore::SshHostKeys, "last, changing keys breaks the control channel"},
    };
    return table;
}

} // namespace

std::string routineName(Routine routine) {
    switch (routine) {
        case Routine::ImportSettings: return "import-settings";
        case Routine::ImportDump:     return "import-dump";
        case Routine::RsyncPush:      return "rsync-push";
        case Routine::TarballImport:  return "tarball-import";
        case Routine::ClusterFanOut:  return "cluster-fan-out";
        case Routine::ClusterReindex: return "cluster-reindex";
    }
    return "unknown";
}

const std::vector<Datastore>& DatastoreDispatcher::restoreOrder() {
    return allDatastores();
}

bool DatastoreDispatcher::resolveStrategy(RestoreSession& session) {
    if (session.snapshot.strategy.empty()) {
        lastError_ = "Snapshot " + session.snapshot.id + " has no recorded backup strategy";
        return false;
    }

    auto strategy = parseStrategy(session.snapshot.strategy);
    if (!strategy) {
        lastError_ = "Snapshot " + session.snapshot.id + " has unknown backup strategy '" +
                     session.snapshot.strategy + "'";
        return false;
    }

    session.strategy = *strategy;
    return true;
}

std::optional<Routine> DatastoreDispatcher::routineFor(Datastore datastore,
                                                       const RestoreSession& session) const {
    Topology topology = session.isCluster ? Topology::Cluster : Topology::Standalone;

    const RoutineRow* fallback = nullptr;
    for (const auto& row : routineTable()) {
        if (row.datastore != datastore || row.topology != topology) {
            continue;
        }
        if (topology == Topology::Cluster || row.strategy == session.strategy) {
            return row.routine;
        }
        if (!row.strategy && !fallback) {
            fallback = &row;
        }
    }

    if (fallback) {
        return fallback->routine;
    }
    return std::nullopt;
}

std::optional<DatastoreStep> DatastoreDispatcher::makeStep(Datastore datastore,
                                                           const RestoreSession& session) const {
    auto routine = routineFor(datastore, session);
    if (!routine) {
        return std::nullopt;
    }

    DatastoreStep step;
    step.datastore = datastore;
    step.name = datastoreName(datastore);
    step.routine = *routine;
    step.rationale = rationales().at(datastore);
    return step;
}

std::vector<DatastoreStep> DatastoreDispatcher::plan(const RestoreSession& session) const {
    std::vector<DatastoreStep> steps;
    for (Datastore datastore : restoreOrder()) {
        if (datastore == Datastore::SshHostKeys) {
            continue;
        }
        if (datastore == Datastore::Settings && !session.restoreSettings) {
            continue;
        }

        auto step = makeStep(datastore, session);
        if (!step) {
            Logger::debug("Step " + datastoreName(datastore) + " does not apply to " +
                          (session.isCluster ? "cluster" : "standalone") + " targets");
            continue;
        }
        steps.push_back(*step);
    }
    return steps;
}

std::optional<DatastoreStep> DatastoreDispatcher::finalStep(const RestoreSession& session) const {
    return makeStep(Datastore::SshHostKeys, session);
}
