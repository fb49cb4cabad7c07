#pragma once

#include "common/app_config.hpp"
#include <string>
#include <vector>

// Independently restorable units of appliance state, in restore order.
enum class Datastore {
    Settings,
    Mysql,
    Redis,
    AuthorizedKeys,
    Repositories,
    Pages,
    Assets,
    Storage,
    Hookshot,
    GitHooks,
    SearchIndices,
    SshHostKeys
};

// Where a datastore lives in a snapshot and on the appliance.
struct DatastoreLayout {
    Datastore datastore;
    std::string name;         // step name used in logs and errors
    std::string entry;        // file or directory inside a snapshot
    bool directory;           // entry is a directory transferred with rsync
    std::string tarball;      // tarball-strategy archive, directories only
    std::string exportTool;   // streams the entry (or tarball) to stdout
    std::string importTool;   // reads the entry (or tarball) from stdin
    std::string clusterRole;  // members holding the data; empty when the entry host serves it
};

const DatastoreLayout& datastoreLayout(Datastore datastore);
const std::vector<Datastore>& allDatastores();
std::string datastoreName(Datastore datastore);

// Directory on the appliance that a directory datastore is synced with.
std::string remoteDirectory(Datastore datastore, const RemoteLayout& layout);

// Optional files captured and restored together with settings.json
struct SettingsExtra {
    std::string entry;
    std::string exportTool;
    std::string importTool;
};

const std::vector<SettingsExtra>& settingsExtras();
