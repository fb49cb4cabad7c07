#include "common/datastore.hpp"
#include <stdexcept>

namespace {

const std::vector<DatastoreLayout>& layouts() {
    static const std::vector<DatastoreLayout> table = {
        {Datastore::Settings, "settings", "settings.json", false, "",
         "appliance-export-settings", "appliance-import-settings", ""},
        {Datastore::Mysql, "mysql", "mysql.sql.gz", false, "",
         "appliance-export-mysql", "appliance-import-mysql", ""},
        {Datastore::Redis, "redis", "redis.rdb", false, "",
         "appliance-export-redis", "appliance-import-redis", ""},
        {Datastore::AuthorizedKeys, "authorized-keys", "authorized-keys.json", false, "",
         "appliance-export-authorized-keys", "appliance-import-authorized-keys", ""},
        {Datastore::Repositories, "repositories", "repositories", true, "repositories.tar",
         "appliance-export-repositories-tarball", "appliance-import-repositories-tarball", "git"},
        {Datastore::Pages, "pages", "pages", true, "", "", "", "pages"},
        {Datastore::Assets, "assets", "assets", true, "", "", "", ""},
        {Datastore::Storage, "storage", "storage", true, "", "", "", "storage"},
        {Datastore::Hookshot, "hookshot", "hookshot", true, "", "", "", ""},
        {Datastore::GitHooks, "git-hooks", "git-hooks", true, "", "", "", "git"},
        {Datastore::SearchIndices, "search-indices", "elasticsearch", true, "elasticsearch.tar",
         "appliance-export-es-tarball", "appliance-import-es-tarball", ""},
        {Datastore::SshHostKeys, "ssh-host-keys", "ssh-host-keys.tar", false, "",
         "appliance-export-ssh-host-keys", "appliance-import-ssh-host-keys", ""},
    };
    return table;
}

} // namespace

const DatastoreLayout& datastoreLayout(Datastore datastore) {
    for (const auto& layout : layouts()) {
        if (layout.datastore == datastore) {
            return layout;
        }
    }
    throw std::logic_error("No layout for datastore");
}

const std::vector<Datastore>& allDatastores() {
    static const std::vector<Datastore> order = [] {
        std::vector<Datastore> result;
        for (const auto& layout : layouts()) {
            result.push_back(layout.datastore);
        }
        return result;
    }();
    return order;
}

std::string datastoreName(Datastore datastore) {
    return datastoreLayout(datastore).name;
}

std::string remoteDirectory(Datastore datastore, const RemoteLayout& layout) {
    if (datastore == Datastore::Repositories) {
        return layout.repositoriesDir;
    }
    return layout.dataDir + "/" + datastoreLayout(datastore).entry;
}

const std::vector<SettingsExtra>& settingsExtras() {
    static const std::vector<SettingsExtra> extras = {
        {"license", "appliance-export-license", "appliance-import-license"},
        {"ssl-ca-certificates.tar", "appliance-export-ssl-ca-certificates",
         "appliance-import-ssl-ca-certificates"},
    };
    return extras;
}
