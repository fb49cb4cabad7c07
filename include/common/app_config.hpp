#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// ssh settings shared by every remote call
struct SshSettings {
    std::string user{"admin"};
    int port{122};
    int memberPort{122};                 // port of internal cluster members
    std::vector<std::string> extraOptions;
};

// Well-known paths on the appliance
struct RemoteLayout {
    std::string dataDir{"/data/user"};
    std::string repositoriesDir{"/data/repositories"};
    std::string statusPath{"/data/user/common/restore-status"};
    std::string releaseFile{"/etc/appliance-release"};
    std::string configuredFile{"/data/user/common/configured"};
    std::string clusterFile{"/etc/appliance/cluster"};
    std::string maintenanceFile{"/data/user/common/maintenance"};
    std::string replicationFile{"/data/user/common/replication"};
};

struct VersionRequirements {
    std::string supportedMin{"2.11.0"};
    std::string clusterMinSnapshot{"2.5.0"};
    std::string legacySettings{"2.0.0"};
};

struct AppConfig {
    std::string hostname;
    std::string dataDir{"data"};
    int numSnapshots{10};
    std::string backupStrategy;          // empty: chosen from the target
    bool rsyncChecksum{false};
    bool parallelTransfers{false};
    std::string tunnelDir;               // empty: system temp directory
    std::string logPath;

    SshSettings ssh;
    RemoteLayout remote;
    VersionRequirements versions;

    // Both throw std::runtime_error on malformed input.
    static AppConfig fromJson(const nlohmann::json& json);
    static AppConfig load(const std::string& path, bool required = false);

    // --config, then $APPLIANCE_BACKUP_CONFIG, then the system default.
    static std::string resolvePath(const std::string& override);
};
