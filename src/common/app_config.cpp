#include "common/app_config.hpp"
#include "common/logger.hpp"
#include "common/version.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const char* kDefaultConfigPath = "/etc/appliance-backup/backup.json";

template <typename T>
void readValue(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

const json& section(const json& object, const char* key) {
    static const json empty = json::object();
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw std::runtime_error(std::string("Configuration section '") + key + "' must be an object");
    }
    return *it;
}

void requireVersion(const std::string& key, const std::string& value) {
    if (!ApplianceVersion::parse(value)) {
        throw std::runtime_error("Invalid version for '" + key + "': " + value);
    }
}

void requirePort(const std::string& key, int value) {
    if (value < 1 || value > 65535) {
        throw std::runtime_error("Invalid port for '" + key + "': " + std::to_string(value));
    }
}

} // namespace

AppConfig AppConfig::fromJson(const json& root) {
    if (!root.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    AppConfig config;
    readValue(root, "hostname", config.hostname);
    readValue(root, "data_dir", config.dataDir);
    readValue(root, "num_snapshots", config.numSnapshots);
    readValue(root, "backup_strategy", config.backupStrategy);
    readValue(root, "parallel_transfers", config.parallelTransfers);
    readValue(root, "tunnel_dir", config.tunnelDir);
    readValue(root, "log_path", config.logPath);

    const json& ssh = section(root, "ssh");
    readValue(ssh, "user", config.ssh.user);
    readValue(ssh, "port", config.ssh.port);
    readValue(ssh, "member_port", config.ssh.memberPort);
    readValue(ssh, "extra_options", config.ssh.extraOptions);

    const json& rsync = section(root, "rsync");
    readValue(rsync, "checksum", config.rsyncChecksum);

    const json& remote = section(root, "remote");
    readValue(remote, "data_dir", config.remote.dataDir);
    readValue(remote, "repositories_dir", config.remote.repositoriesDir);
    readValue(remote, "status_path", config.remote.statusPath);
    readValue(remote, "release_file", config.remote.releaseFile);
    readValue(remote, "configured_file", config.remote.configuredFile);
    readValue(remote, "cluster_file", config.remote.clusterFile);
    readValue(remote, "maintenance_file", config.remote.maintenanceFile);
    readValue(remote, "replication_file", config.remote.replicationFile);

    const json& versions = section(root, "versions");
    readValue(versions, "supported_min", config.versions.supportedMin);
    readValue(versions, "cluster_min_snapshot", config.versions.clusterMinSnapshot);
    readValue(versions, "legacy_settings", config.versions.legacySettings);

    if (config.dataDir.empty()) {
        throw std::runtime_error("'data_dir' must not be empty");
    }
    if (config.numSnapshots < 1) {
        throw std::runtime_error("'num_snapshots' must be at least 1");
    }
    if (!config.backupStrategy.empty() && config.backupStrategy != "rsync" &&
        config.backupStrategy != "tarball" && config.backupStrategy != "cluster") {
        throw std::runtime_error("Unknown backup_strategy: " + config.backupStrategy);
    }
    if (config.ssh.user.empty()) {
        throw std::runtime_error("'ssh.user' must not be empty");
    }
    requirePort("ssh.port", config.ssh.port);
    requirePort("ssh.member_port", config.ssh.memberPort);
    requireVersion("versions.supported_min", config.versions.supportedMin);
    requireVersion("versions.cluster_min_snapshot", config.versions.clusterMinSnapshot);
    requireVersion("versions.legacy_settings", config.versions.legacySettings);

    return config;
}

AppConfig AppConfig::load(const std::string& path, bool required) {
    if (path.empty() || !std::filesystem::exists(path)) {
        if (required) {
            throw std::runtime_error("Configuration file not found: " + path);
        }
        Logger::debug("No configuration file at '" + path + "', using defaults");
        return AppConfig();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + path);
    }

    json root;
    try {
        file >> root;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }

    return fromJson(root);
}

std::string AppConfig::resolvePath(const std::string& override) {
    if (!override.empty()) {
        return override;
    }
    const char* env = std::getenv("APPLIANCE_BACKUP_CONFIG");
    if (env && *env) {
        return env;
    }
    return kDefaultConfigPath;
}
