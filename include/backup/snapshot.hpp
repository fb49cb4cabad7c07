#pragma once

#include <optional>
#include <string>

// How a snapshot's bulk data was captured. Recorded in the snapshot and
// replayed on restore.
enum class BackupStrategy {
    Rsync,
    Tarball,
    Cluster
};

inline std::string strategyToString(BackupStrategy strategy) {
    switch (strategy) {
        case BackupStrategy::Rsync:   return "rsync";
        case BackupStrategy::Tarball: return "tarball";
        case BackupStrategy::Cluster: return "cluster";
    }
    return "unknown";
}

inline std::optional<BackupStrategy> parseStrategy(const std::string& tag) {
    if (tag == "rsync") {
        return BackupStrategy::Rsync;
    }
    if (tag == "tarball") {
        return BackupStrategy::Tarball;
    }
    if (tag == "cluster") {
        return BackupStrategy::Cluster;
    }
    return std::nullopt;
}

struct Snapshot {
    std::string id;                       // YYYYMMDDTHHMMSS, UTC
    std::string path;
    std::string strategy;                 // tag as recorded, may be unknown
    std::string version;                  // appliance release at backup time
    std::optional<std::string> parentId;  // dedup base
};
