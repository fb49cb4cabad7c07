#include "backup/snapshot_store.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Reserves a unique name next to `file` for staging its replacement. The
// reserved file is removed again so a hard link can take its place.
bool reserveStagingName(const fs::path& file, fs::path& staging) {
    std::string pattern =
        (file.parent_path() / ("." + file.filename().string() + ".dedup.XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    int fd = mkstemp(buffer.data());
    if (fd < 0) {
        return false;
    }
    close(fd);
    staging = buffer.data();
    return unlink(buffer.data()) == 0;
}

const char* kIdFormat = "%Y%m%dT%H%M%S";

std::string formatId(time_t when) {
    struct tm utc{};
    gmtime_r(&when, &utc);
    char buffer[32];
    strftime(buffer, sizeof(buffer), kIdFormat, &utc);
    return buffer;
}

time_t parseId(const std::string& id) {
    struct tm utc{};
    if (strptime(id.c_str(), kIdFormat, &utc) == nullptr) {
        return 0;
    }
    return timegm(&utc);
}

std::string readFirstLine(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::string line;
    std::getline(file, line);
    return utils::trim(line);
}

bool writeLine(const fs::path& path, const std::string& value) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << value << "\n";
    return file.good();
}

} // namespace

SnapshotStore::SnapshotStore(const std::string& dataDir)
    : dataDir_(dataDir) {
}

bool SnapshotStore::isSnapshotId(const std::string& name) {
    if (name.size() != 15 || name[8] != 'T') {
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        if (i != 8 && !std::isdigit(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    return true;
}

std::string SnapshotStore::snapshotPath(const std::string& id) const {
    return (fs::path(dataDir_) / id).string();
}

bool SnapshotStore::isIncomplete(const std::string& id) const {
    std::error_code ec;
    return fs::exists(fs::path(snapshotPath(id)) / kIncompleteMarker, ec);
}

std::vector<std::string> SnapshotStore::allIds() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(dataDir_, ec)) {
        return ids;
    }

    for (const auto& entry : fs::directory_iterator(dataDir_, ec)) {
        std::string name = entry.path().filename().string();
        if (isSnapshotId(name) && entry.is_directory(ec) && !entry.is_symlink(ec)) {
            ids.push_back(name);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string SnapshotStore::nextId() const {
    time_t now = time(nullptr);
    std::vector<std::string> ids = allIds();
    if (!ids.empty()) {
        time_t latest = parseId(ids.back());
        if (latest >= now) {
            now = latest + 1;
        }
    }
    return formatId(now);
}

bool SnapshotStore::begin(Snapshot& snapshot) {
    std::error_code ec;
    fs::create_directories(dataDir_, ec);
    if (ec) {
        lastError_ = "Failed to create data directory " + dataDir_ + ": " + ec.message();
        return false;
    }

    std::string id = nextId();
    fs::path path = snapshotPath(id);
    if (!fs::create_directory(path, ec)) {
        lastError_ = "Failed to create snapshot directory " + path.string() +
                     (ec ? ": " + ec.message() : ": already exists");
        return false;
    }

    if (!writeLine(path / kIncompleteMarker, id)) {
        lastError_ = "Failed to mark snapshot " + id + " incomplete";
        fs::remove_all(path, ec);
        return false;
    }

    snapshot = Snapshot();
    snapshot.id = id;
    snapshot.path = path.string();
    if (committed()) {
        snapshot.parentId = currentId();
    }

    Logger::info("Started snapshot " + id + (snapshot.parentId ? " (base " + *snapshot.parentId + ")" : ""));
    return true;
}

std::optional<std::string> SnapshotStore::currentId() const {
    std::error_code ec;
    fs::path target = fs::read_symlink(fs::path(dataDir_) / kCurrentLink, ec);
    if (ec) {
        return std::nullopt;
    }
    std::string id = target.filename().string();
    if (!isSnapshotId(id)) {
        return std::nullopt;
    }
    return id;
}

bool SnapshotStore::committed() const {
    auto id = currentId();
    if (!id) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(snapshotPath(*id), ec) && !isIncomplete(*id);
}

std::optional<std::string> SnapshotStore::dedupBase() const {
    if (!committed()) {
        return std::nullopt;
    }
    return snapshotPath(*currentId());
}

bool SnapshotStore::commit(const Snapshot& snapshot) {
    std::error_code ec;
    fs::path path = snapshotPath(snapshot.id);
    if (!isSnapshotId(snapshot.id) || !fs::is_directory(path, ec)) {
        lastError_ = "Cannot commit missing snapshot " + snapshot.id;
        return false;
    }

    fs::remove(path / kIncompleteMarker, ec);
    if (ec) {
        lastError_ = "Failed to clear incomplete marker of " + snapshot.id + ": " + ec.message();
        return false;
    }

    auto current = currentId();
    if (current && *current == snapshot.id) {
        return true;
    }
    if (current && *current > snapshot.id) {
        lastError_ = "Snapshot " + snapshot.id + " is older than current " + *current;
        return false;
    }

    fs::path link = fs::path(dataDir_) / kCurrentLink;
    fs::path staging = fs::path(dataDir_) / (std::string(".") + kCurrentLink + ".tmp");
    fs::remove(staging, ec);

    fs::create_symlink(snapshot.id, staging, ec);
    if (ec) {
        lastError_ = "Failed to create " + staging.string() + ": " + ec.message();
        return false;
    }

    // rename(2) replaces the old link in one step
    fs::rename(staging, link, ec);
    if (ec) {
        lastError_ = "Failed to update " + link.string() + ": " + ec.message();
        fs::remove(staging, ec);
        return false;
    }

    Logger::info("Committed snapshot " + snapshot.id);
    return true;
}

bool SnapshotStore::abort(const Snapshot& snapshot) {
    if (!isSnapshotId(snapshot.id)) {
        lastError_ = "Invalid snapshot id '" + snapshot.id + "'";
        return false;
    }
    auto current = currentId();
    if (current && *current == snapshot.id) {
        lastError_ = "Refusing to remove current snapshot " + snapshot.id;
        return false;
    }

    std::error_code ec;
    fs::remove_all(snapshotPath(snapshot.id), ec);
    if (ec) {
        lastError_ = "Failed to remove snapshot " + snapshot.id + ": " + ec.message();
        return false;
    }

    Logger::warning("Discarded incomplete snapshot " + snapshot.id);
    return true;
}

bool SnapshotStore::recordMetadata(Snapshot& snapshot, BackupStrategy strategy,
                                   const std::string& version) {
    fs::path path = snapshot.path;
    std::string tag = strategyToString(strategy);
    if (!writeLine(path / kStrategyFile, tag) || !writeLine(path / kVersionFile, version)) {
        lastError_ = "Failed to write metadata of snapshot " + snapshot.id;
        return false;
    }
    snapshot.strategy = tag;
    snapshot.version = version;
    return true;
}

bool SnapshotStore::resolve(const std::string& id, Snapshot& snapshot) const {
    std::string wanted = id;
    if (wanted.empty()) {
        if (!committed()) {
            lastError_ = "No committed snapshot in " + dataDir_;
            return false;
        }
        wanted = *currentId();
    }

    if (!isSnapshotId(wanted)) {
        lastError_ = "Invalid snapshot id '" + wanted + "'";
        return false;
    }

    std::error_code ec;
    fs::path path = snapshotPath(wanted);
    if (!fs::is_directory(path, ec)) {
        lastError_ = "Snapshot " + wanted + " not found in " + dataDir_;
        return false;
    }
    if (isIncomplete(wanted)) {
        lastError_ = "Snapshot " + wanted + " is incomplete";
        return false;
    }

    snapshot = Snapshot();
    snapshot.id = wanted;
    snapshot.path = path.string();
    snapshot.strategy = readFirstLine(path / kStrategyFile);
    snapshot.version = readFirstLine(path / kVersionFile);

    std::vector<std::string> ids = list();
    auto it = std::lower_bound(ids.begin(), ids.end(), wanted);
    if (it != ids.begin()) {
        snapshot.parentId = *(it - 1);
    }
    return true;
}

std::vector<std::string> SnapshotStore::list() const {
    std::vector<std::string> ids;
    for (const auto& id : allIds()) {
        if (!isIncomplete(id)) {
            ids.push_back(id);
        }
    }
    return ids;
}

bool SnapshotStore::linkDuplicates(const Snapshot& snapshot, size_t& linked) {
    linked = 0;
    if (!snapshot.parentId) {
        return true;
    }

    std::error_code ec;
    fs::path root = snapshot.path;
    fs::path base = snapshotPath(*snapshot.parentId);
    if (!fs::is_directory(base, ec)) {
        Logger::warning("Dedup base " + base.string() + " is gone, not linking");
        return true;
    }

    // Collect first; replacing files while iterating could revisit them.
    std::vector<fs::path> files;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        lastError_ = "Failed to scan snapshot " + snapshot.id + ": " + ec.message();
        return false;
    }

    for (const auto& file : files) {
        fs::path relative = file.lexically_relative(root);
        if (relative == kIncompleteMarker) {
            continue;
        }

        fs::path candidate = base / relative;
        if (!fs::is_regular_file(fs::symlink_status(candidate, ec)) ||
            fs::equivalent(candidate, file, ec) ||
            fs::file_size(candidate, ec) != fs::file_size(file, ec)) {
            continue;
        }

        std::string ours;
        std::string theirs;
        std::string error;
        if (!calculateChecksum(file.string(), ours, error) ||
            !calculateChecksum(candidate.string(), theirs, error)) {
            lastError_ = error;
            return false;
        }
        if (ours != theirs) {
            continue;
        }

        fs::path staging;
        if (!reserveStagingName(file, staging)) {
            lastError_ = "Failed to stage link for " + relative.string() + ": " + strerror(errno);
            return false;
        }
        fs::create_hard_link(candidate, staging, ec);
        if (ec) {
            lastError_ = "Failed to link " + relative.string() + ": " + ec.message();
            return false;
        }
        fs::rename(staging, file, ec);
        if (ec) {
            lastError_ = "Failed to replace " + relative.string() + ": " + ec.message();
            fs::remove(staging, ec);
            return false;
        }
        ++linked;
    }

    Logger::debug("Linked " + std::to_string(linked) + " unchanged file(s) in " + snapshot.id);
    return true;
}

bool SnapshotStore::uniqueBytes(const Snapshot& snapshot, uintmax_t& bytes) const {
    bytes = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(snapshot.path, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec) || it->is_symlink(ec)) {
            continue;
        }
        if (fs::hard_link_count(it->path(), ec) == 1) {
            bytes += fs::file_size(it->path(), ec);
        }
    }
    if (ec) {
        lastError_ = "Failed to scan snapshot " + snapshot.id + ": " + ec.message();
        return false;
    }
    return true;
}

bool SnapshotStore::prune(size_t keep, std::vector<std::string>& removed) {
    removed.clear();
    auto current = currentId();
    std::vector<std::string> ids = list();
    std::error_code ec;

    if (ids.size() > keep) {
        size_t excess = ids.size() - keep;
        for (size_t i = 0; i < excess; ++i) {
            if (current && ids[i] == *current) {
                continue;
            }
            fs::remove_all(snapshotPath(ids[i]), ec);
            if (ec) {
                lastError_ = "Failed to remove snapshot " + ids[i] + ": " + ec.message();
                return false;
            }
            removed.push_back(ids[i]);
        }
    }

    // Leftovers of interrupted backups; anything newer may still be in progress
    if (current) {
        for (const auto& id : allIds()) {
            if (id < *current && isIncomplete(id)) {
                fs::remove_all(snapshotPath(id), ec);
                if (ec) {
                    lastError_ = "Failed to remove incomplete snapshot " + id + ": " + ec.message();
                    return false;
                }
                removed.push_back(id);
            }
        }
    }

    for (const auto& id : removed) {
        Logger::info("Pruned snapshot " + id);
    }
    return true;
}

PendingSnapshot::PendingSnapshot(SnapshotStore& store, Snapshot& snapshot)
    : store_(store)
    , snapshot_(snapshot)
    , committed_(false) {
}

PendingSnapshot::~PendingSnapshot() {
    if (committed_ || snapshot_.id.empty()) {
        return;
    }
    if (!store_.abort(snapshot_)) {
        Logger::error("Failed to discard snapshot " + snapshot_.id + ": " + store_.getLastError());
    }
}

bool PendingSnapshot::commit() {
    committed_ = store_.commit(snapshot_);
    return committed_;
}
