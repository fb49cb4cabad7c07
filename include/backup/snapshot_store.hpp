#pragma once

#include "backup/snapshot.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Append-only chain of snapshots under one data directory:
//
//   <dataDir>/20240101T020000/   committed snapshot
//   <dataDir>/20240102T020000/   snapshot being written (has "incomplete")
//   <dataDir>/current -> 20240101T020000
//
// `current` only ever moves to a committed snapshot, with a single rename.
class SnapshotStore {
public:
    explicit SnapshotStore(const std::string& dataDir);

    // Allocates a fresh snapshot directory marked incomplete. The id is
    // strictly greater than every id already in the store.
    bool begin(Snapshot& snapshot);

    // True when `current` references a committed snapshot.
    bool committed() const;

    // Path of the snapshot `current` references, used as hardlink base.
    std::optional<std::string> dedupBase() const;

    // Clears the incomplete marker and swaps `current` to the snapshot.
    // Committing the snapshot `current` already references is a no-op.
    bool commit(const Snapshot& snapshot);

    // Removes a snapshot that was never committed.
    bool abort(const Snapshot& snapshot);

    bool recordMetadata(Snapshot& snapshot, BackupStrategy strategy, const std::string& version);

    // Loads a committed snapshot; an empty id means `current`.
    bool resolve(const std::string& id, Snapshot& snapshot) const;

    // Committed snapshot ids, oldest first.
    std::vector<std::string> list() const;
    std::optional<std::string> currentId() const;

    // Replaces files identical to the same path in the parent snapshot with
    // hardlinks to it.
    bool linkDuplicates(const Snapshot& snapshot, size_t& linked);

    // Bytes held only by this snapshot (regular files with a single link).
    bool uniqueBytes(const Snapshot& snapshot, uintmax_t& bytes) const;

    // Keeps the newest `keep` committed snapshots and drops stale incomplete
    // ones. The snapshot `current` references is never removed.
    bool prune(size_t keep, std::vector<std::string>& removed);

    std::string getLastError() const { return lastError_; }

    static bool isSnapshotId(const std::string& name);

    static constexpr const char* kCurrentLink = "current";
    static constexpr const char* kIncompleteMarker = "incomplete";
    static constexpr const char* kStrategyFile = "strategy";
    static constexpr const char* kVersionFile = "version";

private:
    std::string snapshotPath(const std::string& id) const;
    bool isIncomplete(const std::string& id) const;
    std::vector<std::string> allIds() const;
    std::string nextId() const;

    std::string dataDir_;
    mutable std::string lastError_;
};

// Aborts the snapshot on scope exit unless it was committed through this
// guard.
class PendingSnapshot {
public:
    PendingSnapshot(SnapshotStore& store, Snapshot& snapshot);
    ~PendingSnapshot();

    PendingSnapshot(const PendingSnapshot&) = delete;
    PendingSnapshot& operator=(const PendingSnapshot&) = delete;

    bool commit();

private:
    SnapshotStore& store_;
    Snapshot& snapshot_;
    bool committed_;
};
