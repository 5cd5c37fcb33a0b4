// File: src/storage/lifecycle_snapshot_store.hpp
#pragma once

#include "lifecycle/lifecycle_state_store.hpp"
#include "intent/intent.hpp"
#include <string>
#include <mutex>
#include <vector>
#include <sqlite3.h>

namespace lrec {

/// One persisted desired-lifecycle row
struct SnapshotRow {
    NodeID node_id;
    LifecycleTier tier{LifecycleTier::COLD};
    TransitionCause cause{TransitionCause::WORKSPACE_RETENTION};
    bool pinned{false};

    /// Position in the tier sequence, 0 = most recently promoted
    size_t recency_rank{0};
};

/// SQLite snapshot of the desired lifecycle
///
/// Only the desired side is persisted: tiers, causes, pin flags and the
/// recency order of the Active and Warm sequences. Resource mappings and
/// backpressure state belong to the running process and are never saved.
///
/// A snapshot is restored by replaying LoadIntents() through the engine,
/// which rebuilds the same tier membership, order and pins. The AddNode
/// intents carry the pin flag, so pinned overflow survives the replay.
class LifecycleSnapshotStore {
public:
    struct Config {
        /// Path to the SQLite database file (":memory:" for tests)
        std::string db_path;

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @throws std::runtime_error if the database cannot be opened
    explicit LifecycleSnapshotStore(const Config& config);

    ~LifecycleSnapshotStore();

    // SQLite connection is not copyable
    LifecycleSnapshotStore(const LifecycleSnapshotStore&) = delete;
    LifecycleSnapshotStore& operator=(const LifecycleSnapshotStore&) = delete;

    /// Replace the stored snapshot with the store's records, in one transaction
    ///
    /// @return false if any write failed (the previous snapshot is kept)
    bool Save(const LifecycleStateStore& store);

    /// Every stored row, Active then Warm (by rank) then Cold (by node id)
    std::vector<SnapshotRow> LoadRows() const;

    /// Intents that rebuild the saved tiers and recency order
    ///
    /// Every node is added Cold; Warm and Active members are then promoted
    /// least recent first, so the last promotion ends up at the head.
    std::vector<Intent> LoadIntents() const;

    /// Nodes saved with the pinned flag, ordered by node id
    std::vector<NodeID> LoadPinned() const;

    size_t Count() const;

    void Clear();

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();

    bool ExecuteSQL(const std::string& sql) const;

    bool InsertRow(sqlite3_stmt* stmt, const SnapshotRow& row);
};

} // namespace lrec
