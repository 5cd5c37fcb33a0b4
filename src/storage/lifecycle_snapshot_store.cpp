// File: src/storage/lifecycle_snapshot_store.cpp
#include "storage/lifecycle_snapshot_store.hpp"
#include <algorithm>
#include <stdexcept>

namespace lrec {

// ============================================================================
// Constructor and Destructor
// ============================================================================

LifecycleSnapshotStore::LifecycleSnapshotStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open snapshot database: " + error);
    }

    InitializeDatabase();
}

LifecycleSnapshotStore::~LifecycleSnapshotStore() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void LifecycleSnapshotStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    std::string create_table = R"(
        CREATE TABLE IF NOT EXISTS lifecycle_nodes (
            node_id INTEGER PRIMARY KEY,
            tier INTEGER NOT NULL,
            cause INTEGER NOT NULL,
            pinned INTEGER NOT NULL,
            recency_rank INTEGER NOT NULL
        );
    )";

    if (!ExecuteSQL(create_table)) {
        throw std::runtime_error("Failed to create lifecycle_nodes table");
    }
}

bool LifecycleSnapshotStore::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Save
// ============================================================================

bool LifecycleSnapshotStore::Save(const LifecycleStateStore& store) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SnapshotRow> rows;
    rows.reserve(store.Size());

    auto add_sequence = [&](const std::vector<NodeID>& members) {
        for (size_t rank = 0; rank < members.size(); ++rank) {
            const DesiredLifecycleRecord* record = store.Find(members[rank]);
            rows.push_back(SnapshotRow{record->node_id, record->tier, record->cause,
                                       record->pinned, rank});
        }
    };
    add_sequence(store.IterActive());
    add_sequence(store.IterWarm());
    for (NodeID id : store.IterCold()) {
        const DesiredLifecycleRecord* record = store.Find(id);
        rows.push_back(SnapshotRow{id, record->tier, record->cause, record->pinned, 0});
    }

    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        return false;
    }

    if (!ExecuteSQL("DELETE FROM lifecycle_nodes;")) {
        ExecuteSQL("ROLLBACK;");
        return false;
    }

    const char* sql = "INSERT INTO lifecycle_nodes (node_id, tier, cause, pinned, recency_rank) "
                      "VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        ExecuteSQL("ROLLBACK;");
        return false;
    }

    for (const auto& row : rows) {
        if (!InsertRow(stmt, row)) {
            sqlite3_finalize(stmt);
            ExecuteSQL("ROLLBACK;");
            return false;
        }
    }

    sqlite3_finalize(stmt);
    return ExecuteSQL("COMMIT;");
}

bool LifecycleSnapshotStore::InsertRow(sqlite3_stmt* stmt, const SnapshotRow& row) {
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(row.node_id.value()));
    sqlite3_bind_int(stmt, 2, static_cast<int>(row.tier));
    sqlite3_bind_int(stmt, 3, static_cast<int>(row.cause));
    sqlite3_bind_int(stmt, 4, row.pinned ? 1 : 0);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(row.recency_rank));

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    return rc == SQLITE_DONE;
}

// ============================================================================
// Load
// ============================================================================

std::vector<SnapshotRow> LifecycleSnapshotStore::LoadRows() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SnapshotRow> rows;

    const char* sql = "SELECT node_id, tier, cause, pinned, recency_rank FROM lifecycle_nodes "
                      "ORDER BY tier ASC, recency_rank ASC, node_id ASC;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return rows;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        int tier = sqlite3_column_int(stmt, 1);
        int cause = sqlite3_column_int(stmt, 2);

        // Rows written by a newer schema are skipped
        if (tier < 0 || tier > static_cast<int>(LifecycleTier::COLD) ||
            cause < 0 || cause >= static_cast<int>(kTransitionCauseCount)) {
            continue;
        }

        SnapshotRow row;
        row.node_id = NodeID(static_cast<NodeID::ValueType>(sqlite3_column_int64(stmt, 0)));
        row.tier = static_cast<LifecycleTier>(tier);
        row.cause = static_cast<TransitionCause>(cause);
        row.pinned = sqlite3_column_int(stmt, 3) != 0;
        row.recency_rank = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
        rows.push_back(row);
    }

    sqlite3_finalize(stmt);
    return rows;
}

std::vector<Intent> LifecycleSnapshotStore::LoadIntents() const {
    std::vector<SnapshotRow> rows = LoadRows();
    std::vector<Intent> intents;

    std::vector<SnapshotRow> active;
    std::vector<SnapshotRow> warm;

    for (const auto& row : rows) {
        AddNode add;
        add.node_id = row.node_id;
        add.cause = TransitionCause::RESTORE;
        add.tier = LifecycleTier::COLD;
        // Pins must hold before the promotions or capacity evicts them
        add.pinned = row.pinned;
        intents.push_back(add);

        if (row.tier == LifecycleTier::ACTIVE) {
            active.push_back(row);
        } else if (row.tier == LifecycleTier::WARM) {
            warm.push_back(row);
        }
    }

    // Least recent first: each promotion lands at the head
    auto promote = [&intents](std::vector<SnapshotRow>& members, LifecycleTier tier) {
        std::sort(members.begin(), members.end(),
                  [](const SnapshotRow& a, const SnapshotRow& b) {
                      return a.recency_rank > b.recency_rank;
                  });
        for (const auto& row : members) {
            intents.push_back(SetDesiredTier{row.node_id, tier, TransitionCause::RESTORE});
        }
    };
    promote(warm, LifecycleTier::WARM);
    promote(active, LifecycleTier::ACTIVE);

    return intents;
}

std::vector<NodeID> LifecycleSnapshotStore::LoadPinned() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<NodeID> pinned;

    const char* sql = "SELECT node_id FROM lifecycle_nodes WHERE pinned != 0 ORDER BY node_id ASC;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return pinned;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        pinned.emplace_back(static_cast<NodeID::ValueType>(sqlite3_column_int64(stmt, 0)));
    }

    sqlite3_finalize(stmt);
    return pinned;
}

size_t LifecycleSnapshotStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(*) FROM lifecycle_nodes;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

void LifecycleSnapshotStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecuteSQL("DELETE FROM lifecycle_nodes;");
}

} // namespace lrec
