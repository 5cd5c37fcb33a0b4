// File: tests/storage/lifecycle_snapshot_store_test.cpp
#include "storage/lifecycle_snapshot_store.hpp"
#include "intent/intent_reducer.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace lrec {
namespace {

class LifecycleSnapshotStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_db_path_ = "/tmp/lrec_snapshot_test_" +
            std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".db";
    }

    void TearDown() override {
        std::filesystem::remove(test_db_path_);
    }

    static LifecycleStateStore::Config StoreConfig() {
        LifecycleStateStore::Config config;
        config.capacity.active_capacity = 2;
        config.capacity.warm_capacity = 2;
        config.log_warnings = false;
        return config;
    }

    /// Active [C, B], Warm [A], Cold [D]; B pinned
    void Populate(LifecycleStateStore& store) {
        Timestamp now = Timestamp::FromMicros(0);
        for (uint64_t id = 1; id <= 4; ++id) {
            store.AddNode(NodeID(id), LifecycleTier::COLD, TransitionCause::RESTORE, now);
        }
        store.SetTier(NodeID(1), LifecycleTier::ACTIVE, TransitionCause::USER_FOCUS, now);
        store.SetTier(NodeID(2), LifecycleTier::ACTIVE, TransitionCause::USER_FOCUS, now);
        store.SetTier(NodeID(3), LifecycleTier::ACTIVE, TransitionCause::USER_FOCUS, now);
        store.SetPinned(NodeID(2), true, now);
    }

    std::string test_db_path_;
};

TEST_F(LifecycleSnapshotStoreTest, SaveAndLoadRows) {
    LifecycleStateStore store(StoreConfig());
    Populate(store);

    LifecycleSnapshotStore snapshot(LifecycleSnapshotStore::Config{":memory:"});
    ASSERT_TRUE(snapshot.Save(store));
    EXPECT_EQ(4u, snapshot.Count());

    auto rows = snapshot.LoadRows();
    ASSERT_EQ(4u, rows.size());
    EXPECT_EQ(NodeID(3), rows[0].node_id);
    EXPECT_EQ(0u, rows[0].recency_rank);
    EXPECT_EQ(NodeID(2), rows[1].node_id);
    EXPECT_TRUE(rows[1].pinned);
    EXPECT_EQ(NodeID(1), rows[2].node_id);
    EXPECT_EQ(LifecycleTier::WARM, rows[2].tier);
    EXPECT_EQ(TransitionCause::ACTIVE_CAPACITY_OVERFLOW, rows[2].cause);
    EXPECT_EQ(NodeID(4), rows[3].node_id);
    EXPECT_EQ(LifecycleTier::COLD, rows[3].tier);
}

TEST_F(LifecycleSnapshotStoreTest, ReplayRebuildsTiersAndOrder) {
    LifecycleStateStore original(StoreConfig());
    Populate(original);

    LifecycleSnapshotStore snapshot(LifecycleSnapshotStore::Config{":memory:"});
    ASSERT_TRUE(snapshot.Save(original));

    LifecycleStateStore restored(StoreConfig());
    IntentReducer reducer;
    ApplyReport report = reducer.Apply(snapshot.LoadIntents(), restored, Timestamp::FromMicros(0));

    EXPECT_TRUE(report.Ok());
    EXPECT_EQ(original.IterActive(), restored.IterActive());
    EXPECT_EQ(original.IterWarm(), restored.IterWarm());
    EXPECT_EQ(original.IterCold(), restored.IterCold());
    EXPECT_EQ((std::vector<NodeID>{NodeID(2)}), snapshot.LoadPinned());
    EXPECT_TRUE(restored.IsPinned(NodeID(2)));
    EXPECT_FALSE(restored.IsPinned(NodeID(1)));

    // Pinned overflow: two pinned Active nodes in a one-slot tier
    LifecycleStateStore::Config narrow = StoreConfig();
    narrow.capacity.active_capacity = 1;
    Timestamp now = Timestamp::FromMicros(0);

    LifecycleStateStore crowded(narrow);
    for (uint64_t id = 1; id <= 2; ++id) {
        crowded.AddNode(NodeID(id), LifecycleTier::COLD, TransitionCause::RESTORE, now);
        crowded.SetPinned(NodeID(id), true, now);
        crowded.SetTier(NodeID(id), LifecycleTier::ACTIVE, TransitionCause::USER_FOCUS, now);
    }
    ASSERT_EQ((std::vector<NodeID>{NodeID(2), NodeID(1)}), crowded.IterActive());
    ASSERT_TRUE(snapshot.Save(crowded));

    LifecycleStateStore crowded_restored(narrow);
    report = reducer.Apply(snapshot.LoadIntents(), crowded_restored, now);

    EXPECT_TRUE(report.Ok());
    EXPECT_EQ((std::vector<NodeID>{NodeID(2), NodeID(1)}), crowded_restored.IterActive());
    EXPECT_TRUE(crowded_restored.IterWarm().empty());
    EXPECT_TRUE(crowded_restored.IsPinned(NodeID(1)));
    EXPECT_TRUE(crowded_restored.IsPinned(NodeID(2)));
}

TEST_F(LifecycleSnapshotStoreTest, SaveReplacesPreviousSnapshot) {
    LifecycleSnapshotStore snapshot(LifecycleSnapshotStore::Config{":memory:"});

    LifecycleStateStore first(StoreConfig());
    Populate(first);
    ASSERT_TRUE(snapshot.Save(first));

    LifecycleStateStore second(StoreConfig());
    second.AddNode(NodeID(9), LifecycleTier::WARM, TransitionCause::WORKSPACE_RETENTION);
    ASSERT_TRUE(snapshot.Save(second));

    auto rows = snapshot.LoadRows();
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ(NodeID(9), rows[0].node_id);
}

TEST_F(LifecycleSnapshotStoreTest, PersistsAcrossConnections) {
    {
        LifecycleStateStore store(StoreConfig());
        Populate(store);
        LifecycleSnapshotStore snapshot(LifecycleSnapshotStore::Config{test_db_path_});
        ASSERT_TRUE(snapshot.Save(store));
    }

    LifecycleSnapshotStore reopened(LifecycleSnapshotStore::Config{test_db_path_});
    EXPECT_EQ(4u, reopened.Count());
    EXPECT_EQ(1u, reopened.LoadPinned().size());
}

TEST_F(LifecycleSnapshotStoreTest, ClearEmptiesSnapshot) {
    LifecycleStateStore store(StoreConfig());
    Populate(store);
    LifecycleSnapshotStore snapshot(LifecycleSnapshotStore::Config{":memory:"});
    snapshot.Save(store);

    snapshot.Clear();

    EXPECT_EQ(0u, snapshot.Count());
    EXPECT_TRUE(snapshot.LoadIntents().empty());
}

TEST_F(LifecycleSnapshotStoreTest, UnopenablePathThrows) {
    EXPECT_THROW(LifecycleSnapshotStore(LifecycleSnapshotStore::Config{"/nonexistent/dir/x.db"}),
                 std::runtime_error);
}

} // namespace
} // namespace lrec
