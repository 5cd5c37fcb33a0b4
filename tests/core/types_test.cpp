// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <unordered_set>
#include <chrono>

namespace lrec {
namespace {

TEST(NodeIDTest, DefaultConstructorCreatesInvalid) {
    NodeID id;
    EXPECT_FALSE(id.IsValid());
    EXPECT_EQ(0u, id.value());
    EXPECT_EQ("NodeID(INVALID)", id.ToString());
}

TEST(NodeIDTest, ExplicitValueIsValid) {
    NodeID id(42);
    EXPECT_TRUE(id.IsValid());
    EXPECT_EQ(42u, id.value());
    EXPECT_EQ("NodeID(42)", id.ToString());
}

TEST(NodeIDTest, ComparisonOperators) {
    NodeID id1(100);
    NodeID id2(200);
    NodeID id3(100);

    EXPECT_EQ(id1, id3);
    EXPECT_NE(id1, id2);
    EXPECT_LT(id1, id2);
}

TEST(NodeIDTest, HashableInUnorderedSet) {
    std::unordered_set<NodeID> ids;
    ids.insert(NodeID(1));
    ids.insert(NodeID(2));
    ids.insert(NodeID(1));

    EXPECT_EQ(2u, ids.size());
    EXPECT_EQ(1u, ids.count(NodeID(2)));
}

TEST(ResourceHandleTest, DefaultIsInvalid) {
    ResourceHandle handle;
    EXPECT_FALSE(handle.IsValid());
    EXPECT_EQ("ResourceHandle(INVALID)", handle.ToString());
}

TEST(ResourceHandleTest, ToStringIsHex) {
    ResourceHandle handle(255);
    EXPECT_TRUE(handle.IsValid());
    EXPECT_EQ("ResourceHandle(000000ff)", handle.ToString());
}

TEST(ResourceHandleTest, HashableInUnorderedSet) {
    std::unordered_set<ResourceHandle> handles{ResourceHandle(7), ResourceHandle(7), ResourceHandle(8)};
    EXPECT_EQ(2u, handles.size());
}

TEST(TimestampTest, FromMicrosRoundTrip) {
    Timestamp ts = Timestamp::FromMicros(1500000);
    EXPECT_EQ(1500000, ts.ToMicros());
    EXPECT_EQ("Timestamp(1.500000s)", ts.ToString());
}

TEST(TimestampTest, AddDurationAndSubtract) {
    Timestamp start = Timestamp::FromMicros(1000);
    Timestamp later = start + std::chrono::milliseconds(2);

    EXPECT_EQ(3000, later.ToMicros());
    EXPECT_EQ(std::chrono::microseconds(2000), later - start);
    EXPECT_LT(start, later);
    EXPECT_GE(later, start);
}

TEST(TimestampTest, NowIsMonotonic) {
    Timestamp t1 = Timestamp::Now();
    Timestamp t2 = Timestamp::Now();
    EXPECT_LE(t1, t2);
}

TEST(LifecycleTierTest, ToStringAndParse) {
    EXPECT_STREQ("ACTIVE", ToString(LifecycleTier::ACTIVE));
    EXPECT_STREQ("WARM", ToString(LifecycleTier::WARM));
    EXPECT_STREQ("COLD", ToString(LifecycleTier::COLD));

    EXPECT_EQ(LifecycleTier::ACTIVE, ParseLifecycleTier("active"));
    EXPECT_EQ(LifecycleTier::WARM, ParseLifecycleTier("Warm"));
    EXPECT_EQ(LifecycleTier::COLD, ParseLifecycleTier("COLD"));
    EXPECT_FALSE(ParseLifecycleTier("hot").has_value());
}

TEST(LifecycleTierTest, LivenessOrder) {
    EXPECT_TRUE(IsLivelier(LifecycleTier::ACTIVE, LifecycleTier::WARM));
    EXPECT_TRUE(IsLivelier(LifecycleTier::WARM, LifecycleTier::COLD));
    EXPECT_TRUE(IsLivelier(LifecycleTier::ACTIVE, LifecycleTier::COLD));
    EXPECT_FALSE(IsLivelier(LifecycleTier::COLD, LifecycleTier::WARM));
    EXPECT_FALSE(IsLivelier(LifecycleTier::WARM, LifecycleTier::WARM));
}

TEST(TransitionCauseTest, EveryCauseParsesBack) {
    for (size_t i = 0; i < kTransitionCauseCount; ++i) {
        auto cause = static_cast<TransitionCause>(i);
        auto parsed = ParseTransitionCause(ToString(cause));
        ASSERT_TRUE(parsed.has_value()) << ToString(cause);
        EXPECT_EQ(cause, *parsed);
    }
    EXPECT_EQ(TransitionCause::USER_FOCUS, ParseTransitionCause("user_focus"));
    EXPECT_FALSE(ParseTransitionCause("boredom").has_value());
}

TEST(TransitionCauseTest, DefaultTierForCause) {
    EXPECT_EQ(LifecycleTier::ACTIVE, DefaultTierForCause(TransitionCause::USER_FOCUS));
    EXPECT_EQ(LifecycleTier::ACTIVE, DefaultTierForCause(TransitionCause::TILE_VISIBLE));
    EXPECT_EQ(LifecycleTier::ACTIVE, DefaultTierForCause(TransitionCause::SELECTED_PREWARM));
    EXPECT_EQ(LifecycleTier::WARM, DefaultTierForCause(TransitionCause::WORKSPACE_RETENTION));
    EXPECT_EQ(LifecycleTier::WARM, DefaultTierForCause(TransitionCause::RESTORE));
}

TEST(TransitionCauseTest, Classification) {
    EXPECT_TRUE(IsForcedDemotionCause(TransitionCause::ACTIVE_CAPACITY_OVERFLOW));
    EXPECT_TRUE(IsForcedDemotionCause(TransitionCause::MEMORY_PRESSURE_CRITICAL));
    EXPECT_FALSE(IsForcedDemotionCause(TransitionCause::EXPLICIT_CLOSE));
}

TEST(MemoryPressureLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(MemoryPressureLevel::WARNING, ParseMemoryPressureLevel("warning"));
    EXPECT_EQ(MemoryPressureLevel::CRITICAL, ParseMemoryPressureLevel("Critical"));
    EXPECT_EQ(MemoryPressureLevel::NORMAL, ParseMemoryPressureLevel("NORMAL"));
    EXPECT_FALSE(ParseMemoryPressureLevel("severe").has_value());
}

TEST(EnumToStringTest, MappingStateAndCreationError) {
    EXPECT_STREQ("CREATE_PENDING", ToString(MappingState::CREATE_PENDING));
    EXPECT_STREQ("DESTROY_PENDING", ToString(MappingState::DESTROY_PENDING));
    EXPECT_STREQ("TIMEOUT", ToString(CreationError::TIMEOUT));
    EXPECT_STREQ("CRASHED", ToString(CreationError::CRASHED));
}

} // namespace
} // namespace lrec
