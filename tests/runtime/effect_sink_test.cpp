// File: tests/runtime/effect_sink_test.cpp
#include "runtime/effect_sink.hpp"
#include "support/fake_resource_backend.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace lrec {
namespace {

using testing_support::FakeResourceBackend;

TEST(EffectSinkTest, EffectsOutsidePhaseThrow) {
    FakeResourceBackend backend;
    EffectSink sink(backend);

    EXPECT_FALSE(sink.IsOpen());
    EXPECT_THROW(sink.IssueCreate(NodeID(1), 1), std::logic_error);
    EXPECT_THROW(sink.IssueDestroy(ResourceHandle(1)), std::logic_error);
    EXPECT_TRUE(backend.creates.empty());
    EXPECT_TRUE(backend.destroys.empty());
}

TEST(EffectSinkTest, PhaseScopeForwardsEffects) {
    FakeResourceBackend backend;
    EffectSink sink(backend);

    {
        EffectSink::PhaseScope scope(sink);
        EXPECT_TRUE(sink.IsOpen());
        sink.IssueCreate(NodeID(1), 7);
        sink.IssueDestroy(ResourceHandle(3));
    }

    EXPECT_FALSE(sink.IsOpen());
    ASSERT_EQ(1u, backend.creates.size());
    EXPECT_EQ(NodeID(1), backend.creates[0].node_id);
    EXPECT_EQ(7u, backend.creates[0].ticket);
    EXPECT_TRUE(backend.Destroyed(ResourceHandle(3)));
    EXPECT_EQ(1u, sink.CreatesIssued());
    EXPECT_EQ(1u, sink.DestroysIssued());

    sink.ResetCounters();
    EXPECT_EQ(0u, sink.CreatesIssued());
}

TEST(EffectSinkTest, BackendExceptionReportedAsRejected) {
    FakeResourceBackend backend;
    backend.creates_to_reject = 1;
    backend.destroys_to_reject = 1;
    EffectSink sink(backend);

    EffectSink::PhaseScope scope(sink);
    EXPECT_FALSE(sink.IssueCreate(NodeID(4), 1));
    EXPECT_NE(std::string::npos, sink.LastError().find("create refused"));
    EXPECT_FALSE(sink.IssueDestroy(ResourceHandle(5)));
    EXPECT_NE(std::string::npos, sink.LastError().find("destroy refused"));
    EXPECT_EQ(0u, sink.CreatesIssued());
    EXPECT_EQ(0u, sink.DestroysIssued());

    EXPECT_TRUE(sink.IssueCreate(NodeID(4), 2));
    EXPECT_EQ(1u, sink.CreatesIssued());
}

class ReenteringBackend : public IResourceBackend {
public:
    void CreateResource(NodeID, CreateTicket) override {
        throw std::logic_error("frame re-entered");
    }
    void DestroyResource(ResourceHandle) override {}
    const char* GetName() const override { return "ReenteringBackend"; }
};

TEST(EffectSinkTest, FrameOrderingErrorsStillPropagate) {
    ReenteringBackend backend;
    EffectSink sink(backend);

    EffectSink::PhaseScope scope(sink);
    EXPECT_THROW(sink.IssueCreate(NodeID(1), 1), std::logic_error);
}

TEST(EffectSinkTest, NestedScopeThrows) {
    FakeResourceBackend backend;
    EffectSink sink(backend);

    EffectSink::PhaseScope scope(sink);
    EXPECT_THROW(EffectSink::PhaseScope{sink}, std::logic_error);
    EXPECT_TRUE(sink.IsOpen());
}

TEST(EffectSinkTest, ScopeClosesOnException) {
    FakeResourceBackend backend;
    EffectSink sink(backend);

    try {
        EffectSink::PhaseScope scope(sink);
        throw std::runtime_error("pass failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(sink.IsOpen());
}

TEST(ResourceOutcomeQueueTest, DrainPreservesArrivalOrder) {
    ResourceOutcomeQueue queue;
    queue.PushCreated(NodeID(1), 1, ResourceHandle(10));
    queue.PushDestroyed(ResourceHandle(11));
    queue.PushCrashed(ResourceHandle(12));
    queue.PushCreateFailed(NodeID(2), 2, CreationError::BACKEND_REJECTED);

    EXPECT_EQ(4u, queue.Size());
    auto outcomes = queue.Drain();
    ASSERT_EQ(4u, outcomes.size());
    EXPECT_TRUE(std::holds_alternative<CreationOutcome>(outcomes[0]));
    EXPECT_TRUE(std::get<CreationOutcome>(outcomes[0]).Succeeded());
    EXPECT_TRUE(std::holds_alternative<DestroyConfirmation>(outcomes[1]));
    EXPECT_TRUE(std::holds_alternative<ResourceCrashed>(outcomes[2]));
    EXPECT_FALSE(std::get<CreationOutcome>(outcomes[3]).Succeeded());
    EXPECT_EQ(0u, queue.Size());
}

TEST(ResourceOutcomeQueueTest, ConcurrentProducers) {
    ResourceOutcomeQueue queue;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&queue, t]() {
            for (int i = 0; i < 100; ++i) {
                queue.PushDestroyed(ResourceHandle(static_cast<uint64_t>(t * 1000 + i + 1)));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(400u, queue.Drain().size());
}

} // namespace
} // namespace lrec
