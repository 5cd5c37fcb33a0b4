// File: src/engine/lifecycle_engine.hpp
#pragma once

#include "lifecycle/lifecycle_state_store.hpp"
#include "runtime/resource_handle_table.hpp"
#include "runtime/backpressure_controller.hpp"
#include "runtime/resource_backend.hpp"
#include "runtime/effect_sink.hpp"
#include "intent/intent.hpp"
#include "intent/intent_queue.hpp"
#include "intent/intent_reducer.hpp"
#include "reconcile/reconciler.hpp"
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lrec {

/// User-facing presentation of a node's resource
enum class NodeStatus : uint8_t {
    LIVE = 0,          ///< Resource mapped
    LOADING = 1,       ///< Create in flight
    UNLOADED = 2,      ///< No resource, none wanted or none pending
    UNAVAILABLE = 3,   ///< Terminal creation failure
    RETRY_WAIT = 4,    ///< Blocked, waiting for backoff to elapse
};

const char* ToString(NodeStatus status);

/// What one frame did, for overlays, logs and tests
struct FrameDiagnostics {
    size_t creates_issued{0};
    size_t destroys_issued{0};

    /// Forced demotions of this frame, indexed by TransitionCause
    std::array<size_t, kTransitionCauseCount> demotions_by_cause{};

    size_t blocked_count{0};
    std::vector<NodeID> terminal_failures;
    size_t pinned_overflow_count{0};

    /// Counters of the reconcile pass
    Reconciler::PassStats pass;

    size_t DemotionCount(TransitionCause cause) const {
        return demotions_by_cause[static_cast<size_t>(cause)];
    }

    size_t TotalDemotions() const;

    /// One-line summary
    std::string ToString() const;
};

/// Result of RunFrame
struct FrameReport {
    uint64_t frame{0};

    /// Phase 1 result: applied count, rejected intents
    ApplyReport apply;

    /// Follow-ups handed to the diagnostics listener this frame
    std::vector<FollowUpIntent> follow_ups;

    FrameDiagnostics diagnostics;
};

/**
 * @brief Frame-driven lifecycle engine
 *
 * Owns the lifecycle state, the runtime mappings and the backpressure
 * state of every node, and drives them one frame at a time:
 *
 *   Submit()          any thread, any time: intents are queued
 *   RunFrame(now)     frame thread:
 *                       1. drain intent queue
 *                       2. Phase 1: IntentReducer mutates the state store
 *                       3. boundary: Phase 1 is complete
 *                       4. Phase 2: Reconciler issues effects through the
 *                          sink and folds backend outcomes in
 *
 * Follow-ups produced in Phase 2 re-enter the intent stream and reach the
 * diagnostics listener on the next frame.
 *
 * The backend is not owned and must outlive the engine. It posts its
 * outcomes to GetOutcomeQueue().
 */
class LifecycleEngine {
public:
    struct Config {
        LifecycleStateStore::Config store;
        BackpressureController::Config backpressure;
        Reconciler::Config reconciler;

        bool IsValid() const {
            return store.IsValid() && backpressure.IsValid() && reconciler.IsValid();
        }
    };

    using DiagnosticsListener = std::function<void(const FollowUpIntent&)>;

    explicit LifecycleEngine(IResourceBackend& backend);

    LifecycleEngine(IResourceBackend& backend, const Config& config);

    LifecycleEngine(const LifecycleEngine&) = delete;
    LifecycleEngine& operator=(const LifecycleEngine&) = delete;

    // ========================================================================
    // Intent Stream
    // ========================================================================

    /// Queue an intent for the next frame (thread-safe)
    void Submit(Intent intent);

    void SubmitBatch(const std::vector<Intent>& intents);

    size_t PendingIntents() const { return intents_.Size(); }

    // ========================================================================
    // Frame
    // ========================================================================

    /// Run Phase 1 then Phase 2
    ///
    /// @throws std::logic_error if called while a frame is running
    FrameReport RunFrame(Timestamp now = Timestamp::Now());

    uint64_t FrameCount() const { return frame_count_; }

    const FrameReport& GetLastReport() const { return last_report_; }

    // ========================================================================
    // Host Controls
    // ========================================================================

    /// Pin or unpin a node (host-owned flag)
    ///
    /// @return false if the node is unknown
    bool SetPinned(NodeID id, bool pinned, Timestamp now = Timestamp::Now());

    void SetDiagnosticsListener(DiagnosticsListener listener);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Presentation status of a node, nullopt if unknown
    std::optional<NodeStatus> GetNodeStatus(NodeID id, Timestamp now = Timestamp::Now()) const;

    const LifecycleStateStore& GetStateStore() const { return store_; }
    const ResourceHandleTable& GetHandleTable() const { return table_; }
    const BackpressureController& GetBackpressure() const { return backpressure_; }

    /// Queue the backend posts outcomes to
    ResourceOutcomeQueue& GetOutcomeQueue() { return outcomes_; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    LifecycleStateStore store_;
    ResourceHandleTable table_;
    BackpressureController backpressure_;

    IntentReducer reducer_;
    Reconciler reconciler_;

    IntentQueue intents_;
    ResourceOutcomeQueue outcomes_;
    EffectSink effects_;

    DiagnosticsListener listener_;

    bool in_frame_{false};
    uint64_t frame_count_{0};
    FrameReport last_report_;

    void CollectDiagnostics(FrameDiagnostics& diagnostics);
};

} // namespace lrec
