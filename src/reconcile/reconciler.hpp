// File: src/reconcile/reconciler.hpp
//
// Reconciler (Phase 2)
//
// Converges observed runtime state (ResourceHandleTable) toward the desired
// lifecycle (LifecycleStateStore). Runs once per frame, never blocks, and
// never waits on a backend: outcomes are read from the ResourceOutcomeQueue
// snapshot taken at the top of the pass.
//
// Pass order:
//   0. Housekeeping: backpressure resets, blocked records of Cold/removed
//      nodes, mappings of removed nodes
//   1. Desired Active/Warm + UNMAPPED (+ retry eligible) -> create effect
//   2. Desired Cold + MAPPED -> destroy effect
//   3. Creation outcomes: success -> MAPPED (destroyed at once if no longer
//      wanted); failure -> UNMAPPED + backoff + diagnostic follow-up
//   4. Destroy confirmations -> UNMAPPED, handle released
//   +  Crashes and creation timeouts
//   5. Memory pressure trim (Warning 10%, Critical 50% + cancel pending);
//      nodes trimmed to Cold get their destroy effect in the same pass

#pragma once

#include "lifecycle/lifecycle_state_store.hpp"
#include "runtime/resource_handle_table.hpp"
#include "runtime/backpressure_controller.hpp"
#include "runtime/resource_backend.hpp"
#include "runtime/effect_sink.hpp"
#include "intent/intent.hpp"
#include "core/types.hpp"
#include <chrono>
#include <vector>

namespace lrec {

class Reconciler {
public:
    struct Config {
        /// CREATE_PENDING attempts older than this count as TIMEOUT failures
        Timestamp::Duration creation_timeout{std::chrono::seconds(8)};

        /// Share of each live tier trimmed per pressure signal
        float warning_trim_fraction{0.10f};
        float critical_trim_fraction{0.50f};

        /// Print stale or unknown outcome events to stderr
        bool log_warnings{true};

        bool IsValid() const;
    };

    /// Counters for one reconcile pass
    struct PassStats {
        size_t creates_issued{0};
        size_t destroys_issued{0};
        size_t creates_confirmed{0};
        size_t creation_failures{0};
        size_t creation_timeouts{0};
        size_t crashes{0};
        size_t destroys_confirmed{0};
        size_t stale_outcomes{0};
        size_t orphan_destroys{0};
        size_t skipped_backoff{0};
        size_t pressure_demotions{0};
        size_t cancelled_creates{0};
        size_t rejected_effects{0};    // Effects the backend threw on
        MemoryPressureLevel pressure{MemoryPressureLevel::UNKNOWN};
    };

    Reconciler();

    explicit Reconciler(const Config& config);

    /// Run one reconcile pass
    ///
    /// Opens the effect sink for the duration of the pass; calling this
    /// while another pass holds the sink throws std::logic_error.
    ///
    /// @param store Desired lifecycle (forced demotions are written back)
    /// @param table Observed runtime mappings
    /// @param backpressure Failed-creation state
    /// @param effects Gate to the resource backend
    /// @param outcomes Outcome events posted by the backend
    /// @param now Current frame time
    /// @return Diagnostic report requests for the intent stream
    std::vector<FollowUpIntent> Reconcile(LifecycleStateStore& store,
                                          ResourceHandleTable& table,
                                          BackpressureController& backpressure,
                                          EffectSink& effects,
                                          ResourceOutcomeQueue& outcomes,
                                          Timestamp now = Timestamp::Now());

    const PassStats& GetLastPassStats() const { return stats_; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    PassStats stats_;
    std::vector<ResourceHandle> orphans_to_destroy_;    // Orphan destroys the backend threw on

    void Housekeep(LifecycleStateStore& store, ResourceHandleTable& table,
                   BackpressureController& backpressure, EffectSink& effects);

    /// Drop blocked records of Cold and removed nodes
    void ClearUnwantedBackpressure(const LifecycleStateStore& store,
                                   BackpressureController& backpressure);

    void IssueCreates(const LifecycleStateStore& store, ResourceHandleTable& table,
                      BackpressureController& backpressure, EffectSink& effects,
                      Timestamp now, std::vector<FollowUpIntent>& follow_ups);

    void IssueDestroys(const LifecycleStateStore& store, ResourceHandleTable& table,
                       EffectSink& effects);

    void HandleCreationOutcome(const CreationOutcome& outcome,
                               const LifecycleStateStore& store, ResourceHandleTable& table,
                               BackpressureController& backpressure, EffectSink& effects,
                               Timestamp now, std::vector<FollowUpIntent>& follow_ups);

    void HandleDestroyConfirmation(const DestroyConfirmation& confirmation,
                                   const LifecycleStateStore& store,
                                   ResourceHandleTable& table);

    void HandleCrash(const ResourceCrashed& crash,
                     const LifecycleStateStore& store, ResourceHandleTable& table,
                     BackpressureController& backpressure, Timestamp now,
                     std::vector<FollowUpIntent>& follow_ups);

    void ExpireTimedOutCreates(const LifecycleStateStore& store, ResourceHandleTable& table,
                               BackpressureController& backpressure, Timestamp now,
                               std::vector<FollowUpIntent>& follow_ups);

    void ApplyMemoryPressure(LifecycleStateStore& store, ResourceHandleTable& table,
                             Timestamp now);

    /// Record a failure for a node that still wants a resource
    void RecordFailure(NodeID id, CreationError error,
                       BackpressureController& backpressure, Timestamp now,
                       std::vector<FollowUpIntent>& follow_ups);

    /// Issue a destroy for a MAPPED node; a rejected destroy leaves it MAPPED
    void Destroy(NodeID id, ResourceHandleTable& table, EffectSink& effects);

    /// Issue a destroy for a resource no node owns
    void DestroyOrphan(ResourceHandle handle, EffectSink& effects);

    /// True if the node is known and its desired tier is not Cold
    static bool WantsResource(const LifecycleStateStore& store, NodeID id);
};

} // namespace lrec
