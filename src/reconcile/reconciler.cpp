// File: src/reconcile/reconciler.cpp
//
// Implementation of Reconciler

#include "reconcile/reconciler.hpp"
#include <stdexcept>
#include <iostream>
#include <type_traits>

namespace lrec {

// ============================================================================
// Config
// ============================================================================

bool Reconciler::Config::IsValid() const {
    if (creation_timeout.count() <= 0) {
        return false;
    }
    if (warning_trim_fraction < 0.0f || warning_trim_fraction > 1.0f) return false;
    if (critical_trim_fraction < 0.0f || critical_trim_fraction > 1.0f) return false;

    // Critical must trim at least as hard as Warning
    return critical_trim_fraction >= warning_trim_fraction;
}

// ============================================================================
// Constructor
// ============================================================================

Reconciler::Reconciler()
    : config_(Config{}) {
}

Reconciler::Reconciler(const Config& config)
    : config_(config) {

    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid Reconciler configuration");
    }
}

// ============================================================================
// Reconcile Pass
// ============================================================================

std::vector<FollowUpIntent> Reconciler::Reconcile(LifecycleStateStore& store,
                                                  ResourceHandleTable& table,
                                                  BackpressureController& backpressure,
                                                  EffectSink& effects,
                                                  ResourceOutcomeQueue& outcomes,
                                                  Timestamp now) {
    EffectSink::PhaseScope phase(effects);

    stats_ = PassStats{};
    std::vector<FollowUpIntent> follow_ups;

    // Outcomes posted during this pass belong to the next one
    std::vector<ResourceOutcome> events = outcomes.Drain();

    Housekeep(store, table, backpressure, effects);

    // Steps 1 and 2
    IssueCreates(store, table, backpressure, effects, now, follow_ups);
    IssueDestroys(store, table, effects);

    // Steps 3 and 4, in arrival order
    for (const auto& event : events) {
        std::visit([&](const auto& outcome) {
            using T = std::decay_t<decltype(outcome)>;
            if constexpr (std::is_same_v<T, CreationOutcome>) {
                HandleCreationOutcome(outcome, store, table, backpressure, effects, now, follow_ups);
            } else if constexpr (std::is_same_v<T, DestroyConfirmation>) {
                HandleDestroyConfirmation(outcome, store, table);
            } else {
                HandleCrash(outcome, store, table, backpressure, now, follow_ups);
            }
        }, event);
    }

    ExpireTimedOutCreates(store, table, backpressure, now, follow_ups);

    // Step 5
    ApplyMemoryPressure(store, table, now);
    if (stats_.pressure_demotions > 0) {
        // Nodes trimmed to Cold release their resource and backoff in this pass
        IssueDestroys(store, table, effects);
        ClearUnwantedBackpressure(store, backpressure);
    }

    return follow_ups;
}

// ============================================================================
// Housekeeping
// ============================================================================

void Reconciler::Housekeep(LifecycleStateStore& store, ResourceHandleTable& table,
                           BackpressureController& backpressure, EffectSink& effects) {
    for (NodeID id : store.TakeBackpressureResets()) {
        backpressure.Clear(id);
    }

    ClearUnwantedBackpressure(store, backpressure);

    std::vector<ResourceHandle> orphans;
    orphans.swap(orphans_to_destroy_);
    for (ResourceHandle handle : orphans) {
        DestroyOrphan(handle, effects);
    }

    for (NodeID id : table.AllNodes()) {
        if (store.Contains(id)) {
            continue;
        }
        switch (table.GetState(id)) {
            case MappingState::MAPPED:
                Destroy(id, table, effects);
                break;
            case MappingState::UNMAPPED:
                table.Erase(id);
                break;
            default:
                // Resolved by the pending outcome
                break;
        }
    }
}

void Reconciler::ClearUnwantedBackpressure(const LifecycleStateStore& store,
                                           BackpressureController& backpressure) {
    // Nodes the user backed away from stop retrying
    for (NodeID id : backpressure.BlockedNodes()) {
        if (!WantsResource(store, id)) {
            backpressure.Clear(id);
        }
    }
}

// ============================================================================
// Effects
// ============================================================================

void Reconciler::IssueCreates(const LifecycleStateStore& store, ResourceHandleTable& table,
                              BackpressureController& backpressure, EffectSink& effects,
                              Timestamp now, std::vector<FollowUpIntent>& follow_ups) {
    std::vector<NodeID> wanted = store.IterActive();
    std::vector<NodeID> warm = store.IterWarm();
    wanted.insert(wanted.end(), warm.begin(), warm.end());

    for (NodeID id : wanted) {
        if (table.GetState(id) != MappingState::UNMAPPED) {
            continue;
        }
        if (!backpressure.IsRetryEligible(id, now)) {
            ++stats_.skipped_backoff;
            continue;
        }

        auto ticket = table.BeginCreate(id, now);
        if (!ticket) {
            continue;
        }
        if (backpressure.IsBlocked(id)) {
            backpressure.MarkRetryIssued(id);
        }

        if (!effects.IssueCreate(id, *ticket)) {
            // Nothing will ever resolve this ticket
            ++stats_.rejected_effects;
            ++stats_.creation_failures;
            table.AbandonCreate(id);
            if (config_.log_warnings) {
                std::cerr << "Backend rejected create for " << id.ToString()
                          << ": " << effects.LastError() << std::endl;
            }
            RecordFailure(id, CreationError::BACKEND_REJECTED, backpressure, now, follow_ups);
            continue;
        }
        ++stats_.creates_issued;
    }
}

void Reconciler::IssueDestroys(const LifecycleStateStore& store, ResourceHandleTable& table,
                               EffectSink& effects) {
    for (NodeID id : table.NodesInState(MappingState::MAPPED)) {
        auto tier = store.GetTier(id);
        if (tier && *tier == LifecycleTier::COLD) {
            Destroy(id, table, effects);
        }
    }
}

void Reconciler::Destroy(NodeID id, ResourceHandleTable& table, EffectSink& effects) {
    auto handle = table.BeginDestroy(id);
    if (!handle) {
        return;
    }
    if (!effects.IssueDestroy(*handle)) {
        // Back to MAPPED so a later pass issues the destroy again
        ++stats_.rejected_effects;
        table.AbortDestroy(id);
        if (config_.log_warnings) {
            std::cerr << "Backend rejected destroy of " << handle->ToString()
                      << " for " << id.ToString() << ": " << effects.LastError() << std::endl;
        }
        return;
    }
    ++stats_.destroys_issued;
}

void Reconciler::DestroyOrphan(ResourceHandle handle, EffectSink& effects) {
    if (!effects.IssueDestroy(handle)) {
        ++stats_.rejected_effects;
        orphans_to_destroy_.push_back(handle);
        if (config_.log_warnings) {
            std::cerr << "Backend rejected destroy of orphan " << handle.ToString()
                      << ": " << effects.LastError() << std::endl;
        }
        return;
    }
    ++stats_.destroys_issued;
    ++stats_.orphan_destroys;
}

// ============================================================================
// Outcome Events
// ============================================================================

void Reconciler::HandleCreationOutcome(const CreationOutcome& outcome,
                                       const LifecycleStateStore& store,
                                       ResourceHandleTable& table,
                                       BackpressureController& backpressure,
                                       EffectSink& effects,
                                       Timestamp now,
                                       std::vector<FollowUpIntent>& follow_ups) {
    const RuntimeResourceMapping* mapping = table.Find(outcome.node_id);
    bool current = mapping != nullptr &&
                   mapping->mapping_state == MappingState::CREATE_PENDING &&
                   mapping->create_ticket == outcome.ticket;

    if (!current) {
        // Timed-out or superseded attempt: a late resource has no owner
        ++stats_.stale_outcomes;
        if (outcome.Succeeded()) {
            table.TrackOrphan(*outcome.handle);
            DestroyOrphan(*outcome.handle, effects);
        }
        if (config_.log_warnings) {
            std::cerr << "Stale creation outcome for " << outcome.node_id.ToString()
                      << " (ticket " << outcome.ticket << ")" << std::endl;
        }
        return;
    }

    bool cancelled = mapping->cancel_on_resolve;
    bool wanted = WantsResource(store, outcome.node_id) && !cancelled;

    if (outcome.Succeeded() && table.CompleteCreate(outcome.node_id, *outcome.handle)) {
        ++stats_.creates_confirmed;
        backpressure.Clear(outcome.node_id);

        // Create-then-immediately-destroy: the node went Cold, was removed
        // or was cancelled while the create was in flight
        if (!wanted) {
            Destroy(outcome.node_id, table, effects);
            if (cancelled) {
                ++stats_.cancelled_creates;
            }
        }
        return;
    }

    CreationError error = outcome.error;
    if (outcome.Succeeded()) {
        // Invalid handle, or one already bound to another node
        if (config_.log_warnings) {
            std::cerr << "Rejected handle " << outcome.handle->ToString()
                      << " for " << outcome.node_id.ToString() << std::endl;
        }
        error = CreationError::BACKEND_REJECTED;
    }

    table.AbandonCreate(outcome.node_id);
    ++stats_.creation_failures;

    if (!store.Contains(outcome.node_id)) {
        table.Erase(outcome.node_id);
        backpressure.Clear(outcome.node_id);
        return;
    }
    if (!wanted) {
        backpressure.Clear(outcome.node_id);
        return;
    }

    RecordFailure(outcome.node_id, error, backpressure, now, follow_ups);
}

void Reconciler::HandleDestroyConfirmation(const DestroyConfirmation& confirmation,
                                           const LifecycleStateStore& store,
                                           ResourceHandleTable& table) {
    if (table.ConfirmOrphan(confirmation.handle)) {
        return;
    }

    auto id = table.ConfirmDestroy(confirmation.handle);
    if (!id) {
        ++stats_.stale_outcomes;
        if (config_.log_warnings) {
            std::cerr << "Destroy confirmation for unknown "
                      << confirmation.handle.ToString() << std::endl;
        }
        return;
    }

    ++stats_.destroys_confirmed;
    if (!store.Contains(*id)) {
        table.Erase(*id);
    }
}

void Reconciler::HandleCrash(const ResourceCrashed& crash,
                             const LifecycleStateStore& store,
                             ResourceHandleTable& table,
                             BackpressureController& backpressure,
                             Timestamp now,
                             std::vector<FollowUpIntent>& follow_ups) {
    auto id = table.NodeForHandle(crash.handle);
    if (!id) {
        ++stats_.stale_outcomes;
        return;
    }

    switch (table.GetState(*id)) {
        case MappingState::MAPPED:
            table.ReleaseLost(*id);
            ++stats_.crashes;
            if (!store.Contains(*id)) {
                table.Erase(*id);
            } else if (WantsResource(store, *id)) {
                RecordFailure(*id, CreationError::CRASHED, backpressure, now, follow_ups);
            }
            break;
        case MappingState::DESTROY_PENDING:
            // Died while being torn down: same end state as a confirmation
            HandleDestroyConfirmation(DestroyConfirmation{crash.handle}, store, table);
            break;
        default:
            ++stats_.stale_outcomes;
            break;
    }
}

void Reconciler::ExpireTimedOutCreates(const LifecycleStateStore& store,
                                       ResourceHandleTable& table,
                                       BackpressureController& backpressure,
                                       Timestamp now,
                                       std::vector<FollowUpIntent>& follow_ups) {
    for (NodeID id : table.NodesInState(MappingState::CREATE_PENDING)) {
        const RuntimeResourceMapping* mapping = table.Find(id);
        if (now - mapping->create_started_at < config_.creation_timeout) {
            continue;
        }

        bool cancelled = mapping->cancel_on_resolve;
        table.AbandonCreate(id);
        ++stats_.creation_timeouts;

        if (!store.Contains(id)) {
            table.Erase(id);
            backpressure.Clear(id);
        } else if (cancelled || !WantsResource(store, id)) {
            backpressure.Clear(id);
        } else {
            RecordFailure(id, CreationError::TIMEOUT, backpressure, now, follow_ups);
        }
    }
}

// ============================================================================
// Memory Pressure
// ============================================================================

void Reconciler::ApplyMemoryPressure(LifecycleStateStore& store, ResourceHandleTable& table,
                                     Timestamp now) {
    MemoryPressureLevel level = store.TakeMemoryPressure();
    stats_.pressure = level;

    if (level != MemoryPressureLevel::WARNING && level != MemoryPressureLevel::CRITICAL) {
        return;
    }

    bool critical = level == MemoryPressureLevel::CRITICAL;
    float fraction = critical ? config_.critical_trim_fraction : config_.warning_trim_fraction;
    TransitionCause cause = critical ? TransitionCause::MEMORY_PRESSURE_CRITICAL
                                     : TransitionCause::MEMORY_PRESSURE_WARNING;

    const CapacityPolicy& policy = store.GetCapacityPolicy();
    auto is_pinned = [&store](NodeID id) { return store.IsPinned(id); };

    // Both tiers shrink by the fraction of their size at signal time. Warm
    // absorbs the Active victims first, so it is trimmed down to its target
    // size rather than by a fixed count.
    size_t active_trim = CapacityPolicy::TrimCount(store.ActiveSequence().Size(), fraction);
    size_t warm_size = store.WarmSequence().Size();
    size_t warm_target = warm_size - CapacityPolicy::TrimCount(warm_size, fraction);

    for (NodeID id : policy.SelectTrimVictims(store.ActiveSequence(), active_trim, is_pinned)) {
        store.SetTier(id, LifecycleTier::WARM, cause, now);
        ++stats_.pressure_demotions;
    }

    size_t warm_now = store.WarmSequence().Size();
    size_t warm_trim = warm_now > warm_target ? warm_now - warm_target : 0;
    for (NodeID id : policy.SelectTrimVictims(store.WarmSequence(), warm_trim, is_pinned)) {
        store.SetTier(id, LifecycleTier::COLD, cause, now);
        ++stats_.pressure_demotions;
    }

    if (critical) {
        for (NodeID id : table.NodesInState(MappingState::CREATE_PENDING)) {
            if (!store.IsPinned(id)) {
                table.MarkCancelOnResolve(id);
            }
        }
    }
}

// ============================================================================
// Helpers
// ============================================================================

void Reconciler::RecordFailure(NodeID id, CreationError error,
                               BackpressureController& backpressure,
                               Timestamp now,
                               std::vector<FollowUpIntent>& follow_ups) {
    BlockedRecord record = backpressure.RecordFailure(id, now, error);

    FollowUpIntent report;
    report.node_id = id;
    report.error = error;
    report.retry_count = record.retry_count;
    report.terminal = backpressure.IsTerminal(id);
    follow_ups.push_back(report);
}

bool Reconciler::WantsResource(const LifecycleStateStore& store, NodeID id) {
    auto tier = store.GetTier(id);
    return tier.has_value() && *tier != LifecycleTier::COLD;
}

} // namespace lrec
