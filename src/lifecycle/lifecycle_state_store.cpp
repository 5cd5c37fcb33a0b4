// File: src/lifecycle/lifecycle_state_store.cpp
//
// Implementation of Lifecycle State Store

#include "lifecycle/lifecycle_state_store.hpp"
#include <algorithm>
#include <stdexcept>
#include <iostream>

namespace lrec {

// ============================================================================
// Constructor
// ============================================================================

LifecycleStateStore::LifecycleStateStore()
    : config_(Config{}), policy_(config_.capacity) {
}

LifecycleStateStore::LifecycleStateStore(const Config& config)
    : config_(config), policy_(config.capacity) {

    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid LifecycleStateStore configuration");
    }
}

// ============================================================================
// Records
// ============================================================================

bool LifecycleStateStore::AddNode(NodeID id, LifecycleTier tier, TransitionCause cause,
                                  Timestamp now) {
    if (records_.count(id) > 0) {
        return false;
    }

    DesiredLifecycleRecord record;
    record.node_id = id;
    record.tier = LifecycleTier::COLD;
    record.cause = cause;
    record.last_transition_at = now;

    auto& stored = records_.emplace(id, record).first->second;
    if (tier != LifecycleTier::COLD) {
        MoveToTier(stored, tier, cause, now);
        EnforceCapacity(tier, now);
    }
    return true;
}

bool LifecycleStateStore::SetTier(NodeID id, LifecycleTier tier, TransitionCause cause,
                                  Timestamp now) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }

    DesiredLifecycleRecord& record = it->second;
    if (record.tier == tier) {
        // Same tier: recency refresh only
        if (auto* sequence = Sequence(tier)) {
            sequence->Touch(id);
        }
        return true;
    }

    if (IsForcedDemotionCause(cause) && IsLivelier(record.tier, tier)) {
        forced_demotions_.push_back(ForcedDemotion{id, record.tier, tier, cause});
    }

    MoveToTier(record, tier, cause, now);
    if (tier != LifecycleTier::COLD) {
        EnforceCapacity(tier, now);
    }
    return true;
}

bool LifecycleStateStore::Remove(NodeID id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }

    active_.Remove(id);
    warm_.Remove(id);
    records_.erase(it);
    return true;
}

bool LifecycleStateStore::Contains(NodeID id) const {
    return records_.count(id) > 0;
}

const DesiredLifecycleRecord* LifecycleStateStore::Find(NodeID id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

std::optional<LifecycleTier> LifecycleStateStore::GetTier(NodeID id) const {
    const DesiredLifecycleRecord* record = Find(id);
    if (!record) {
        return std::nullopt;
    }
    return record->tier;
}

std::vector<NodeID> LifecycleStateStore::AllNodes() const {
    std::vector<NodeID> nodes;
    nodes.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        nodes.push_back(id);
    }
    return nodes;
}

// ============================================================================
// Pinning
// ============================================================================

bool LifecycleStateStore::SetPinned(NodeID id, bool pinned, Timestamp now) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }

    bool was_pinned = it->second.pinned;
    it->second.pinned = pinned;

    // Overflow accepted under pinning can now be resolved
    if (was_pinned && !pinned) {
        EnforceCapacity(LifecycleTier::ACTIVE, now);
        EnforceCapacity(LifecycleTier::WARM, now);
    }
    return true;
}

bool LifecycleStateStore::IsPinned(NodeID id) const {
    const DesiredLifecycleRecord* record = Find(id);
    return record != nullptr && record->pinned;
}

// ============================================================================
// Tier Views
// ============================================================================

std::vector<NodeID> LifecycleStateStore::IterCold() const {
    std::vector<NodeID> cold;
    for (const auto& [id, record] : records_) {
        if (record.tier == LifecycleTier::COLD) {
            cold.push_back(id);
        }
    }
    std::sort(cold.begin(), cold.end());
    return cold;
}

// ============================================================================
// Phase Signals
// ============================================================================

void LifecycleStateStore::RecordMemoryPressure(MemoryPressureLevel level) {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(pending_pressure_)) {
        pending_pressure_ = level;
    }
}

MemoryPressureLevel LifecycleStateStore::TakeMemoryPressure() {
    MemoryPressureLevel level = pending_pressure_;
    pending_pressure_ = MemoryPressureLevel::UNKNOWN;
    return level;
}

void LifecycleStateStore::RequestBackpressureReset(NodeID id) {
    backpressure_resets_.push_back(id);
}

std::vector<NodeID> LifecycleStateStore::TakeBackpressureResets() {
    std::vector<NodeID> resets;
    resets.swap(backpressure_resets_);
    return resets;
}

std::vector<ForcedDemotion> LifecycleStateStore::TakeForcedDemotions() {
    std::vector<ForcedDemotion> demotions;
    demotions.swap(forced_demotions_);
    return demotions;
}

size_t LifecycleStateStore::TakePinnedOverflowCount() {
    size_t count = pinned_overflow_count_;
    pinned_overflow_count_ = 0;
    return count;
}

// ============================================================================
// Helper Methods
// ============================================================================

RecencyList<NodeID>* LifecycleStateStore::Sequence(LifecycleTier tier) {
    switch (tier) {
        case LifecycleTier::ACTIVE:
            return &active_;
        case LifecycleTier::WARM:
            return &warm_;
        default:
            return nullptr;
    }
}

void LifecycleStateStore::MoveToTier(DesiredLifecycleRecord& record, LifecycleTier tier,
                                     TransitionCause cause, Timestamp now) {
    if (auto* old_sequence = Sequence(record.tier)) {
        old_sequence->Remove(record.node_id);
    }

    record.tier = tier;
    record.cause = cause;
    record.last_transition_at = now;

    if (auto* new_sequence = Sequence(tier)) {
        new_sequence->Touch(record.node_id);
    }
}

void LifecycleStateStore::EnforceCapacity(LifecycleTier tier, Timestamp now) {
    auto is_pinned = [this](NodeID id) { return IsPinned(id); };

    // Active overflow feeds Warm, Warm overflow feeds Cold. Each demotion
    // shrinks the sequence it leaves, so the walk ends after at most one
    // demotion per known node.
    for (std::optional<LifecycleTier> current = tier;
         current && *current != LifecycleTier::COLD;
         current = CapacityPolicy::OverflowTarget(*current)) {

        RecencyList<NodeID>* sequence = Sequence(*current);
        size_t capacity = policy_.CapacityFor(*current);
        LifecycleTier target = *CapacityPolicy::OverflowTarget(*current);
        TransitionCause cause = CapacityPolicy::OverflowCause(*current);

        while (sequence->Size() > capacity) {
            auto candidate = policy_.SelectEvictionCandidate(*sequence, is_pinned);
            if (!candidate) {
                ++pinned_overflow_count_;
                if (config_.log_warnings) {
                    std::cerr << "CapacityFullyPinned: " << ToString(*current)
                              << " tier holds " << sequence->Size()
                              << " pinned nodes (capacity " << capacity << ")" << std::endl;
                }
                break;
            }

            DesiredLifecycleRecord& victim = records_.at(*candidate);
            forced_demotions_.push_back(ForcedDemotion{*candidate, *current, target, cause});
            MoveToTier(victim, target, cause, now);
        }
    }
}

} // namespace lrec
