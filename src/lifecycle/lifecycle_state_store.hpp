// File: src/lifecycle/lifecycle_state_store.hpp
//
// Lifecycle State Store
//
// Owns one DesiredLifecycleRecord per known node together with the two
// recency-ordered tier sequences (Active, Warm). Cold membership is
// implicit: every known node in neither sequence.
//
// Capacity is enforced inside SetTier as a post-condition: an overflowing
// sequence demotes its least-recently-promoted non-pinned member, and the
// demotion may cascade Active -> Warm -> Cold.
//
// The store also carries the per-frame signals Phase 1 leaves for Phase 2:
// the strongest memory pressure signal and backpressure reset requests.

#pragma once

#include "lifecycle/capacity_policy.hpp"
#include "lifecycle/recency_list.hpp"
#include "core/types.hpp"
#include <unordered_map>
#include <optional>
#include <vector>

namespace lrec {

/// Desired lifecycle of one node
struct DesiredLifecycleRecord {
    NodeID node_id;
    LifecycleTier tier{LifecycleTier::COLD};
    TransitionCause cause{TransitionCause::WORKSPACE_RETENTION};
    Timestamp last_transition_at;

    /// Set by the host, read-only inside the engine
    bool pinned{false};

    bool operator==(const DesiredLifecycleRecord& other) const {
        return node_id == other.node_id && tier == other.tier &&
               cause == other.cause && last_transition_at == other.last_transition_at &&
               pinned == other.pinned;
    }
};

/// A demotion the store forced on its own (capacity overflow or trim)
struct ForcedDemotion {
    NodeID node_id;
    LifecycleTier from{LifecycleTier::ACTIVE};
    LifecycleTier to{LifecycleTier::WARM};
    TransitionCause cause{TransitionCause::ACTIVE_CAPACITY_OVERFLOW};
};

class LifecycleStateStore {
public:
    struct Config {
        CapacityPolicy::Config capacity;

        /// Print CapacityFullyPinned warnings to stderr
        bool log_warnings{true};

        bool IsValid() const { return capacity.IsValid(); }
    };

    LifecycleStateStore();

    explicit LifecycleStateStore(const Config& config);

    // ========================================================================
    // Records
    // ========================================================================

    /// Create the record for a new node and enforce capacity
    ///
    /// @return false if the node already has a record
    bool AddNode(NodeID id, LifecycleTier tier, TransitionCause cause,
                 Timestamp now = Timestamp::Now());

    /// Set the desired tier of a node
    ///
    /// Moves the node to the head of its new sequence. Setting the tier it
    /// already has only refreshes recency; the record is left untouched.
    ///
    /// @return false if the node is unknown
    bool SetTier(NodeID id, LifecycleTier tier, TransitionCause cause,
                 Timestamp now = Timestamp::Now());

    /// Delete a node's record and sequence membership
    ///
    /// @return false if the node is unknown
    bool Remove(NodeID id);

    bool Contains(NodeID id) const;

    /// Record of a node, or nullptr if unknown
    const DesiredLifecycleRecord* Find(NodeID id) const;

    std::optional<LifecycleTier> GetTier(NodeID id) const;

    size_t Size() const { return records_.size(); }

    /// Every known node, in no particular order
    std::vector<NodeID> AllNodes() const;

    // ========================================================================
    // Pinning (written by the host only)
    // ========================================================================

    /// Pin or unpin a node; unpinning re-applies capacity limits
    ///
    /// @return false if the node is unknown
    bool SetPinned(NodeID id, bool pinned, Timestamp now = Timestamp::Now());

    bool IsPinned(NodeID id) const;

    // ========================================================================
    // Tier Views
    // ========================================================================

    /// Active members, most recently promoted first
    std::vector<NodeID> IterActive() const { return active_.ToVector(); }

    /// Warm members, most recently promoted first
    std::vector<NodeID> IterWarm() const { return warm_.ToVector(); }

    /// Cold members, ordered by node id
    std::vector<NodeID> IterCold() const;

    const RecencyList<NodeID>& ActiveSequence() const { return active_; }
    const RecencyList<NodeID>& WarmSequence() const { return warm_; }

    const CapacityPolicy& GetCapacityPolicy() const { return policy_; }

    // ========================================================================
    // Phase 1 -> Phase 2 Signals
    // ========================================================================

    /// Keep the strongest memory pressure signal of the frame
    void RecordMemoryPressure(MemoryPressureLevel level);

    MemoryPressureLevel PendingMemoryPressure() const { return pending_pressure_; }

    /// Return and reset the frame's memory pressure signal
    MemoryPressureLevel TakeMemoryPressure();

    /// Ask Phase 2 to clear a node's backpressure record
    void RequestBackpressureReset(NodeID id);

    std::vector<NodeID> TakeBackpressureResets();

    // ========================================================================
    // Diagnostics
    // ========================================================================

    /// Return and reset the forced demotions since the last call
    std::vector<ForcedDemotion> TakeForcedDemotions();

    /// Return and reset the number of fully pinned overflows
    size_t TakePinnedOverflowCount();

private:
    Config config_;
    CapacityPolicy policy_;

    std::unordered_map<NodeID, DesiredLifecycleRecord> records_;
    RecencyList<NodeID> active_;
    RecencyList<NodeID> warm_;

    MemoryPressureLevel pending_pressure_{MemoryPressureLevel::UNKNOWN};
    std::vector<NodeID> backpressure_resets_;

    std::vector<ForcedDemotion> forced_demotions_;
    size_t pinned_overflow_count_{0};

    RecencyList<NodeID>* Sequence(LifecycleTier tier);

    /// Move a node between sequences and update its record
    void MoveToTier(DesiredLifecycleRecord& record, LifecycleTier tier,
                    TransitionCause cause, Timestamp now);

    /// Demote overflow out of `tier` and cascade into lower tiers
    void EnforceCapacity(LifecycleTier tier, Timestamp now);
};

} // namespace lrec
