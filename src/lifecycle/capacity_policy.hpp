// File: src/lifecycle/capacity_policy.hpp
//
// Capacity Policy for the Active and Warm tiers
//
// Both live tiers are bounded, recency-ordered sequences. When a sequence
// grows past its capacity the least-recently-promoted entry that is not
// pinned is forced one tier down:
//
//   Active overflow:  tail(Active) -> Warm   (ACTIVE_CAPACITY_OVERFLOW)
//   Warm overflow:    tail(Warm)   -> Cold   (WARM_CAPACITY_OVERFLOW)
//
// If every member of an overflowing sequence is pinned the overflow is
// accepted and capacity becomes a soft bound.
//
// Memory pressure trimming uses the same tail-first, pinned-skipping
// selection with a count proportional to the tier size.

#pragma once

#include "lifecycle/recency_list.hpp"
#include "core/types.hpp"
#include <functional>
#include <optional>
#include <vector>
#include <limits>

namespace lrec {

class CapacityPolicy {
public:
    /// Predicate answering whether a node is pinned
    using PinnedPredicate = std::function<bool(NodeID)>;

    struct Config {
        size_t active_capacity{4};     ///< Max nodes in the Active sequence
        size_t warm_capacity{12};      ///< Max nodes in the Warm sequence

        /// Validate configuration
        bool IsValid() const;
    };

    /// Upper bound accepted for either capacity
    static constexpr size_t kMaxTierCapacity = 1u << 20;

    CapacityPolicy();

    explicit CapacityPolicy(const Config& config);

    /// Capacity of a tier; Cold is unbounded
    size_t CapacityFor(LifecycleTier tier) const;

    /// Tier an overflowing tier demotes into (nullopt for Cold)
    static std::optional<LifecycleTier> OverflowTarget(LifecycleTier tier);

    /// Cause recorded for an overflow demotion out of `tier`
    static TransitionCause OverflowCause(LifecycleTier tier);

    /// Pick the least-recently-promoted non-pinned member
    ///
    /// @param sequence Recency-ordered tier membership
    /// @param is_pinned Pinned lookup
    /// @return Candidate, or nullopt if every member is pinned
    std::optional<NodeID> SelectEvictionCandidate(
        const RecencyList<NodeID>& sequence,
        const PinnedPredicate& is_pinned) const;

    /// Number of members to trim for a fraction of a tier (rounded up)
    ///
    /// @param tier_size Current membership count
    /// @param fraction Share to trim in [0, 1]
    static size_t TrimCount(size_t tier_size, float fraction);

    /// Pick up to `count` non-pinned members, tail first
    std::vector<NodeID> SelectTrimVictims(
        const RecencyList<NodeID>& sequence,
        size_t count,
        const PinnedPredicate& is_pinned) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace lrec
