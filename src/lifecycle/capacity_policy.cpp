// File: src/lifecycle/capacity_policy.cpp
#include "lifecycle/capacity_policy.hpp"
#include <stdexcept>
#include <cmath>
#include <algorithm>

namespace lrec {

bool CapacityPolicy::Config::IsValid() const {
    // Zero is allowed: every promotion into the tier demotes itself
    return active_capacity <= kMaxTierCapacity && warm_capacity <= kMaxTierCapacity;
}

CapacityPolicy::CapacityPolicy()
    : config_(Config{}) {
}

CapacityPolicy::CapacityPolicy(const Config& config)
    : config_(config) {

    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid CapacityPolicy configuration");
    }
}

size_t CapacityPolicy::CapacityFor(LifecycleTier tier) const {
    switch (tier) {
        case LifecycleTier::ACTIVE:
            return config_.active_capacity;
        case LifecycleTier::WARM:
            return config_.warm_capacity;
        case LifecycleTier::COLD:
        default:
            return std::numeric_limits<size_t>::max();
    }
}

std::optional<LifecycleTier> CapacityPolicy::OverflowTarget(LifecycleTier tier) {
    switch (tier) {
        case LifecycleTier::ACTIVE:
            return LifecycleTier::WARM;
        case LifecycleTier::WARM:
            return LifecycleTier::COLD;
        default:
            return std::nullopt;
    }
}

TransitionCause CapacityPolicy::OverflowCause(LifecycleTier tier) {
    return tier == LifecycleTier::ACTIVE
        ? TransitionCause::ACTIVE_CAPACITY_OVERFLOW
        : TransitionCause::WARM_CAPACITY_OVERFLOW;
}

std::optional<NodeID> CapacityPolicy::SelectEvictionCandidate(
    const RecencyList<NodeID>& sequence,
    const PinnedPredicate& is_pinned) const {

    for (auto it = sequence.rbegin(); it != sequence.rend(); ++it) {
        if (!is_pinned(*it)) {
            return *it;
        }
    }
    return std::nullopt;
}

size_t CapacityPolicy::TrimCount(size_t tier_size, float fraction) {
    if (tier_size == 0 || fraction <= 0.0f) {
        return 0;
    }
    if (fraction >= 1.0f) {
        return tier_size;
    }

    // Absorb float noise so that 10 * 0.1f trims one member, not two
    double exact = static_cast<double>(tier_size) * static_cast<double>(fraction);
    auto count = static_cast<size_t>(std::ceil(exact - 1e-6));
    return std::min(count, tier_size);
}

std::vector<NodeID> CapacityPolicy::SelectTrimVictims(
    const RecencyList<NodeID>& sequence,
    size_t count,
    const PinnedPredicate& is_pinned) const {

    std::vector<NodeID> victims;
    if (count == 0) {
        return victims;
    }

    victims.reserve(count);
    for (auto it = sequence.rbegin(); it != sequence.rend() && victims.size() < count; ++it) {
        if (!is_pinned(*it)) {
            victims.push_back(*it);
        }
    }
    return victims;
}

} // namespace lrec
