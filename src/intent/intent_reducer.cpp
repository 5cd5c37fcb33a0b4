// File: src/intent/intent_reducer.cpp
#include "intent/intent_reducer.hpp"
#include <sstream>
#include <type_traits>
#include <utility>

namespace lrec {

const char* ToString(IntentErrorCode code) {
    switch (code) {
        case IntentErrorCode::UNKNOWN_NODE: return "UnknownNode";
        case IntentErrorCode::DUPLICATE_NODE: return "DuplicateNode";
        case IntentErrorCode::INVALID_NODE: return "InvalidNode";
        default: return "Unknown";
    }
}

std::string IntentError::ToString() const {
    std::ostringstream oss;
    oss << lrec::ToString(code) << " at intent #" << index << ": " << intent;
    return oss.str();
}

namespace {

/// Applies a single intent variant to the store
struct IntentApplier {
    LifecycleStateStore& store;
    Timestamp now;
    std::vector<FollowUpIntent>* forwarded;

    std::optional<IntentErrorCode> operator()(const AddNode& intent) const {
        if (!intent.node_id.IsValid()) {
            return IntentErrorCode::INVALID_NODE;
        }
        LifecycleTier tier = intent.tier.value_or(DefaultTierForCause(intent.cause));
        if (!store.AddNode(intent.node_id, tier, intent.cause, now)) {
            return IntentErrorCode::DUPLICATE_NODE;
        }
        if (intent.pinned) {
            store.SetPinned(intent.node_id, true, now);
        }
        return std::nullopt;
    }

    std::optional<IntentErrorCode> operator()(const SetDesiredTier& intent) const {
        auto previous = store.GetTier(intent.node_id);
        if (!previous) {
            return IntentErrorCode::UNKNOWN_NODE;
        }

        store.SetTier(intent.node_id, intent.tier, intent.cause, now);

        // Only a real tier change lifts backpressure; a repeated request
        // refreshes recency and nothing else
        if (*previous != intent.tier) {
            store.RequestBackpressureReset(intent.node_id);
        }
        return std::nullopt;
    }

    std::optional<IntentErrorCode> operator()(const RemoveNode& intent) const {
        if (!store.Remove(intent.node_id)) {
            return IntentErrorCode::UNKNOWN_NODE;
        }
        return std::nullopt;
    }

    std::optional<IntentErrorCode> operator()(const MemoryPressureSignal& intent) const {
        store.RecordMemoryPressure(intent.severity);
        return std::nullopt;
    }

    std::optional<IntentErrorCode> operator()(const RetryNode& intent) const {
        if (!store.Contains(intent.node_id)) {
            return IntentErrorCode::UNKNOWN_NODE;
        }
        store.RequestBackpressureReset(intent.node_id);
        return std::nullopt;
    }

    std::optional<IntentErrorCode> operator()(const FollowUpIntent& intent) const {
        if (forwarded) {
            forwarded->push_back(intent);
        }
        return std::nullopt;
    }
};

} // namespace

ApplyReport IntentReducer::Apply(const std::vector<Intent>& intents,
                                 LifecycleStateStore& store,
                                 Timestamp now) const {
    ApplyReport report;

    for (size_t i = 0; i < intents.size(); ++i) {
        auto error = ApplyOne(intents[i], store, now, &report.forwarded);
        if (error) {
            IntentError rejected;
            rejected.index = i;
            rejected.code = *error;
            rejected.node_id = std::visit(
                [](const auto& intent) -> NodeID {
                    using T = std::decay_t<decltype(intent)>;
                    if constexpr (std::is_same_v<T, MemoryPressureSignal>) {
                        return NodeID();
                    } else {
                        return intent.node_id;
                    }
                },
                intents[i]);
            rejected.intent = Describe(intents[i]);
            report.errors.push_back(std::move(rejected));
        } else {
            ++report.applied;
        }
    }

    return report;
}

std::optional<IntentErrorCode> IntentReducer::ApplyOne(const Intent& intent,
                                                       LifecycleStateStore& store,
                                                       Timestamp now,
                                                       std::vector<FollowUpIntent>* forwarded) const {
    return std::visit(IntentApplier{store, now, forwarded}, intent);
}

} // namespace lrec
