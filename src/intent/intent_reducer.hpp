// File: src/intent/intent_reducer.hpp
//
// Intent Reducer (Phase 1)
//
// Turns the frame's intents into Lifecycle State Store mutations, in
// arrival order. It never creates, destroys or queries a resource handle.
// Intents naming an unknown node are reported back as errors, not dropped
// silently and not thrown.

#pragma once

#include "intent/intent.hpp"
#include "lifecycle/lifecycle_state_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lrec {

enum class IntentErrorCode : uint8_t {
    UNKNOWN_NODE = 0,     ///< Intent names a node with no record
    DUPLICATE_NODE = 1,   ///< AddNode for a node that already has a record
    INVALID_NODE = 2,     ///< Intent carries an invalid node id
};

const char* ToString(IntentErrorCode code);

/// A rejected intent
struct IntentError {
    size_t index{0};          ///< Position of the intent in the applied batch
    IntentErrorCode code{IntentErrorCode::UNKNOWN_NODE};
    NodeID node_id;
    std::string intent;       ///< Describe() of the rejected intent

    std::string ToString() const;
};

/// Outcome of applying one batch of intents
struct ApplyReport {
    size_t applied{0};
    std::vector<IntentError> errors;

    /// FollowUpIntents passed through untouched
    std::vector<FollowUpIntent> forwarded;

    bool Ok() const { return errors.empty(); }
};

class IntentReducer {
public:
    /// Apply intents in order
    ///
    /// @param intents This frame's intents, in arrival order
    /// @param store Store to mutate
    /// @param now Transition time recorded on changed records
    /// @return Applied count, rejected intents and forwarded follow-ups
    ApplyReport Apply(const std::vector<Intent>& intents,
                      LifecycleStateStore& store,
                      Timestamp now = Timestamp::Now()) const;

    /// Apply one intent
    ///
    /// @return Error code if the intent was rejected
    std::optional<IntentErrorCode> ApplyOne(const Intent& intent,
                                            LifecycleStateStore& store,
                                            Timestamp now,
                                            std::vector<FollowUpIntent>* forwarded = nullptr) const;
};

} // namespace lrec
