// File: src/intent/intent.hpp
//
// Intent stream consumed by the Intent Reducer
//
// Intents are plain values. Each one maps to exactly one store mutation,
// one Phase 2 signal, or (for FollowUpIntent) a passthrough to the host's
// diagnostics listener.

#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace lrec {

/// Create the record of a node that joined the graph
struct AddNode {
    NodeID node_id;
    TransitionCause cause{TransitionCause::WORKSPACE_RETENTION};
    std::optional<LifecycleTier> tier;   ///< Defaults from cause when unset
    bool pinned{false};                  ///< Pinned before any later promotion
};

/// Declare the tier a node should converge to
struct SetDesiredTier {
    NodeID node_id;
    LifecycleTier tier{LifecycleTier::COLD};
    TransitionCause cause{TransitionCause::USER_FOCUS};
};

/// Delete a node's record (node removed from the graph)
struct RemoveNode {
    NodeID node_id;
};

/// Host memory pressure observed this frame
struct MemoryPressureSignal {
    MemoryPressureLevel severity{MemoryPressureLevel::UNKNOWN};
};

/// Explicit request to retry a blocked node (clears terminal failure)
struct RetryNode {
    NodeID node_id;
};

/// Diagnostic report request emitted by the reconciler
struct FollowUpIntent {
    NodeID node_id;
    CreationError error{CreationError::BACKEND_REJECTED};
    uint32_t retry_count{0};
    bool terminal{false};

    std::string ToString() const;
};

using Intent = std::variant<AddNode, SetDesiredTier, RemoveNode,
                            MemoryPressureSignal, RetryNode, FollowUpIntent>;

/// One-line description of an intent for logs and the CLI
std::string Describe(const Intent& intent);

} // namespace lrec
