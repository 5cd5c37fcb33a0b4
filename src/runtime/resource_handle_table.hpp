// File: src/runtime/resource_handle_table.hpp
//
// Resource Handle Table
//
// Bidirectional mapping between node identity and runtime resource handle.
// Nodes never hold a handle directly; they reach it through this table,
// which is the single owner of every handle's lifetime.
//
// Mapping state machine (single writer: Phase 2):
//
//   UNMAPPED --BeginCreate--> CREATE_PENDING --CompleteCreate--> MAPPED
//       ^                          |                               |
//       |                     AbandonCreate                  BeginDestroy
//       |                          v                               v
//       +---------------------- UNMAPPED <--ConfirmDestroy-- DESTROY_PENDING
//
// AbortDestroy returns DESTROY_PENDING to MAPPED when the backend refused
// the destroy effect.
//
// A second create is never issued while one is CREATE_PENDING, so a node
// has at most one live resource at a time.

#pragma once

#include "core/types.hpp"
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <vector>

namespace lrec {

/// Ticket identifying one create effect
using CreateTicket = uint64_t;

/// Runtime mapping of one node that has had a resource
struct RuntimeResourceMapping {
    NodeID node_id;
    std::optional<ResourceHandle> resource_handle;
    MappingState mapping_state{MappingState::UNMAPPED};

    /// Ticket of the most recent create effect (0 = none)
    CreateTicket create_ticket{0};
    Timestamp create_started_at;

    /// Destroy the resource as soon as the pending create resolves
    bool cancel_on_resolve{false};
};

class ResourceHandleTable {
public:
    ResourceHandleTable() = default;

    // Handles are owned here; copying would duplicate ownership
    ResourceHandleTable(const ResourceHandleTable&) = delete;
    ResourceHandleTable& operator=(const ResourceHandleTable&) = delete;

    // ========================================================================
    // Lookup
    // ========================================================================

    /// Mapping of a node, or nullptr if the node never had one
    const RuntimeResourceMapping* Find(NodeID id) const;

    /// Mapping state (UNMAPPED for nodes without an entry)
    MappingState GetState(NodeID id) const;

    std::optional<NodeID> NodeForHandle(ResourceHandle handle) const;

    std::optional<ResourceHandle> HandleForNode(NodeID id) const;

    // ========================================================================
    // Transitions
    // ========================================================================

    /// UNMAPPED -> CREATE_PENDING
    ///
    /// @return Ticket for the create effect, or nullopt if not UNMAPPED
    std::optional<CreateTicket> BeginCreate(NodeID id, Timestamp now);

    /// CREATE_PENDING -> MAPPED, binding the handle
    ///
    /// @return false if the node is not CREATE_PENDING or the handle is bound
    bool CompleteCreate(NodeID id, ResourceHandle handle);

    /// CREATE_PENDING -> UNMAPPED (failed, timed out or cancelled attempt)
    bool AbandonCreate(NodeID id);

    /// MAPPED -> DESTROY_PENDING
    ///
    /// @return Handle to destroy, or nullopt if the node is not MAPPED
    std::optional<ResourceHandle> BeginDestroy(NodeID id);

    /// DESTROY_PENDING -> UNMAPPED, releasing the handle
    ///
    /// @return Node the handle belonged to, or nullopt if unknown
    std::optional<NodeID> ConfirmDestroy(ResourceHandle handle);

    /// DESTROY_PENDING -> MAPPED (the destroy effect never reached the backend)
    bool AbortDestroy(NodeID id);

    /// MAPPED -> UNMAPPED without a destroy effect (resource already gone)
    bool ReleaseLost(NodeID id);

    /// Flag a CREATE_PENDING entry to be destroyed once it resolves
    bool MarkCancelOnResolve(NodeID id);

    /// Remove an UNMAPPED entry (node deleted from the graph)
    bool Erase(NodeID id);

    // ========================================================================
    // Orphans
    // ========================================================================

    /// Track a handle destroyed without a node mapping (stale create result)
    void TrackOrphan(ResourceHandle handle);

    /// Consume the confirmation of an orphan destroy
    bool ConfirmOrphan(ResourceHandle handle);

    size_t OrphanCount() const { return orphans_.size(); }

    // ========================================================================
    // Views
    // ========================================================================

    std::vector<NodeID> NodesInState(MappingState state) const;

    size_t CountInState(MappingState state) const;

    size_t Size() const { return mappings_.size(); }

    std::vector<NodeID> AllNodes() const;

private:
    std::unordered_map<NodeID, RuntimeResourceMapping> mappings_;
    std::unordered_map<ResourceHandle, NodeID> handle_to_node_;
    std::unordered_set<ResourceHandle> orphans_;

    CreateTicket next_ticket_{1};

    RuntimeResourceMapping* FindMutable(NodeID id);
};

} // namespace lrec
