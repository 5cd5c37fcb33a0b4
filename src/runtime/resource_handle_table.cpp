// File: src/runtime/resource_handle_table.cpp
#include "runtime/resource_handle_table.hpp"
#include <algorithm>

namespace lrec {

// ============================================================================
// Lookup
// ============================================================================

const RuntimeResourceMapping* ResourceHandleTable::Find(NodeID id) const {
    auto it = mappings_.find(id);
    return it == mappings_.end() ? nullptr : &it->second;
}

RuntimeResourceMapping* ResourceHandleTable::FindMutable(NodeID id) {
    auto it = mappings_.find(id);
    return it == mappings_.end() ? nullptr : &it->second;
}

MappingState ResourceHandleTable::GetState(NodeID id) const {
    const RuntimeResourceMapping* mapping = Find(id);
    return mapping ? mapping->mapping_state : MappingState::UNMAPPED;
}

std::optional<NodeID> ResourceHandleTable::NodeForHandle(ResourceHandle handle) const {
    auto it = handle_to_node_.find(handle);
    if (it == handle_to_node_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResourceHandle> ResourceHandleTable::HandleForNode(NodeID id) const {
    const RuntimeResourceMapping* mapping = Find(id);
    if (!mapping) {
        return std::nullopt;
    }
    return mapping->resource_handle;
}

// ============================================================================
// Transitions
// ============================================================================

std::optional<CreateTicket> ResourceHandleTable::BeginCreate(NodeID id, Timestamp now) {
    RuntimeResourceMapping& mapping = mappings_[id];
    mapping.node_id = id;

    if (mapping.mapping_state != MappingState::UNMAPPED) {
        return std::nullopt;
    }

    mapping.mapping_state = MappingState::CREATE_PENDING;
    mapping.create_ticket = next_ticket_++;
    mapping.create_started_at = now;
    mapping.cancel_on_resolve = false;
    return mapping.create_ticket;
}

bool ResourceHandleTable::CompleteCreate(NodeID id, ResourceHandle handle) {
    RuntimeResourceMapping* mapping = FindMutable(id);
    if (!mapping || mapping->mapping_state != MappingState::CREATE_PENDING) {
        return false;
    }
    if (!handle.IsValid() || handle_to_node_.count(handle) > 0) {
        return false;
    }

    mapping->mapping_state = MappingState::MAPPED;
    mapping->resource_handle = handle;
    handle_to_node_[handle] = id;
    return true;
}

bool ResourceHandleTable::AbandonCreate(NodeID id) {
    RuntimeResourceMapping* mapping = FindMutable(id);
    if (!mapping || mapping->mapping_state != MappingState::CREATE_PENDING) {
        return false;
    }

    mapping->mapping_state = MappingState::UNMAPPED;
    mapping->cancel_on_resolve = false;
    return true;
}

std::optional<ResourceHandle> ResourceHandleTable::BeginDestroy(NodeID id) {
    RuntimeResourceMapping* mapping = FindMutable(id);
    if (!mapping || mapping->mapping_state != MappingState::MAPPED || !mapping->resource_handle) {
        return std::nullopt;
    }

    mapping->mapping_state = MappingState::DESTROY_PENDING;
    mapping->cancel_on_resolve = false;
    return mapping->resource_handle;
}

std::optional<NodeID> ResourceHandleTable::ConfirmDestroy(ResourceHandle handle) {
    auto it = handle_to_node_.find(handle);
    if (it == handle_to_node_.end()) {
        return std::nullopt;
    }

    NodeID id = it->second;
    RuntimeResourceMapping* mapping = FindMutable(id);
    if (!mapping || mapping->mapping_state != MappingState::DESTROY_PENDING) {
        return std::nullopt;
    }

    handle_to_node_.erase(it);
    mapping->resource_handle.reset();
    mapping->mapping_state = MappingState::UNMAPPED;
    return id;
}

bool ResourceHandleTable::AbortDestroy(NodeID id) {
    RuntimeResourceMapping* mapping = FindMutable(id);
    if (!mapping || mapping->mapping_state != MappingState::DESTROY_PENDING) {
        return false;
    }
    mapping->mapping_state = MappingState::MAPPED;
    return true;
}

bool ResourceHandleTable::ReleaseLost(NodeID id) {
    RuntimeResourceMapping* mapping = FindMutable(id);
    if (!mapping || mapping->mapping_state != MappingState::MAPPED) {
        return false;
    }

    if (mapping->resource_handle) {
        handle_to_node_.erase(*mapping->resource_handle);
    }
    mapping->resource_handle.reset();
    mapping->mapping_state = MappingState::UNMAPPED;
    return true;
}

bool ResourceHandleTable::MarkCancelOnResolve(NodeID id) {
    RuntimeResourceMapping* mapping = FindMutable(id);
    if (!mapping || mapping->mapping_state != MappingState::CREATE_PENDING) {
        return false;
    }
    mapping->cancel_on_resolve = true;
    return true;
}

bool ResourceHandleTable::Erase(NodeID id) {
    auto it = mappings_.find(id);
    if (it == mappings_.end() || it->second.mapping_state != MappingState::UNMAPPED) {
        return false;
    }
    mappings_.erase(it);
    return true;
}

// ============================================================================
// Orphans
// ============================================================================

void ResourceHandleTable::TrackOrphan(ResourceHandle handle) {
    orphans_.insert(handle);
}

bool ResourceHandleTable::ConfirmOrphan(ResourceHandle handle) {
    return orphans_.erase(handle) > 0;
}

// ============================================================================
// Views
// ============================================================================

std::vector<NodeID> ResourceHandleTable::NodesInState(MappingState state) const {
    std::vector<NodeID> nodes;
    for (const auto& [id, mapping] : mappings_) {
        if (mapping.mapping_state == state) {
            nodes.push_back(id);
        }
    }
    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

size_t ResourceHandleTable::CountInState(MappingState state) const {
    return static_cast<size_t>(std::count_if(
        mappings_.begin(), mappings_.end(),
        [state](const auto& entry) { return entry.second.mapping_state == state; }));
}

std::vector<NodeID> ResourceHandleTable::AllNodes() const {
    std::vector<NodeID> nodes;
    nodes.reserve(mappings_.size());
    for (const auto& [id, mapping] : mappings_) {
        nodes.push_back(id);
    }
    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

} // namespace lrec
