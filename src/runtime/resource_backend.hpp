// File: src/runtime/resource_backend.hpp
//
// Resource Backend Interface
//
// The engine never builds or tears down a rendering resource itself. It
// hands create/destroy effects to an injected backend and later observes
// the outcomes the backend posts to a ResourceOutcomeQueue. Backends may
// take any number of frames to answer and may post from other threads.

#pragma once

#include "runtime/resource_handle_table.hpp"
#include "core/types.hpp"
#include <variant>
#include <vector>
#include <optional>
#include <mutex>

namespace lrec {

/// Result of one create effect
struct CreationOutcome {
    NodeID node_id;
    CreateTicket ticket{0};
    std::optional<ResourceHandle> handle;   ///< Set on success
    CreationError error{CreationError::BACKEND_REJECTED};

    bool Succeeded() const { return handle.has_value(); }
};

/// Confirmation that a destroy effect completed
struct DestroyConfirmation {
    ResourceHandle handle;
};

/// A live resource died without being asked to
struct ResourceCrashed {
    ResourceHandle handle;
};

using ResourceOutcome = std::variant<CreationOutcome, DestroyConfirmation, ResourceCrashed>;

/// Thread-safe queue of outcomes, drained once per reconcile pass
class ResourceOutcomeQueue {
public:
    ResourceOutcomeQueue() = default;

    ResourceOutcomeQueue(const ResourceOutcomeQueue&) = delete;
    ResourceOutcomeQueue& operator=(const ResourceOutcomeQueue&) = delete;

    void Push(ResourceOutcome outcome);

    void PushCreated(NodeID id, CreateTicket ticket, ResourceHandle handle);
    void PushCreateFailed(NodeID id, CreateTicket ticket, CreationError error);
    void PushDestroyed(ResourceHandle handle);
    void PushCrashed(ResourceHandle handle);

    /// Take every queued outcome in arrival order
    std::vector<ResourceOutcome> Drain();

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::vector<ResourceOutcome> pending_;
};

/// Abstract interface for a resource backend
class IResourceBackend {
public:
    virtual ~IResourceBackend() = default;

    /// Start building a resource for a node
    ///
    /// The result must be posted as a CreationOutcome carrying `ticket`.
    /// Must not block.
    virtual void CreateResource(NodeID id, CreateTicket ticket) = 0;

    /// Start tearing down a resource
    ///
    /// Completion must be posted as a DestroyConfirmation. Must not block.
    virtual void DestroyResource(ResourceHandle handle) = 0;

    /// Descriptive backend name
    virtual const char* GetName() const = 0;
};

} // namespace lrec
