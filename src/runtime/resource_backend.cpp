// File: src/runtime/resource_backend.cpp
#include "runtime/resource_backend.hpp"
#include <utility>

namespace lrec {

void ResourceOutcomeQueue::Push(ResourceOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(outcome));
}

void ResourceOutcomeQueue::PushCreated(NodeID id, CreateTicket ticket, ResourceHandle handle) {
    CreationOutcome outcome;
    outcome.node_id = id;
    outcome.ticket = ticket;
    outcome.handle = handle;
    Push(outcome);
}

void ResourceOutcomeQueue::PushCreateFailed(NodeID id, CreateTicket ticket, CreationError error) {
    CreationOutcome outcome;
    outcome.node_id = id;
    outcome.ticket = ticket;
    outcome.error = error;
    Push(outcome);
}

void ResourceOutcomeQueue::PushDestroyed(ResourceHandle handle) {
    Push(DestroyConfirmation{handle});
}

void ResourceOutcomeQueue::PushCrashed(ResourceHandle handle) {
    Push(ResourceCrashed{handle});
}

std::vector<ResourceOutcome> ResourceOutcomeQueue::Drain() {
    std::vector<ResourceOutcome> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    return drained;
}

size_t ResourceOutcomeQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace lrec
