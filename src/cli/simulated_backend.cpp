// File: src/cli/simulated_backend.cpp
#include "cli/simulated_backend.hpp"
#include <stdexcept>

namespace lrec {

SimulatedBackend::SimulatedBackend()
    : config_(Config{}) {
}

SimulatedBackend::SimulatedBackend(const Config& config)
    : config_(config) {
}

void SimulatedBackend::CreateResource(NodeID id, CreateTicket ticket) {
    ++total_creates_;

    PendingOperation operation;
    operation.is_create = true;
    operation.node_id = id;
    operation.ticket = ticket;
    operation.frames_left = config_.create_latency_frames;

    if (operation.frames_left == 0) {
        Complete(operation);
    } else {
        pending_.push_back(operation);
    }
}

void SimulatedBackend::DestroyResource(ResourceHandle handle) {
    ++total_destroys_;

    PendingOperation operation;
    operation.is_create = false;
    operation.handle = handle;
    operation.frames_left = config_.destroy_latency_frames;

    if (operation.frames_left == 0) {
        Complete(operation);
    } else {
        pending_.push_back(operation);
    }
}

void SimulatedBackend::Tick() {
    std::vector<PendingOperation> still_pending;
    std::vector<PendingOperation> completed;

    for (auto& operation : pending_) {
        if (--operation.frames_left == 0) {
            completed.push_back(operation);
        } else {
            still_pending.push_back(operation);
        }
    }
    pending_.swap(still_pending);

    // Posted in issue order
    for (const auto& operation : completed) {
        Complete(operation);
    }
}

void SimulatedBackend::SetFailing(NodeID id, bool failing) {
    if (failing) {
        failing_.insert(id);
    } else {
        failing_.erase(id);
    }
}

bool SimulatedBackend::Crash(NodeID id) {
    for (auto it = live_.begin(); it != live_.end(); ++it) {
        if (it->second == id) {
            ResourceHandle handle = it->first;
            live_.erase(it);
            if (outcomes_) {
                outcomes_->PushCrashed(handle);
            }
            return true;
        }
    }
    return false;
}

void SimulatedBackend::Complete(const PendingOperation& operation) {
    if (!outcomes_) {
        throw std::logic_error("SimulatedBackend has no outcome queue attached");
    }

    if (operation.is_create) {
        if (failing_.count(operation.node_id) > 0) {
            outcomes_->PushCreateFailed(operation.node_id, operation.ticket,
                                        CreationError::BACKEND_REJECTED);
            return;
        }
        ResourceHandle handle(next_handle_++);
        live_[handle] = operation.node_id;
        outcomes_->PushCreated(operation.node_id, operation.ticket, handle);
        return;
    }

    // A crashed resource is already gone, the destroy still completes
    live_.erase(operation.handle);
    outcomes_->PushDestroyed(operation.handle);
}

} // namespace lrec
