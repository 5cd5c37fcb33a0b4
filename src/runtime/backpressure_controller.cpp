// File: src/runtime/backpressure_controller.cpp
#include "runtime/backpressure_controller.hpp"
#include <algorithm>
#include <stdexcept>
#include <iostream>

namespace lrec {

bool BackpressureController::Config::IsValid() const {
    if (base_backoff.count() <= 0) {
        return false;
    }
    if (max_backoff < base_backoff) {
        return false;
    }
    return max_retry_count > 0;
}

BackpressureController::BackpressureController()
    : config_(Config{}) {
}

BackpressureController::BackpressureController(const Config& config)
    : config_(config) {

    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid BackpressureController configuration");
    }
}

Timestamp::Duration BackpressureController::ComputeBackoff(Timestamp::Duration base,
                                                           Timestamp::Duration max,
                                                           uint32_t retry_count) {
    // Double step by step so large retry counts saturate instead of overflowing
    Timestamp::Duration backoff = base;
    for (uint32_t i = 0; i < retry_count; ++i) {
        if (backoff >= max / 2) {
            return max;
        }
        backoff *= 2;
    }
    return std::min(backoff, max);
}

BlockedRecord BackpressureController::RecordFailure(NodeID id, Timestamp now,
                                                    CreationError error) {
    uint32_t retry_count = 0;
    auto parked = in_flight_retries_.find(id);
    if (parked != in_flight_retries_.end()) {
        retry_count = parked->second;
        in_flight_retries_.erase(parked);
    }

    auto existing = blocked_.find(id);
    if (existing != blocked_.end()) {
        retry_count = std::max(retry_count, existing->second.retry_count);
    }

    BlockedRecord record;
    record.node_id = id;
    record.current_backoff = ComputeBackoff(config_.base_backoff, config_.max_backoff, retry_count);
    record.next_retry_at = now + record.current_backoff;
    record.retry_count = std::min(retry_count + 1, config_.max_retry_count);
    record.last_error = error;

    blocked_[id] = record;

    if (record.retry_count >= config_.max_retry_count && config_.log_warnings) {
        std::cerr << "TerminalCreationFailure: " << id.ToString() << " failed "
                  << record.retry_count << " creation attempts (last error "
                  << ToString(error) << ")" << std::endl;
    }

    return record;
}

bool BackpressureController::IsRetryEligible(NodeID id, Timestamp now) const {
    const BlockedRecord* record = Find(id);
    if (!record) {
        return true;
    }
    if (record->retry_count >= config_.max_retry_count) {
        return false;
    }
    return now >= record->next_retry_at;
}

void BackpressureController::MarkRetryIssued(NodeID id) {
    auto it = blocked_.find(id);
    if (it == blocked_.end()) {
        return;
    }
    in_flight_retries_[id] = it->second.retry_count;
    blocked_.erase(it);
}

bool BackpressureController::Clear(NodeID id) {
    bool removed = blocked_.erase(id) > 0;
    removed = in_flight_retries_.erase(id) > 0 || removed;
    return removed;
}

const BlockedRecord* BackpressureController::Find(NodeID id) const {
    auto it = blocked_.find(id);
    return it == blocked_.end() ? nullptr : &it->second;
}

bool BackpressureController::IsTerminal(NodeID id) const {
    const BlockedRecord* record = Find(id);
    return record != nullptr && record->retry_count >= config_.max_retry_count;
}

uint32_t BackpressureController::GetRetryCount(NodeID id) const {
    if (const BlockedRecord* record = Find(id)) {
        return record->retry_count;
    }
    auto parked = in_flight_retries_.find(id);
    return parked == in_flight_retries_.end() ? 0 : parked->second;
}

std::vector<NodeID> BackpressureController::BlockedNodes() const {
    std::vector<NodeID> nodes;
    nodes.reserve(blocked_.size());
    for (const auto& [id, record] : blocked_) {
        nodes.push_back(id);
    }
    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

std::vector<NodeID> BackpressureController::TerminalFailures() const {
    std::vector<NodeID> nodes;
    for (const auto& [id, record] : blocked_) {
        if (record.retry_count >= config_.max_retry_count) {
            nodes.push_back(id);
        }
    }
    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

} // namespace lrec
