// File: src/runtime/backpressure_controller.hpp
//
// Backpressure Controller for resource creation retries
//
// Tracks nodes whose last creation attempt failed and decides when they
// may retry. Backoff grows exponentially with the retry count:
//
//   current_backoff = min(base_backoff * 2^retry_count, max_backoff)
//   next_retry_at   = failure_time + current_backoff
//
// Once retry_count reaches max_retry_count the node is a terminal failure
// and stays blocked until Clear() (explicit retry or tier change).
//
// A BlockedRecord only exists while the node is Unmapped. When a retry is
// issued the record is parked so the retry count survives the attempt.

#pragma once

#include "core/types.hpp"
#include <unordered_map>
#include <vector>
#include <chrono>

namespace lrec {

/// Failed-creation state of one node
struct BlockedRecord {
    NodeID node_id;
    uint32_t retry_count{0};
    Timestamp next_retry_at;
    Timestamp::Duration current_backoff{0};
    CreationError last_error{CreationError::BACKEND_REJECTED};
};

class BackpressureController {
public:
    struct Config {
        Timestamp::Duration base_backoff{std::chrono::seconds(1)};
        Timestamp::Duration max_backoff{std::chrono::seconds(30)};
        uint32_t max_retry_count{5};

        /// Print terminal failures to stderr
        bool log_warnings{true};

        bool IsValid() const;
    };

    BackpressureController();

    explicit BackpressureController(const Config& config);

    /// Record a failed creation and compute the next retry time
    ///
    /// @param id Node whose creation failed
    /// @param now Time the failure was observed
    /// @param error Failure reported by the backend
    /// @return The updated record
    BlockedRecord RecordFailure(NodeID id, Timestamp now,
                                CreationError error = CreationError::BACKEND_REJECTED);

    /// True if the node has no record, or its backoff elapsed and it is not terminal
    bool IsRetryEligible(NodeID id, Timestamp now) const;

    /// Park the record of a node whose retry create was just issued
    void MarkRetryIssued(NodeID id);

    /// Remove all backpressure state of a node
    ///
    /// @return true if anything was removed
    bool Clear(NodeID id);

    /// Blocked record of a node, or nullptr
    const BlockedRecord* Find(NodeID id) const;

    bool IsBlocked(NodeID id) const { return Find(id) != nullptr; }

    bool IsTerminal(NodeID id) const;

    /// Retry count of a node, parked attempts included
    uint32_t GetRetryCount(NodeID id) const;

    size_t BlockedCount() const { return blocked_.size(); }

    std::vector<NodeID> BlockedNodes() const;

    /// Nodes at max_retry_count, ordered by node id
    std::vector<NodeID> TerminalFailures() const;

    /// Backoff for a retry count: min(base * 2^retry_count, max)
    static Timestamp::Duration ComputeBackoff(Timestamp::Duration base,
                                              Timestamp::Duration max,
                                              uint32_t retry_count);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::unordered_map<NodeID, BlockedRecord> blocked_;

    /// Retry counts of nodes with a retry create in flight
    std::unordered_map<NodeID, uint32_t> in_flight_retries_;
};

} // namespace lrec
