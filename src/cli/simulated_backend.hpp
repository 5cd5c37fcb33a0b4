// File: src/cli/simulated_backend.hpp
#pragma once

#include "runtime/resource_backend.hpp"
#include "core/types.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lrec {

/// In-process resource backend for the CLI simulator
///
/// Create and destroy effects complete after a fixed number of Tick()
/// calls (one per frame). Nodes can be marked failing, and live resources
/// can be crashed on demand. With zero latency the outcome is posted
/// while the effect is issued and observed on the next reconcile pass.
class SimulatedBackend : public IResourceBackend {
public:
    struct Config {
        size_t create_latency_frames{1};
        size_t destroy_latency_frames{1};
    };

    SimulatedBackend();

    explicit SimulatedBackend(const Config& config);

    /// Queue outcomes are posted to (not owned)
    void SetOutcomeQueue(ResourceOutcomeQueue* queue) { outcomes_ = queue; }

    // IResourceBackend
    void CreateResource(NodeID id, CreateTicket ticket) override;
    void DestroyResource(ResourceHandle handle) override;
    const char* GetName() const override { return "SimulatedBackend"; }

    /// Advance one frame and post every operation that completes
    void Tick();

    /// Make creates for a node fail (or succeed again)
    void SetFailing(NodeID id, bool failing);

    bool IsFailing(NodeID id) const { return failing_.count(id) > 0; }

    /// Post a crash for the node's live resource
    ///
    /// @return false if the node has no live resource
    bool Crash(NodeID id);

    size_t LiveCount() const { return live_.size(); }

    size_t PendingCount() const { return pending_.size(); }

    size_t TotalCreates() const { return total_creates_; }
    size_t TotalDestroys() const { return total_destroys_; }

private:
    struct PendingOperation {
        bool is_create{true};
        NodeID node_id;
        CreateTicket ticket{0};
        ResourceHandle handle;
        size_t frames_left{0};
    };

    Config config_;
    ResourceOutcomeQueue* outcomes_{nullptr};

    std::vector<PendingOperation> pending_;
    std::unordered_map<ResourceHandle, NodeID> live_;
    std::unordered_set<NodeID> failing_;

    ResourceHandle::ValueType next_handle_{1};
    size_t total_creates_{0};
    size_t total_destroys_{0};

    void Complete(const PendingOperation& operation);
};

} // namespace lrec
