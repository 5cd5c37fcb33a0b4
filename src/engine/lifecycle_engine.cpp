// File: src/engine/lifecycle_engine.cpp
#include "engine/lifecycle_engine.hpp"
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lrec {

const char* ToString(NodeStatus status) {
    switch (status) {
        case NodeStatus::LIVE: return "LIVE";
        case NodeStatus::LOADING: return "LOADING";
        case NodeStatus::UNLOADED: return "UNLOADED";
        case NodeStatus::UNAVAILABLE: return "UNAVAILABLE";
        case NodeStatus::RETRY_WAIT: return "RETRY_WAIT";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// FrameDiagnostics
// ============================================================================

size_t FrameDiagnostics::TotalDemotions() const {
    return std::accumulate(demotions_by_cause.begin(), demotions_by_cause.end(), size_t{0});
}

std::string FrameDiagnostics::ToString() const {
    std::ostringstream oss;
    oss << "creates=" << creates_issued
        << " destroys=" << destroys_issued
        << " demotions=" << TotalDemotions();

    if (TotalDemotions() > 0) {
        oss << " [";
        bool first = true;
        for (size_t i = 0; i < demotions_by_cause.size(); ++i) {
            if (demotions_by_cause[i] == 0) {
                continue;
            }
            if (!first) {
                oss << ", ";
            }
            oss << lrec::ToString(static_cast<TransitionCause>(i)) << ":" << demotions_by_cause[i];
            first = false;
        }
        oss << "]";
    }

    oss << " blocked=" << blocked_count
        << " terminal=" << terminal_failures.size();
    if (pinned_overflow_count > 0) {
        oss << " pinned_overflow=" << pinned_overflow_count;
    }
    if (pass.stale_outcomes > 0) {
        oss << " stale=" << pass.stale_outcomes;
    }
    if (pass.rejected_effects > 0) {
        oss << " rejected_effects=" << pass.rejected_effects;
    }
    return oss.str();
}

// ============================================================================
// Constructor
// ============================================================================

LifecycleEngine::LifecycleEngine(IResourceBackend& backend)
    : LifecycleEngine(backend, Config{}) {
}

LifecycleEngine::LifecycleEngine(IResourceBackend& backend, const Config& config)
    : config_(config),
      store_(config.store),
      backpressure_(config.backpressure),
      reconciler_(config.reconciler),
      effects_(backend) {
}

// ============================================================================
// Intent Stream
// ============================================================================

void LifecycleEngine::Submit(Intent intent) {
    intents_.Push(std::move(intent));
}

void LifecycleEngine::SubmitBatch(const std::vector<Intent>& intents) {
    intents_.PushBatch(intents);
}

// ============================================================================
// Frame
// ============================================================================

FrameReport LifecycleEngine::RunFrame(Timestamp now) {
    if (in_frame_) {
        throw std::logic_error("RunFrame called while a frame is running");
    }

    struct FrameGuard {
        bool& flag;
        explicit FrameGuard(bool& f) : flag(f) { flag = true; }
        ~FrameGuard() { flag = false; }
    } guard(in_frame_);

    FrameReport report;
    report.frame = ++frame_count_;
    effects_.ResetCounters();

    // Phase 1
    std::vector<Intent> batch = intents_.Drain();
    report.apply = reducer_.Apply(batch, store_, now);

    // Phase 1 is complete: every mutation of this frame is in the store

    // Phase 2
    std::vector<FollowUpIntent> follow_ups =
        reconciler_.Reconcile(store_, table_, backpressure_, effects_, outcomes_, now);

    for (const auto& follow_up : follow_ups) {
        intents_.Push(follow_up);
    }

    report.follow_ups = report.apply.forwarded;
    if (listener_) {
        for (const auto& follow_up : report.follow_ups) {
            listener_(follow_up);
        }
    }

    CollectDiagnostics(report.diagnostics);

    last_report_ = report;
    return report;
}

void LifecycleEngine::CollectDiagnostics(FrameDiagnostics& diagnostics) {
    diagnostics.creates_issued = effects_.CreatesIssued();
    diagnostics.destroys_issued = effects_.DestroysIssued();

    for (const auto& demotion : store_.TakeForcedDemotions()) {
        ++diagnostics.demotions_by_cause[static_cast<size_t>(demotion.cause)];
    }

    diagnostics.blocked_count = backpressure_.BlockedCount();
    diagnostics.terminal_failures = backpressure_.TerminalFailures();
    diagnostics.pinned_overflow_count = store_.TakePinnedOverflowCount();
    diagnostics.pass = reconciler_.GetLastPassStats();
}

// ============================================================================
// Host Controls
// ============================================================================

bool LifecycleEngine::SetPinned(NodeID id, bool pinned, Timestamp now) {
    if (in_frame_) {
        throw std::logic_error("SetPinned called while a frame is running");
    }
    return store_.SetPinned(id, pinned, now);
}

void LifecycleEngine::SetDiagnosticsListener(DiagnosticsListener listener) {
    listener_ = std::move(listener);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<NodeStatus> LifecycleEngine::GetNodeStatus(NodeID id, Timestamp now) const {
    if (!store_.Contains(id)) {
        return std::nullopt;
    }

    switch (table_.GetState(id)) {
        case MappingState::MAPPED:
            return NodeStatus::LIVE;
        case MappingState::CREATE_PENDING:
            return NodeStatus::LOADING;
        default:
            break;
    }

    if (backpressure_.IsTerminal(id)) {
        return NodeStatus::UNAVAILABLE;
    }
    if (backpressure_.IsBlocked(id) && !backpressure_.IsRetryEligible(id, now)) {
        return NodeStatus::RETRY_WAIT;
    }
    return NodeStatus::UNLOADED;
}

} // namespace lrec
