// File: src/intent/intent.cpp
#include "intent/intent.hpp"
#include <sstream>

namespace lrec {

std::string FollowUpIntent::ToString() const {
    std::ostringstream oss;
    oss << "DiagnosticReport(" << node_id.ToString() << ", " << lrec::ToString(error)
        << ", retries=" << retry_count;
    if (terminal) {
        oss << ", terminal";
    }
    oss << ")";
    return oss.str();
}

namespace {

struct IntentDescriber {
    std::string operator()(const AddNode& intent) const {
        std::ostringstream oss;
        oss << "AddNode(" << intent.node_id.ToString() << ", " << ToString(intent.cause);
        if (intent.tier) {
            oss << ", " << ToString(*intent.tier);
        }
        if (intent.pinned) {
            oss << ", pinned";
        }
        oss << ")";
        return oss.str();
    }

    std::string operator()(const SetDesiredTier& intent) const {
        std::ostringstream oss;
        oss << "SetDesiredTier(" << intent.node_id.ToString() << ", "
            << ToString(intent.tier) << ", " << ToString(intent.cause) << ")";
        return oss.str();
    }

    std::string operator()(const RemoveNode& intent) const {
        return "RemoveNode(" + intent.node_id.ToString() + ")";
    }

    std::string operator()(const MemoryPressureSignal& intent) const {
        return std::string("MemoryPressureSignal(") + ToString(intent.severity) + ")";
    }

    std::string operator()(const RetryNode& intent) const {
        return "RetryNode(" + intent.node_id.ToString() + ")";
    }

    std::string operator()(const FollowUpIntent& intent) const {
        return intent.ToString();
    }
};

} // namespace

std::string Describe(const Intent& intent) {
    return std::visit(IntentDescriber{}, intent);
}

} // namespace lrec
