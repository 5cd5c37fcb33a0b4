// File: src/runtime/effect_sink.cpp
#include "runtime/effect_sink.hpp"
#include <stdexcept>
#include <string>

namespace lrec {

EffectSink::EffectSink(IResourceBackend& backend)
    : backend_(backend) {
}

EffectSink::PhaseScope::PhaseScope(EffectSink& sink)
    : sink_(sink) {
    if (sink_.open_) {
        throw std::logic_error("EffectSink already open: reconcile pass is not re-entrant");
    }
    sink_.open_ = true;
}

EffectSink::PhaseScope::~PhaseScope() {
    sink_.open_ = false;
}

void EffectSink::RequireOpen(const char* effect) const {
    if (!open_) {
        throw std::logic_error(std::string(effect) + " issued outside the reconcile phase");
    }
}

bool EffectSink::IssueCreate(NodeID id, CreateTicket ticket) {
    RequireOpen("CreateResource");
    try {
        backend_.CreateResource(id, ticket);
    } catch (const std::logic_error&) {
        // Frame-ordering bugs (re-entrant frames) are not backend failures
        throw;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
    ++creates_issued_;
    return true;
}

bool EffectSink::IssueDestroy(ResourceHandle handle) {
    RequireOpen("DestroyResource");
    try {
        backend_.DestroyResource(handle);
    } catch (const std::logic_error&) {
        throw;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
    ++destroys_issued_;
    return true;
}

void EffectSink::ResetCounters() {
    creates_issued_ = 0;
    destroys_issued_ = 0;
}

} // namespace lrec
