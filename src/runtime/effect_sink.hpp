// File: src/runtime/effect_sink.hpp
#pragma once

#include "runtime/resource_backend.hpp"
#include "core/types.hpp"
#include <string>

namespace lrec {

/// Gate between the reconciler and the resource backend
///
/// Effects pass through only while a reconcile phase holds the sink open.
/// Issuing an effect outside that window is a frame-ordering bug and
/// throws std::logic_error. A backend that throws any other exception
/// does not unwind the pass: the effect is reported as not issued.
class EffectSink {
public:
    explicit EffectSink(IResourceBackend& backend);

    EffectSink(const EffectSink&) = delete;
    EffectSink& operator=(const EffectSink&) = delete;

    /// Opens the sink for the lifetime of a reconcile pass
    class PhaseScope {
    public:
        explicit PhaseScope(EffectSink& sink);
        ~PhaseScope();

        PhaseScope(const PhaseScope&) = delete;
        PhaseScope& operator=(const PhaseScope&) = delete;

    private:
        EffectSink& sink_;
    };

    /// @return false if the backend threw; LastError() holds its message
    bool IssueCreate(NodeID id, CreateTicket ticket);

    /// @return false if the backend threw; LastError() holds its message
    bool IssueDestroy(ResourceHandle handle);

    const std::string& LastError() const { return last_error_; }

    bool IsOpen() const { return open_; }

    size_t CreatesIssued() const { return creates_issued_; }
    size_t DestroysIssued() const { return destroys_issued_; }

    /// Reset the per-frame effect counters
    void ResetCounters();

    IResourceBackend& GetBackend() { return backend_; }

private:
    IResourceBackend& backend_;
    bool open_{false};

    size_t creates_issued_{0};
    size_t destroys_issued_{0};
    std::string last_error_;

    void RequireOpen(const char* effect) const;
};

} // namespace lrec
