// File: src/intent/intent_queue.hpp
#pragma once

#include "intent/intent.hpp"
#include <mutex>
#include <vector>

namespace lrec {

/// Multi-producer, single-consumer intent handoff
///
/// Producers may push from any thread at any time. The frame loop drains
/// the whole queue before Phase 1; intents pushed after the drain wait for
/// the next frame.
class IntentQueue {
public:
    IntentQueue() = default;

    IntentQueue(const IntentQueue&) = delete;
    IntentQueue& operator=(const IntentQueue&) = delete;

    void Push(Intent intent);

    void PushBatch(const std::vector<Intent>& intents);

    /// Take every queued intent in arrival order
    std::vector<Intent> Drain();

    size_t Size() const;

    bool Empty() const { return Size() == 0; }

private:
    mutable std::mutex mutex_;
    std::vector<Intent> pending_;
};

} // namespace lrec
