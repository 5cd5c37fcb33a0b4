// File: src/intent/intent_queue.cpp
#include "intent/intent_queue.hpp"
#include <utility>

namespace lrec {

void IntentQueue::Push(Intent intent) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(intent));
}

void IntentQueue::PushBatch(const std::vector<Intent>& intents) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.insert(pending_.end(), intents.begin(), intents.end());
}

std::vector<Intent> IntentQueue::Drain() {
    std::vector<Intent> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    return drained;
}

size_t IntentQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace lrec
