#include "worktree/core/Lifetime.hpp"
#include "worktree/log/TaggedLogger.hpp"

namespace WT {

Lifetime::~Lifetime() {
    end();
}

void Lifetime::end() {
    std::vector<std::function<void()>> callbacks;
    std::vector<std::shared_ptr<void>> released;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (ended.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        callbacks.swap(endedCallbacks);
        released.swap(retained);
        cv.notify_all();
    }
    wt_log("Lifetime::end running " + std::to_string(callbacks.size()) + " callbacks", "SideEffect");
    for (auto& callback : callbacks) {
        callback();
    }
}

void Lifetime::onEnded(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!ended.load(std::memory_order_acquire)) {
            endedCallbacks.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

void Lifetime::retain(std::shared_ptr<void> object) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!ended.load(std::memory_order_acquire)) {
        retained.push_back(std::move(object));
    }
}

} // namespace WT
