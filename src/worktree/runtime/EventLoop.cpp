#include "worktree/runtime/EventLoop.hpp"
#include "worktree/core/ContractViolation.hpp"
#include "worktree/log/TaggedLogger.hpp"

#include <optional>

namespace WT {

EventLoop::EventLoop(RuntimeConfiguration configuration)
    : configuration_(configuration), loopThread(std::this_thread::get_id()) {}

auto EventLoop::setDispatcher(Dispatcher dispatcher) -> void {
    this->dispatcher = std::move(dispatcher);
}

auto EventLoop::post(Event event) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            wt_log("EventLoop::post dropped on closed loop: " + event.label, "EventLoop");
            return false;
        }
        wt_log("EventLoop::post " + event.label, "EventLoop");
        queue.push_back(std::move(event));
    }
    cv.notify_all();

    if (configuration_.drain_on_send && isLoopThread() && busyDepth == 0) {
        drain();
    }
    return true;
}

auto EventLoop::drain() -> std::size_t {
    WT_REQUIRE(isLoopThread(), "events must be drained on the loop thread");
    if (busyDepth > 0) {
        return 0;
    }
    BusyScope   busy(*this);
    std::size_t applied = 0;
    while (configuration_.max_events_per_drain == 0 || applied < configuration_.max_events_per_drain) {
        std::optional<Event> next;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (queue.empty() || closed) {
                break;
            }
            next.emplace(std::move(queue.front()));
            queue.pop_front();
        }
        ++applied;
        wt_log("EventLoop::drain dispatching " + next->label, "EventLoop");
        if (dispatcher) {
            dispatcher(*next);
        } else if (!next->apply()) {
            wt_log("EventLoop::drain dropped stale event " + next->label, "EventLoop");
        }
    }
    return applied;
}

auto EventLoop::waitForEvents(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, timeout, [this] { return !queue.empty() || closed; });
    return !queue.empty();
}

auto EventLoop::close() -> void {
    std::deque<Event> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        dropped.swap(queue);
    }
    cv.notify_all();
    wt_log("EventLoop::close dropped " + std::to_string(dropped.size()) + " events", "EventLoop");
}

auto EventLoop::isLoopThread() const -> bool {
    return std::this_thread::get_id() == loopThread;
}

auto EventLoop::isBusy() const -> bool {
    return busyDepth > 0;
}

auto EventLoop::isClosed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

auto EventLoop::pendingEvents() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

} // namespace WT
