#pragma once
#include "worktree/runtime/RuntimeConfiguration.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace WT {

/**
 * Serializes every event of one tree onto the loop thread (the thread that
 * constructed the loop).
 *
 * - post() may be called from any thread. Events are applied in arrival order.
 * - drain() runs on the loop thread and hands queued events to the dispatcher one
 *   at a time. A drain requested while another drain, a render pass, or a host
 *   update is in progress returns immediately; the events it would have applied
 *   stay queued and are picked up by the outer drain or the next one.
 * - With drain_on_send set, a post() made on the loop thread while the loop is
 *   idle drains before returning.
 */
class EventLoop {
public:
    struct Event {
        // Applies the event. Returns false when its target is gone and nothing happened.
        std::function<bool()> apply;
        std::string           label;
    };

    using Dispatcher = std::function<void(Event&)>;

    explicit EventLoop(RuntimeConfiguration configuration);

    EventLoop(EventLoop const&)            = delete;
    EventLoop& operator=(EventLoop const&) = delete;

    auto setDispatcher(Dispatcher dispatcher) -> void;

    // Returns false if the loop is closed and the event was dropped.
    auto post(Event event) -> bool;

    // Applies queued events. Returns the number handed to the dispatcher.
    auto drain() -> std::size_t;

    // Blocks until an event is queued, the loop closes, or the timeout expires.
    // Returns true if events are pending.
    auto waitForEvents(std::chrono::milliseconds timeout) -> bool;

    // Drops queued events and refuses new ones.
    auto close() -> void;

    [[nodiscard]] auto isLoopThread() const -> bool;
    [[nodiscard]] auto isBusy() const -> bool;
    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto pendingEvents() const -> std::size_t;
    [[nodiscard]] auto configuration() const -> RuntimeConfiguration const& { return configuration_; }

    /**
     * Marks the loop busy for the lifetime of the scope (loop thread only). Used
     * around render passes and host updates so sinks invoked meanwhile queue
     * their events instead of draining re-entrantly.
     */
    class BusyScope {
    public:
        explicit BusyScope(EventLoop& loop) : loop(loop) { ++loop.busyDepth; }
        ~BusyScope() { --loop.busyDepth; }

        BusyScope(BusyScope const&)            = delete;
        BusyScope& operator=(BusyScope const&) = delete;

    private:
        EventLoop& loop;
    };

private:
    RuntimeConfiguration    configuration_;
    std::thread::id         loopThread;
    Dispatcher              dispatcher;
    mutable std::mutex      mutex;
    std::condition_variable cv;
    std::deque<Event>       queue;
    bool                    closed = false;
    // Loop thread only
    std::size_t busyDepth = 0;
};

} // namespace WT
