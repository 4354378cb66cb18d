#pragma once
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/worker/WorkerContext.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace WT {

/**
 * Emits 1, 2, 3, ... every `interval` until cancelled. Occupies one executor
 * thread while running. Timers with equal intervals are equivalent.
 */
class TimerWorker {
public:
    using Output = std::uint64_t;

    explicit TimerWorker(std::chrono::milliseconds interval) : interval(interval) {}

    void run(WorkerContext<Output> const& context) const {
        auto error = context.spawn("TimerWorker " + std::to_string(interval.count()) + "ms", [context, interval = interval] {
            for (Output tick = 1; !context.waitFor(interval); ++tick) {
                if (!context.send(tick)) {
                    break;
                }
            }
        });
        if (error) {
            wt_log("TimerWorker did not start", "Worker", "Error");
        }
    }

    bool isEquivalent(TimerWorker const& other) const { return interval == other.interval; }

    [[nodiscard]] auto period() const -> std::chrono::milliseconds { return interval; }

private:
    std::chrono::milliseconds interval;
};

} // namespace WT
