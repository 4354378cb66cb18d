#pragma once
#include "worktree/core/Error.hpp"
#include "worktree/core/Lifetime.hpp"
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/task/Executor.hpp"
#include "worktree/task/Task.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace WT {

/**
 * What a running worker sees: a send() into the owning node, its cancellation
 * scope, and the host's executor. Copyable and usable from any thread.
 *
 * Nothing sent after the Lifetime ends is delivered.
 */
template <typename Output>
class WorkerContext {
public:
    using Deliver = std::function<bool(Output)>;

    WorkerContext(std::shared_ptr<Lifetime> lifetime, Deliver deliver, Executor* executor)
        : lifetime_(std::move(lifetime)), deliver_(std::move(deliver)), executor_(executor) {}

    // Returns false when the output was dropped.
    auto send(Output output) const -> bool {
        if (lifetime_->hasEnded()) {
            return false;
        }
        return deliver_(std::move(output));
    }

    [[nodiscard]] auto isCancelled() const -> bool { return lifetime_->hasEnded(); }
    [[nodiscard]] auto lifetime() const -> Lifetime& { return *lifetime_; }
    [[nodiscard]] auto executor() const -> Executor& { return *executor_; }

    // Sleeps for up to `timeout`. Returns true if cancelled meanwhile.
    template <typename Rep, typename Period>
    auto waitFor(std::chrono::duration<Rep, Period> timeout) const -> bool {
        return lifetime_->waitFor(timeout);
    }

    /**
     * Runs `fn` on the executor. The task is retained by the Lifetime, so it is
     * skipped if the worker is cancelled before a thread picks it up.
     */
    template <typename Fn>
    auto spawn(std::string label, Fn&& fn) const -> std::optional<Error> {
        auto task = Task::Create(std::move(label), [lifetime = lifetime_, fn = std::forward<Fn>(fn)](Task&) mutable {
            if (lifetime->hasEnded()) {
                return;
            }
            fn();
        });
        lifetime_->retain(task);
        if (auto error = executor_->submit(task)) {
            wt_log("WorkerContext::spawn submit failed for " + task->label() + ": " + describeError(*error), "Worker", "Error");
            return error;
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<Lifetime> lifetime_;
    Deliver                   deliver_;
    Executor*                 executor_;
};

} // namespace WT
