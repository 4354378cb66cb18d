#pragma once

#include "worktree/core/Error.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace WT {

struct Task;

/**
 * Executor: interface for scheduling and executing Tasks
 *
 * Workers started by the runtime use an Executor for any work that must not run
 * on the loop thread. The host hands its executor to every WorkerContext.
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (executor shutting down, task expired before it could be queued).
 * - Executors hold tasks weakly. A task whose last strong reference goes away
 *   before a worker picks it up is skipped.
 * - shutdown() stops accepting new tasks, wakes workers and lets in-flight tasks
 *   finish.
 * - size() returns the number of worker threads.
 *
 * Implementations must be thread-safe for concurrent submit() calls and for
 * shutdown() while tasks are in flight.
 */
struct Executor {
    virtual ~Executor() = default;

    virtual auto submit(std::weak_ptr<Task>&&) -> std::optional<Error> = 0;

    auto submit(std::shared_ptr<Task> const& task) -> std::optional<Error> {
        return submit(std::weak_ptr<Task>(task));
    }

    virtual auto shutdown() -> void = 0;

    virtual auto size() const -> size_t = 0;
};

} // namespace WT
