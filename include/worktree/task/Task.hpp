#pragma once
#include "worktree/task/TaskState.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace WT {

/**
 * Unit of work run by an Executor. Always owned through shared_ptr; executors
 * only keep weak references, so whoever wants the task to run must keep it alive
 * until it starts (worker contexts retain their tasks in the side effect's
 * Lifetime).
 */
struct Task {
    template <typename FunctionType>
    static auto Create(std::string label, FunctionType&& fun) -> std::shared_ptr<Task> {
        auto task      = std::shared_ptr<Task>(new Task{});
        task->label_   = std::move(label);
        task->function = std::forward<FunctionType>(fun);
        return task;
    }

    // Created -> Queued. False if the task was already handed to an executor.
    auto markQueued() -> bool;
    // Queued -> Running.
    auto markRunning() -> bool;
    // Running -> Completed.
    auto markCompleted() -> bool;
    // Any state that is not final -> Failed.
    auto markFailed() -> bool;

    auto state() const -> TaskState;
    auto wasQueued() const -> bool;
    auto isCompleted() const -> bool;
    auto isFailed() const -> bool;
    auto label() const -> std::string const&;
    auto stateName() const -> std::string_view;

private:
    friend class TaskPool;

    Task()                       = default; // Use Create()
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    auto advance(TaskState from, TaskState to) -> bool;

    std::atomic<TaskState>          state_{TaskState::Created};
    std::function<void(Task& task)> function;
    std::string                     label_;
};

} // namespace WT
