#include "worktree/task/Task.hpp"

namespace WT {

auto taskStateName(TaskState state) -> std::string_view {
    switch (state) {
        case TaskState::Created:
            return "Created";
        case TaskState::Queued:
            return "Queued";
        case TaskState::Running:
            return "Running";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Failed:
            return "Failed";
    }
    return "Unknown";
}

auto Task::advance(TaskState from, TaskState to) -> bool {
    return this->state_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

auto Task::markQueued() -> bool {
    return advance(TaskState::Created, TaskState::Queued);
}

auto Task::markRunning() -> bool {
    return advance(TaskState::Queued, TaskState::Running);
}

auto Task::markCompleted() -> bool {
    return advance(TaskState::Running, TaskState::Completed);
}

auto Task::markFailed() -> bool {
    auto current = this->state_.load(std::memory_order_acquire);
    while (current != TaskState::Completed && current != TaskState::Failed) {
        if (this->state_.compare_exchange_weak(current, TaskState::Failed, std::memory_order_acq_rel)) {
            return true;
        }
    }
    return false;
}

auto Task::state() const -> TaskState {
    return this->state_.load(std::memory_order_acquire);
}

auto Task::wasQueued() const -> bool {
    return state() != TaskState::Created;
}

auto Task::isCompleted() const -> bool {
    return state() == TaskState::Completed;
}

auto Task::isFailed() const -> bool {
    return state() == TaskState::Failed;
}

auto Task::label() const -> std::string const& {
    return this->label_;
}

auto Task::stateName() const -> std::string_view {
    return taskStateName(state());
}

} // namespace WT
