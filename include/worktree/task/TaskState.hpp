#pragma once
#include <string_view>

namespace WT {

// Lifecycle of a Task. Moves forward only; Completed and Failed are final.
enum class TaskState {
    Created,
    Queued,
    Running,
    Completed,
    Failed
};

auto taskStateName(TaskState state) -> std::string_view;

} // namespace WT
