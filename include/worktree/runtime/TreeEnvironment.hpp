#pragma once
#include "worktree/runtime/EventLoop.hpp"
#include "worktree/runtime/Observer.hpp"
#include "worktree/runtime/RuntimeConfiguration.hpp"
#include "worktree/task/Executor.hpp"

#include <memory>

namespace WT {

/**
 * State shared by every node of one tree. Created by the host (or directly by
 * tests driving nodes by hand) on the loop thread.
 */
struct TreeEnvironment {
    RuntimeConfiguration              configuration;
    std::shared_ptr<EventLoop>        loop;
    std::shared_ptr<WorkflowObserver> observer;
    Executor*                         executor = nullptr;

    // Set while an action's apply() runs. Loop thread only.
    bool applying = false;

    // `executor` defaults to TaskPool::Instance().
    static auto make(RuntimeConfiguration configuration              = {},
                     std::shared_ptr<WorkflowObserver> observer      = nullptr,
                     Executor*                         executor      = nullptr) -> std::shared_ptr<TreeEnvironment>;
};

} // namespace WT
