#pragma once
#include "worktree/runtime/Debugging.hpp"
#include "worktree/runtime/Observer.hpp"
#include "worktree/runtime/RuntimeConfiguration.hpp"
#include "worktree/task/Executor.hpp"

#include <memory>
#include <vector>

namespace WT {

struct HostOptions {
    RuntimeConfiguration configuration;

    // Chained in this order; see ChainedObserver.
    std::vector<std::shared_ptr<WorkflowObserver>> observers;

    std::shared_ptr<WorkflowDebugger> debugger;

    // Runs worker tasks. nullptr means TaskPool::Instance(). Must outlive the host.
    Executor* executor = nullptr;
};

} // namespace WT
