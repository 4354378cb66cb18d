#include "worktree/runtime/TreeEnvironment.hpp"
#include "worktree/task/TaskPool.hpp"

namespace WT {

auto TreeEnvironment::make(RuntimeConfiguration configuration,
                           std::shared_ptr<WorkflowObserver> observer,
                           Executor* executor) -> std::shared_ptr<TreeEnvironment> {
    auto environment           = std::make_shared<TreeEnvironment>();
    environment->configuration = configuration;
    environment->loop          = std::make_shared<EventLoop>(configuration);
    environment->observer      = std::move(observer);
    environment->executor      = executor != nullptr ? executor : &TaskPool::Instance();
    return environment;
}

} // namespace WT
