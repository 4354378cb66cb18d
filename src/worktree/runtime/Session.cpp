#include "worktree/runtime/Session.hpp"

#include <atomic>

namespace WT {

auto nextSessionId() -> std::uint64_t {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

auto WorkflowSession::make(std::string workflowType,
                           std::string renderKey,
                           std::shared_ptr<WorkflowSession const> parent) -> std::shared_ptr<WorkflowSession const> {
    auto session          = std::make_shared<WorkflowSession>();
    session->workflowType = std::move(workflowType);
    session->renderKey    = std::move(renderKey);
    session->sessionId    = nextSessionId();
    session->parent       = std::move(parent);
    return session;
}

auto WorkflowSession::depth() const -> std::size_t {
    std::size_t depth = 0;
    for (auto* current = parent.get(); current != nullptr; current = current->parent.get()) {
        ++depth;
    }
    return depth;
}

} // namespace WT
