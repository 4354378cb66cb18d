#include "worktree/runtime/NodeBase.hpp"
#include "worktree/core/TypeName.hpp"
#include "worktree/log/TaggedLogger.hpp"

namespace WT {

NodeBase::NodeBase(std::shared_ptr<TreeEnvironment> environment,
                   std::string const&               workflowType,
                   std::string                      renderKey,
                   std::shared_ptr<WorkflowSession const> parentSession)
    : environment_(std::move(environment)),
      session_(WorkflowSession::make(workflowType, std::move(renderKey), std::move(parentSession))),
      sideEffects_(environment_->observer, session_) {
    wt_log("Node created: " + session_->workflowType + " key='" + session_->renderKey + "' session=" + std::to_string(session_->sessionId), "Node");
    if (auto* obs = observer()) {
        obs->sessionDidBegin(*session_);
    }
}

NodeBase::~NodeBase() {
    // Derived destructors tear down first; this only covers nodes that never got that far.
    tearDown();
}

auto NodeBase::tearDown() -> void {
    if (phase_ == Phase::TornDown) {
        return;
    }
    phase_ = Phase::TornDown;
    wt_log("Node tearDown: " + session_->workflowType + " key='" + session_->renderKey + "'", "Node");
    detach();
    sideEffects_.endAll();
    children_.tearDownAll();
    releaseState();
    if (auto* obs = observer()) {
        obs->sessionDidEnd(*session_);
    }
}

auto NodeBase::debugSnapshot() const -> DebugSnapshot {
    DebugSnapshot snapshot;
    snapshot.workflowType     = typeName(workflowType());
    snapshot.stateDescription = stateDescription();
    for (auto const& [key, child] : children_.sorted()) {
        snapshot.children.push_back(DebugSnapshot::Child{key, child->debugSnapshot()});
    }
    return snapshot;
}

} // namespace WT
