#pragma once
#include "worktree/runtime/ChildRegistry.hpp"
#include "worktree/runtime/Debugging.hpp"
#include "worktree/runtime/Session.hpp"
#include "worktree/runtime/SideEffectRegistry.hpp"
#include "worktree/runtime/TreeEnvironment.hpp"

#include <memory>
#include <string>
#include <typeindex>

namespace WT {

/**
 * Type-erased part of a live node: lifecycle, session, and the child and side
 * effect registries. WorkflowNode<W> adds the typed definition and state.
 *
 * Phases: Uninitialized (constructed, never rendered) -> Active (rendered at
 * least once) -> TornDown. There is no way back from TornDown.
 */
class NodeBase {
public:
    enum class Phase { Uninitialized, Active, TornDown };

    NodeBase(std::shared_ptr<TreeEnvironment> environment,
             std::string const&               workflowType,
             std::string                      renderKey,
             std::shared_ptr<WorkflowSession const> parentSession);
    virtual ~NodeBase();

    NodeBase(NodeBase const&)            = delete;
    NodeBase& operator=(NodeBase const&) = delete;

    /**
     * Ends this node's side effects, then tears down and releases every child,
     * then releases this node's state. Idempotent. Sinks bound to this node drop
     * everything sent afterwards.
     */
    auto tearDown() -> void;

    [[nodiscard]] auto phase() const -> Phase { return phase_; }
    [[nodiscard]] auto isTornDown() const -> bool { return phase_ == Phase::TornDown; }
    [[nodiscard]] auto session() const -> WorkflowSession const& { return *session_; }
    [[nodiscard]] auto sessionPtr() const -> std::shared_ptr<WorkflowSession const> const& { return session_; }
    [[nodiscard]] auto environment() const -> TreeEnvironment& { return *environment_; }
    [[nodiscard]] auto environmentPtr() const -> std::shared_ptr<TreeEnvironment> const& { return environment_; }

    [[nodiscard]] auto children() -> ChildRegistry& { return children_; }
    [[nodiscard]] auto children() const -> ChildRegistry const& { return children_; }
    [[nodiscard]] auto sideEffects() -> SideEffectRegistry& { return sideEffects_; }
    [[nodiscard]] auto sideEffects() const -> SideEffectRegistry const& { return sideEffects_; }

    [[nodiscard]] auto debugSnapshot() const -> DebugSnapshot;

    [[nodiscard]] virtual auto workflowType() const -> std::type_index = 0;
    [[nodiscard]] virtual auto stateDescription() const -> std::string = 0;

    // Set when something in this subtree changed since the node last rendered.
    [[nodiscard]] auto isDirty() const -> bool { return dirty_; }

protected:
    // Hooks run by tearDown(). detach() runs first, releaseState() last.
    virtual auto detach() -> void {}
    virtual auto releaseState() -> void {}

    auto markDirty() -> void { dirty_ = true; }
    auto markClean() -> void { dirty_ = false; }
    auto activate() -> void { phase_ = Phase::Active; }

    [[nodiscard]] auto observer() const -> WorkflowObserver* { return environment_->observer.get(); }

private:
    std::shared_ptr<TreeEnvironment>       environment_;
    std::shared_ptr<WorkflowSession const> session_;
    SideEffectRegistry                     sideEffects_;
    ChildRegistry                          children_;
    Phase                                  phase_ = Phase::Uninitialized;
    bool                                   dirty_ = true;
};

} // namespace WT
