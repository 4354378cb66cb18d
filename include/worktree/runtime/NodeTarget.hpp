#pragma once
#include "worktree/core/Action.hpp"
#include "worktree/core/Lifetime.hpp"
#include "worktree/core/Workflow.hpp"
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/runtime/Debugging.hpp"
#include "worktree/runtime/EventLoop.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace WT {

template <Workflow W>
class WorkflowNode;

/**
 * Delivery target shared between a node and every sink or side effect bound to
 * it. Senders hold it weakly and check `alive` before queueing; the queued event
 * checks again on the loop thread before touching the node, so anything arriving
 * after teardown is dropped.
 */
template <typename W>
class NodeTarget {
public:
    NodeTarget(WorkflowNode<W>* node, std::weak_ptr<EventLoop> loop, std::string workflowType)
        : node(node), loop(std::move(loop)), workflowType(std::move(workflowType)) {}

    [[nodiscard]] auto isAlive() const -> bool { return alive.load(std::memory_order_acquire); }

    // Loop thread only.
    auto detach() -> void {
        alive.store(false, std::memory_order_release);
        node = nullptr;
    }

    // Loop thread only.
    [[nodiscard]] auto liveNode() const -> WorkflowNode<W>* { return isAlive() ? node : nullptr; }
    [[nodiscard]] auto eventLoop() const -> std::shared_ptr<EventLoop> { return loop.lock(); }
    [[nodiscard]] auto typeName() const -> std::string const& { return workflowType; }

private:
    std::atomic<bool>        alive{true};
    WorkflowNode<W>*         node;
    std::weak_ptr<EventLoop> loop;
    std::string              workflowType;
};

/**
 * Queues an event for the node behind `weakTarget`. `makeAction` runs on the loop
 * thread when the event is applied and may return nullopt to drop it. When
 * `lifetime` is given, the event is dropped once it has ended, both here and at
 * apply time. Returns false if the event was dropped immediately.
 */
template <typename W>
auto postToNode(std::weak_ptr<NodeTarget<W>> const& weakTarget,
                UpdateDebugInfo::Source source,
                std::shared_ptr<Lifetime> const& lifetime,
                std::function<std::optional<AnyAction<W>>()> makeAction) -> bool {
    auto target = weakTarget.lock();
    if (!target || !target->isAlive()) {
        wt_log("Dropping event for a torn-down node", "EventLoop");
        return false;
    }
    if (lifetime && lifetime->hasEnded()) {
        wt_log("Dropping event from an ended side effect for " + target->typeName(), "SideEffect");
        return false;
    }
    auto loop = target->eventLoop();
    if (!loop) {
        return false;
    }
    auto label = std::string(updateSourceToString(source)) + " -> " + target->typeName();
    target.reset();
    return loop->post(EventLoop::Event{
            [weakTarget, source, lifetime, makeAction = std::move(makeAction)]() -> bool {
                auto target = weakTarget.lock();
                auto* node  = target ? target->liveNode() : nullptr;
                if (node == nullptr) {
                    return false;
                }
                if (lifetime && lifetime->hasEnded()) {
                    wt_log("Discarding late delivery from an ended side effect for " + target->typeName(), "SideEffect");
                    return false;
                }
                auto action = makeAction();
                if (!action) {
                    return false;
                }
                node->handle(std::move(*action), source);
                return true;
            },
            std::move(label)});
}

/**
 * Handle given to side-effect work: its Lifetime plus a send() that delivers
 * actions to the owning node until the Lifetime ends. Copyable and usable from
 * any thread.
 */
template <typename W>
class SideEffect {
public:
    SideEffect(std::shared_ptr<Lifetime> lifetime, std::weak_ptr<NodeTarget<W>> target)
        : lifetime_(std::move(lifetime)), target_(std::move(target)) {}

    [[nodiscard]] auto lifetime() const -> Lifetime& { return *lifetime_; }
    [[nodiscard]] auto lifetimePtr() const -> std::shared_ptr<Lifetime> const& { return lifetime_; }
    [[nodiscard]] auto isCancelled() const -> bool { return lifetime_->hasEnded(); }

    // Returns false when the action was dropped because the side effect ended or
    // the node is gone.
    template <typename A>
    auto send(A action) const -> bool {
        return postToNode<W>(target_, UpdateDebugInfo::Source::SideEffect, lifetime_,
                             [stored = AnyAction<W>(std::move(action))]() -> std::optional<AnyAction<W>> { return stored; });
    }

private:
    std::shared_ptr<Lifetime>    lifetime_;
    std::weak_ptr<NodeTarget<W>> target_;
};

} // namespace WT
