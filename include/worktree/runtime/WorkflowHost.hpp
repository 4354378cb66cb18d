#pragma once
#include "worktree/core/ContractViolation.hpp"
#include "worktree/core/Workflow.hpp"
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/runtime/Debugging.hpp"
#include "worktree/runtime/EventLoop.hpp"
#include "worktree/runtime/HostOptions.hpp"
#include "worktree/runtime/Node.hpp"
#include "worktree/runtime/Subscription.hpp"
#include "worktree/runtime/TreeEnvironment.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace WT {

/**
 * Owns a workflow tree and runs it on the thread that constructed the host.
 *
 * The constructor renders the root once. Afterwards every event queued by a sink,
 * side effect or worker is applied on its own, followed by exactly one render
 * pass from the root; the new rendering is published first, then the root's
 * output when the event produced one.
 *
 * Events posted from other threads wait in the queue until processEvents() runs
 * on the loop thread. With drain_on_send set, sinks invoked on the loop thread
 * outside of a render pass are applied before they return.
 */
template <Workflow W>
class WorkflowHost {
public:
    using Rendering = typename W::Rendering;
    using Output    = typename W::Output;

    explicit WorkflowHost(W root, HostOptions options = {})
        : options_(std::move(options)),
          environment_(TreeEnvironment::make(options_.configuration, chainObservers(options_.observers), options_.executor)),
          renderings_(std::make_shared<SubscriberList<Rendering>>()),
          outputs_(std::make_shared<SubscriberList<Output>>()) {
        environment_->loop->setDispatcher([this](EventLoop::Event& event) { dispatch(event); });
        root_ = std::make_unique<WorkflowNode<W>>(root, environment_);
        root_->setOutputHandler([this](std::optional<Output> output, UpdateDebugInfo info) {
            pendingOutput_ = std::move(output);
            pendingInfo_.emplace(std::move(info));
        });
        wt_log("WorkflowHost starting with root " + root_->session().workflowType, "Host");
        renderRoot(&root);
        if (options_.debugger) {
            options_.debugger->didEnterInitialState(root_->debugSnapshot());
        }
        environment_->loop->drain();
    }

    ~WorkflowHost() {
        environment_->loop->close();
        environment_->loop->setDispatcher(nullptr);
        root_->tearDown();
        wt_log("WorkflowHost torn down", "Host");
    }

    WorkflowHost(WorkflowHost const&)            = delete;
    WorkflowHost& operator=(WorkflowHost const&) = delete;

    // Renders the root with new props, publishes, reports the update to the
    // debugger, then applies events queued meanwhile.
    auto update(W const& root) -> void {
        WT_REQUIRE(environment_->loop->isLoopThread(), "WorkflowHost::update called off the loop thread");
        WT_REQUIRE(!environment_->applying, "WorkflowHost::update called while an action is being applied");
        renderRoot(&root);
        if (options_.debugger) {
            options_.debugger->didUpdate(root_->debugSnapshot(),
                                         UpdateDebugInfo::didUpdate(root_->session().workflowType, UpdateDebugInfo::Source::External));
        }
        environment_->loop->drain();
    }

    // Applies events queued from other threads. Returns how many were handled.
    auto processEvents() -> std::size_t {
        WT_REQUIRE(environment_->loop->isLoopThread(), "WorkflowHost::processEvents called off the loop thread");
        return environment_->loop->drain();
    }

    // Blocks until an event is queued or `timeout` expires. Returns true if events are pending.
    auto waitForEvents(std::chrono::milliseconds timeout) -> bool {
        return environment_->loop->waitForEvents(timeout);
    }

    // The callback is not invoked for the current rendering, only for later ones.
    auto subscribeRendering(std::function<void(Rendering const&)> callback) -> Subscription {
        return renderings_->add(std::move(callback));
    }

    auto subscribeOutput(std::function<void(Output const&)> callback) -> Subscription {
        return outputs_->add(std::move(callback));
    }

    [[nodiscard]] auto rendering() const -> Rendering const& { return *rendering_; }
    [[nodiscard]] auto debugSnapshot() const -> DebugSnapshot { return root_->debugSnapshot(); }
    [[nodiscard]] auto rootNode() -> WorkflowNode<W>& { return *root_; }
    [[nodiscard]] auto rootNode() const -> WorkflowNode<W> const& { return *root_; }
    [[nodiscard]] auto environment() const -> TreeEnvironment& { return *environment_; }

private:
    struct RenderingScope {
        explicit RenderingScope(bool& flag) : flag(flag) { flag = true; }
        ~RenderingScope() { flag = false; }
        bool& flag;
    };

    auto renderRoot(W const* definition) -> void {
        WT_REQUIRE(!inRender_, "the workflow tree was asked to render while it is already rendering");
        auto* obs = environment_->observer.get();
        {
            EventLoop::BusyScope busy(*environment_->loop);
            RenderingScope       rendering(inRender_);
            if (obs) {
                obs->hostWillRender(root_->session());
            }
            if (definition != nullptr) {
                rendering_.emplace(root_->render(*definition));
            } else {
                rendering_.emplace(root_->render());
            }
            if (obs) {
                obs->hostDidRender(root_->session());
            }
        }
        EventLoop::BusyScope busy(*environment_->loop);
        renderings_->publish(*rendering_);
    }

    auto dispatch(EventLoop::Event& event) -> void {
        auto* obs = environment_->observer.get();
        if (obs) {
            obs->hostWillApplyEvent(root_->session(), event.label);
        }
        pendingOutput_.reset();
        pendingInfo_.reset();
        bool const applied = event.apply();
        if (obs) {
            obs->hostDidApplyEvent(root_->session(), event.label, applied);
        }
        if (!applied) {
            wt_log("Event had no live target: " + event.label, "Host");
            return;
        }

        renderRoot(nullptr);
        if (pendingOutput_) {
            auto output = std::move(*pendingOutput_);
            pendingOutput_.reset();
            EventLoop::BusyScope busy(*environment_->loop);
            outputs_->publish(output);
        }
        if (options_.debugger && pendingInfo_) {
            options_.debugger->didUpdate(root_->debugSnapshot(), *pendingInfo_);
        }
    }

    HostOptions                                options_;
    std::shared_ptr<TreeEnvironment>           environment_;
    std::shared_ptr<SubscriberList<Rendering>> renderings_;
    std::shared_ptr<SubscriberList<Output>>    outputs_;
    std::unique_ptr<WorkflowNode<W>>           root_;
    std::optional<Rendering>                   rendering_;
    std::optional<Output>                      pendingOutput_;
    std::optional<UpdateDebugInfo>             pendingInfo_;
    bool                                       inRender_ = false;
};

} // namespace WT
