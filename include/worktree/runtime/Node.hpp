#pragma once
#include "worktree/core/Action.hpp"
#include "worktree/core/ContractViolation.hpp"
#include "worktree/core/TypeName.hpp"
#include "worktree/core/Workflow.hpp"
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/runtime/Debugging.hpp"
#include "worktree/runtime/NodeBase.hpp"
#include "worktree/runtime/NodeTarget.hpp"
#include "worktree/runtime/RenderContext.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <utility>

namespace WT {

/**
 * Live instance of workflow W in the tree: its current definition, its state and
 * the registries inherited from NodeBase.
 *
 * Everything here runs on the loop thread. Actions arrive through handle() (from
 * sinks, side effects and workers, via the event loop) or handleSubtreeUpdate()
 * (from a child's output); either marks the node dirty and forwards the result
 * to the output handler installed by the parent or the host.
 */
template <Workflow W>
class WorkflowNode final : public NodeBase {
public:
    using State         = typename W::State;
    using Rendering     = typename W::Rendering;
    using Output        = typename W::Output;
    using OutputHandler = std::function<void(std::optional<Output>, UpdateDebugInfo)>;

    WorkflowNode(W const& definition,
                 std::shared_ptr<TreeEnvironment> environment,
                 std::string key = {},
                 std::shared_ptr<WorkflowSession const> parentSession = nullptr)
        : NodeBase(std::move(environment), typeName<W>(), std::move(key), std::move(parentSession)),
          definition_(definition) {
        target_ = std::make_shared<NodeTarget<W>>(this, this->environment().loop, session().workflowType);
    }

    ~WorkflowNode() override { tearDown(); }

    /**
     * Renders the node with `definition`. The first call creates the initial
     * state; later calls run W::update() (when declared) against the previous
     * definition before rendering.
     */
    auto render(W const& definition) -> Rendering {
        WT_REQUIRE(!isTornDown(), "render called on torn-down " + session().workflowType);
        if (phase() == Phase::Uninitialized) {
            definition_.emplace(definition);
            state_.emplace(definition_->makeInitialState());
            activate();
            markDirty();
            if (auto* obs = observer()) {
                obs->workflowDidMakeInitialState(session(), stateDescription());
            }
        } else {
            W previous = std::move(*definition_);
            definition_.emplace(definition);
            if (propsOrStateChanged(previous)) {
                markDirty();
            }
            if (auto* obs = observer()) {
                obs->workflowDidChange(session(), stateDescription());
            }
        }
        return renderPass();
    }

    // Renders again with the current definition. Neither W::update() nor
    // workflowDidChange runs: only the state may have moved since the last pass.
    auto render() -> Rendering {
        WT_REQUIRE(definition_.has_value(), "render called on a node without a definition");
        WT_REQUIRE(!isTornDown(), "render called on torn-down " + session().workflowType);
        if (phase() == Phase::Uninitialized) {
            W current = *definition_;
            return render(current);
        }
        return renderPass();
    }

    // Applies an action delivered from outside the tree (sink, side effect, worker).
    auto handle(AnyAction<W> const& action, UpdateDebugInfo::Source source = UpdateDebugInfo::Source::External) -> void {
        applyAction(action, UpdateDebugInfo::didUpdate(session().workflowType, source));
    }

    // Called by a child's output handler: applies the mapped action, or just
    // records that something below changed.
    auto handleSubtreeUpdate(std::optional<AnyAction<W>> action, UpdateDebugInfo childInfo) -> void {
        markDirty();
        if (action) {
            applyAction(*action, UpdateDebugInfo::didUpdateFromSubtree(session().workflowType, std::move(childInfo)));
        } else {
            propagate(std::nullopt, UpdateDebugInfo::childDidUpdate(session().workflowType, std::move(childInfo)));
        }
    }

    auto setOutputHandler(OutputHandler handler) -> void { outputHandler_ = std::move(handler); }

    [[nodiscard]] auto state() const -> State const& {
        WT_REQUIRE(state_.has_value(), "state of " + session().workflowType + " read before the first render or after teardown");
        return *state_;
    }

    [[nodiscard]] auto definition() const -> W const& { return *definition_; }
    [[nodiscard]] auto target() const -> std::weak_ptr<NodeTarget<W>> { return target_; }

    [[nodiscard]] auto workflowType() const -> std::type_index override { return std::type_index(typeid(W)); }

    [[nodiscard]] auto stateDescription() const -> std::string override {
        if (!state_) {
            return "<no state>";
        }
        return describe(*state_);
    }

protected:
    auto detach() -> void override {
        if (target_) {
            target_->detach();
        }
    }

    auto releaseState() -> void override {
        state_.reset();
        cached_.reset();
        outputHandler_ = nullptr;
    }

private:
    struct ApplyingScope {
        explicit ApplyingScope(TreeEnvironment& environment) : environment(environment) { environment.applying = true; }
        ~ApplyingScope() { environment.applying = false; }
        TreeEnvironment& environment;
    };

    struct PassGuard {
        RenderContext<W>& context;
        ~PassGuard() { context.invalidate(); }
    };

    auto cachingEnabled() const -> bool { return environment().configuration.render_only_if_state_changed; }

    auto propsOrStateChanged(W const& previous) -> bool {
        bool changed = true;
        if constexpr (std::equality_comparable<W>) {
            changed = !(previous == *definition_);
        }
        if constexpr (HasUpdate<W>) {
            if constexpr (std::copy_constructible<State> && std::equality_comparable<State>) {
                if (cachingEnabled()) {
                    State before = *state_;
                    definition_->update(previous, *state_);
                    return changed || !(before == *state_);
                }
            }
            definition_->update(previous, *state_);
            return true;
        }
        return changed;
    }

    auto renderPass() -> Rendering {
        auto* obs = observer();
        if constexpr (std::copy_constructible<Rendering>) {
            if (cachingEnabled() && cached_ && !isDirty()) {
                wt_log("Reusing cached rendering of " + session().workflowType, "Render");
                if (obs) {
                    obs->workflowWillRender(session(), stateDescription());
                    obs->workflowDidRender(session(), true);
                }
                return *cached_;
            }
        }
        if (obs) {
            obs->workflowWillRender(session(), stateDescription());
        }

        EventLoop::BusyScope busy(*environment().loop);
        children().beginPass();
        sideEffects().beginPass();
        std::optional<Rendering> rendering;
        {
            RenderContext<W> context(*this);
            PassGuard        guard{context};
            rendering.emplace(definition_->render(*state_, context));
        }
        children().endPass();
        sideEffects().endPass();
        markClean();

        if constexpr (std::copy_constructible<Rendering>) {
            if (cachingEnabled()) {
                cached_.emplace(*rendering);
            }
        }
        if (obs) {
            obs->workflowDidRender(session(), false);
        }
        return std::move(*rendering);
    }

    auto applyAction(AnyAction<W> const& action, UpdateDebugInfo info) -> void {
        WT_REQUIRE(phase() == Phase::Active, "action delivered to " + session().workflowType + " while it is not active");
        WT_REQUIRE(!environment().applying,
                   "action " + action.description() + " applied to " + session().workflowType + " while another action is being applied");

        auto* obs = observer();
        if (obs) {
            obs->workflowDidReceiveAction(session(), action.description());
            obs->workflowWillApplyAction(session(), action.description(), stateDescription());
        }
        wt_log("Applying " + action.description() + " to " + session().workflowType, "Action");

        std::optional<Output> output;
        {
            ApplyingScope applying(environment());
            output = action.apply(*state_, ApplyContext<W>(*definition_));
        }
        markDirty();
        if (obs) {
            obs->workflowDidApplyAction(session(), action.description(), output.has_value());
        }
        propagate(std::move(output), std::move(info));
    }

    auto propagate(std::optional<Output> output, UpdateDebugInfo info) -> void {
        if (outputHandler_) {
            outputHandler_(std::move(output), std::move(info));
        }
    }

    std::optional<W>               definition_;
    std::optional<State>           state_;
    std::optional<Rendering>       cached_;
    OutputHandler                  outputHandler_;
    std::shared_ptr<NodeTarget<W>> target_;
};

} // namespace WT
