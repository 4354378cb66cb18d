#pragma once
#include "worktree/core/Action.hpp"
#include "worktree/core/ContractViolation.hpp"
#include "worktree/core/Sink.hpp"
#include "worktree/core/Workflow.hpp"
#include "worktree/runtime/ChildRegistry.hpp"
#include "worktree/runtime/NodeTarget.hpp"
#include "worktree/runtime/SideEffectRegistry.hpp"
#include "worktree/runtime/StateMutationSink.hpp"
#include "worktree/worker/Worker.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace WT {

template <typename R, typename O>
class AnyWorkflow;

/**
 * Handed to a workflow's render() for exactly one render pass of one node.
 *
 * Copies share the pass: once render() returns, every copy is stale and any
 * call on it is a contract violation. Sinks made here outlive the pass; they
 * are bound to the node.
 */
template <typename W>
class RenderContext {
public:
    using State  = typename W::State;
    using Output = typename W::Output;

    explicit RenderContext(WorkflowNode<W>& node) : pass_(std::make_shared<Pass>(&node)) {}

    [[nodiscard]] auto isValid() const -> bool { return pass_->valid; }

    // Ends the pass for every copy. Called by the node once render() returns.
    auto invalidate() -> void { pass_->valid = false; }

    /**
     * Renders `child` as a child of this node under (type of C, key) and returns
     * its rendering. A child rendered under the same identity in the previous
     * pass is updated in place; otherwise a new node is created.
     *
     * Without an output map the child's output must itself be an action of this
     * workflow (or NoOutput). With one, `outputMap(childOutput)` produces the
     * action applied here.
     */
    template <Workflow C>
    auto renderChild(C const& child, std::string key = {}) -> typename C::Rendering {
        return renderTypedChild(child, std::move(key), forwardingHandler<typename C::Output>());
    }

    template <Workflow C, typename OutputMap>
    auto renderChild(C const& child, std::string key, OutputMap&& outputMap) -> typename C::Rendering {
        return renderTypedChild(child, std::move(key), mappingHandler<typename C::Output>(std::forward<OutputMap>(outputMap)));
    }

    template <typename R, typename O>
    auto renderChild(AnyWorkflow<R, O> const& child, std::string key = {}) -> R {
        return renderErasedChild(child, std::move(key), forwardingHandler<O>());
    }

    template <typename R, typename O, typename OutputMap>
    auto renderChild(AnyWorkflow<R, O> const& child, std::string key, OutputMap&& outputMap) -> R {
        return renderErasedChild(child, std::move(key), mappingHandler<O>(std::forward<OutputMap>(outputMap)));
    }

    // Sink delivering actions of type A (default: any action) to this node.
    template <typename A = AnyAction<W>>
    auto makeSink() -> Sink<A> {
        static_assert(std::is_constructible_v<AnyAction<W>, A>, "makeSink<A>: A must be an action of this workflow");
        requireValid("makeSink");
        return Sink<A>([target = node().target()](A action) {
            postToNode<W>(target, UpdateDebugInfo::Source::External, nullptr,
                          [stored = AnyAction<W>(std::move(action))]() -> std::optional<AnyAction<W>> { return stored; });
        });
    }

    auto makeStateMutationSink() -> StateMutationSink<W> {
        return StateMutationSink<W>(makeSink<AnyAction<W>>());
    }

    /**
     * Side effect keyed by `key`, started once and kept running for as long as
     * later passes keep registering the key. `work` is called synchronously with
     * a SideEffect<W> handle when the side effect (re)starts.
     */
    template <typename Work>
        requires std::invocable<Work&, SideEffect<W>>
    auto runSideEffect(std::string const& key, Work&& work) -> void {
        registerSideEffect(key, SideEffectRegistry::Parameters{}, work);
    }

    // Restarted whenever `parameters` compare unequal to the running ones.
    template <typename P, typename Work>
        requires(std::invocable<Work&, SideEffect<W>> && std::equality_comparable<P>)
    auto runSideEffect(std::string const& key, P parameters, Work&& work) -> void {
        runSideEffect(key, std::move(parameters), [](P const& previous, P const& next) { return previous == next; }, std::forward<Work>(work));
    }

    // Restarted whenever `equivalent(previous, next)` returns false.
    template <typename P, typename Equivalent, typename Work>
        requires(std::invocable<Work&, SideEffect<W>> && std::predicate<Equivalent&, P const&, P const&>)
    auto runSideEffect(std::string const& key, P parameters, Equivalent equivalent, Work&& work) -> void {
        SideEffectRegistry::Parameters registered{
                std::type_index(typeid(P)),
                std::make_shared<P const>(std::move(parameters)),
                [equivalent](void const* previous, void const* next) mutable {
                    return static_cast<bool>(equivalent(*static_cast<P const*>(previous), *static_cast<P const*>(next)));
                }};
        registerSideEffect(key, std::move(registered), work);
    }

    /**
     * Runs `worker` under `key`. A running worker is kept while the worker
     * rendered under the key stays isEquivalent() to it. Each output is turned
     * into an action by the output map registered in the most recent pass.
     */
    template <Worker Wk, typename OutputMap>
    auto runWorker(Wk worker, std::string const& key, OutputMap&& outputMap) -> void {
        using WorkerOutput = typename Wk::Output;
        struct Slot {
            std::function<AnyAction<W>(WorkerOutput const&)> map;
        };

        requireValid("runWorker");
        auto shared = std::make_shared<Wk const>(std::move(worker));
        SideEffectRegistry::Parameters parameters{
                std::type_index(typeid(Wk)),
                shared,
                [](void const* previous, void const* next) {
                    return static_cast<bool>(static_cast<Wk const*>(next)->isEquivalent(*static_cast<Wk const*>(previous)));
                }};

        auto  target    = node().target();
        auto* executor  = node().environment().executor;
        auto  freshSlot = std::make_shared<Slot>();
        auto  registration = node().sideEffects().run(
                key, std::move(parameters), freshSlot,
                [&shared, &freshSlot, target, executor](std::shared_ptr<Lifetime> const& lifetime) {
                    std::weak_ptr<Slot>         weakSlot = freshSlot;
                    WorkerContext<WorkerOutput> context(
                            lifetime,
                            [target, lifetime, weakSlot](WorkerOutput output) {
                                return postToNode<W>(target, UpdateDebugInfo::Source::Worker, lifetime,
                                                     [weakSlot, output = std::move(output)]() -> std::optional<AnyAction<W>> {
                                                         auto slot = weakSlot.lock();
                                                         if (!slot || !slot->map) {
                                                             return std::nullopt;
                                                         }
                                                         return slot->map(output);
                                                     });
                            },
                            executor);
                    shared->run(context);
                });

        std::static_pointer_cast<Slot>(registration.slot)->map =
                [map = std::forward<OutputMap>(outputMap)](WorkerOutput const& output) mutable { return AnyAction<W>(map(output)); };
    }

    // Worker whose outputs are actions of this workflow.
    template <Worker Wk>
    auto runWorker(Wk worker, std::string const& key) -> void {
        static_assert(std::is_constructible_v<AnyAction<W>, typename Wk::Output>,
                      "runWorker without an output map needs a worker whose Output is an action of this workflow");
        runWorker(std::move(worker), key, [](typename Wk::Output const& output) { return AnyAction<W>(output); });
    }

private:
    struct Pass {
        explicit Pass(WorkflowNode<W>* node) : node(node) {}
        WorkflowNode<W>* node;
        bool             valid = true;
    };

    template <typename ChildOutput>
    using OutputHandler = std::function<void(std::optional<ChildOutput>, UpdateDebugInfo)>;

    auto node() const -> WorkflowNode<W>& { return *pass_->node; }

    auto requireValid(char const* operation) const -> void {
        if (!pass_->valid) {
            contractViolation(std::string(operation) + " called on a RenderContext after its render pass ended");
        }
    }

    template <typename ChildOutput, typename OutputMap>
    auto mappingHandler(OutputMap&& outputMap) -> OutputHandler<ChildOutput> {
        WorkflowNode<W>* parent = &node();
        return [parent, map = std::forward<OutputMap>(outputMap)](std::optional<ChildOutput> output, UpdateDebugInfo info) mutable {
            if (output) {
                parent->handleSubtreeUpdate(AnyAction<W>(map(std::move(*output))), std::move(info));
            } else {
                parent->handleSubtreeUpdate(std::nullopt, std::move(info));
            }
        };
    }

    template <typename ChildOutput>
    auto forwardingHandler() -> OutputHandler<ChildOutput> {
        WorkflowNode<W>* parent = &node();
        return [parent](std::optional<ChildOutput> output, UpdateDebugInfo info) {
            if constexpr (std::is_same_v<ChildOutput, NoOutput>) {
                parent->handleSubtreeUpdate(std::nullopt, std::move(info));
            } else {
                static_assert(std::is_constructible_v<AnyAction<W>, ChildOutput>,
                              "renderChild without an output map needs a child whose Output is an action of this workflow");
                if (output) {
                    parent->handleSubtreeUpdate(AnyAction<W>(std::move(*output)), std::move(info));
                } else {
                    parent->handleSubtreeUpdate(std::nullopt, std::move(info));
                }
            }
        };
    }

    template <Workflow C>
    auto renderTypedChild(C const& child, std::string key, OutputHandler<typename C::Output> handler) -> typename C::Rendering {
        requireValid("renderChild");
        auto&    parent = node();
        ChildKey childKey{std::type_index(typeid(C)), key};
        auto*    existing = parent.children().claim(childKey);
        if (existing == nullptr) {
            existing = &parent.children().adopt(
                    childKey, std::make_unique<WorkflowNode<C>>(child, parent.environmentPtr(), key, parent.sessionPtr()));
        }
        auto& childNode = static_cast<WorkflowNode<C>&>(*existing);
        childNode.setOutputHandler(std::move(handler));
        return childNode.render(child);
    }

    template <typename R, typename O>
    auto renderErasedChild(AnyWorkflow<R, O> const& child, std::string key, OutputHandler<O> handler) -> R {
        requireValid("renderChild");
        auto&    parent = node();
        ChildKey childKey{child.workflowType(), key};
        auto*    existing = parent.children().claim(childKey);
        if (existing == nullptr) {
            existing = &parent.children().adopt(childKey, child.makeNode(parent.environmentPtr(), key, parent.sessionPtr()));
        }
        return child.renderNode(*existing, std::move(handler));
    }

    template <typename Work>
    auto registerSideEffect(std::string const& key, SideEffectRegistry::Parameters parameters, Work& work) -> void {
        requireValid("runSideEffect");
        auto target = node().target();
        node().sideEffects().run(key, std::move(parameters), nullptr, [&work, target](std::shared_ptr<Lifetime> const& lifetime) {
            work(SideEffect<W>(lifetime, target));
        });
    }

    std::shared_ptr<Pass> pass_;
};

} // namespace WT
