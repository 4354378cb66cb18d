#pragma once
#include "worktree/core/Workflow.hpp"
#include "worktree/runtime/Node.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace WT {

/**
 * Type-erased workflow with Rendering R and Output O. Rendered as a child it
 * keeps the identity of the wrapped type: wrapping a different workflow type
 * under the same key replaces the child.
 *
 *   AnyWorkflow<std::string, NoOutput> screen = LoginWorkflow{...};
 *   auto text = context.renderChild(screen, "screen");
 */
template <typename R, typename O>
class AnyWorkflow {
public:
    using Rendering     = R;
    using Output        = O;
    using OutputHandler = std::function<void(std::optional<O>, UpdateDebugInfo)>;

    template <Workflow W>
        requires(!std::same_as<W, AnyWorkflow> && std::convertible_to<typename W::Rendering, R> && std::same_as<typename W::Output, O>)
    AnyWorkflow(W workflow) : storage(std::make_shared<Model<W>>(std::move(workflow))) {}

    [[nodiscard]] auto workflowType() const -> std::type_index { return storage->type(); }

    // New node for the wrapped workflow, not yet rendered.
    auto makeNode(std::shared_ptr<TreeEnvironment> environment,
                  std::string key,
                  std::shared_ptr<WorkflowSession const> parentSession) const -> std::unique_ptr<NodeBase> {
        return storage->makeNode(std::move(environment), std::move(key), std::move(parentSession));
    }

    // `node` must have been made by makeNode() of an AnyWorkflow wrapping the same type.
    auto renderNode(NodeBase& node, OutputHandler handler) const -> R {
        return storage->render(node, std::move(handler));
    }

    /**
     * Same workflow with every output passed through `transform`. The wrapped
     * type, and with it the child identity, is unchanged.
     */
    template <typename Transform>
        requires std::invocable<Transform&, O>
    auto mapOutput(Transform transform) const -> AnyWorkflow<R, std::decay_t<std::invoke_result_t<Transform&, O>>> {
        using MappedOutput = std::decay_t<std::invoke_result_t<Transform&, O>>;
        using Result       = AnyWorkflow<R, MappedOutput>;
        return Result(std::make_shared<typename Result::template Mapped<R, O>>(
                *this, [](R rendering) { return rendering; }, std::function<MappedOutput(O)>(std::move(transform))));
    }

    // Same workflow with its rendering passed through `transform`.
    template <typename Transform>
        requires std::invocable<Transform&, R>
    auto mapRendering(Transform transform) const -> AnyWorkflow<std::decay_t<std::invoke_result_t<Transform&, R>>, O> {
        using MappedRendering = std::decay_t<std::invoke_result_t<Transform&, R>>;
        using Result          = AnyWorkflow<MappedRendering, O>;
        return Result(std::make_shared<typename Result::template Mapped<R, O>>(
                *this, std::function<MappedRendering(R)>(std::move(transform)), [](O output) { return output; }));
    }

private:
    template <typename, typename>
    friend class AnyWorkflow;

    struct Storage {
        virtual ~Storage() = default;

        [[nodiscard]] virtual auto type() const -> std::type_index = 0;
        virtual auto makeNode(std::shared_ptr<TreeEnvironment> environment,
                              std::string key,
                              std::shared_ptr<WorkflowSession const> parentSession) const -> std::unique_ptr<NodeBase> = 0;
        virtual auto render(NodeBase& node, OutputHandler handler) const -> R = 0;
    };

    template <Workflow W>
    struct Model final : Storage {
        explicit Model(W workflow) : workflow(std::move(workflow)) {}

        auto type() const -> std::type_index override { return std::type_index(typeid(W)); }

        auto makeNode(std::shared_ptr<TreeEnvironment> environment,
                      std::string key,
                      std::shared_ptr<WorkflowSession const> parentSession) const -> std::unique_ptr<NodeBase> override {
            return std::make_unique<WorkflowNode<W>>(workflow, std::move(environment), std::move(key), std::move(parentSession));
        }

        auto render(NodeBase& node, OutputHandler handler) const -> R override {
            auto& typed = static_cast<WorkflowNode<W>&>(node);
            typed.setOutputHandler(std::move(handler));
            return R(typed.render(workflow));
        }

        W workflow;
    };

    // Another AnyWorkflow seen through a rendering and an output transform.
    template <typename InnerR, typename InnerO>
    struct Mapped final : Storage {
        Mapped(AnyWorkflow<InnerR, InnerO> inner, std::function<R(InnerR)> renderingTransform, std::function<O(InnerO)> outputTransform)
            : inner(std::move(inner)), renderingTransform(std::move(renderingTransform)), outputTransform(std::move(outputTransform)) {}

        auto type() const -> std::type_index override { return inner.workflowType(); }

        auto makeNode(std::shared_ptr<TreeEnvironment> environment,
                      std::string key,
                      std::shared_ptr<WorkflowSession const> parentSession) const -> std::unique_ptr<NodeBase> override {
            return inner.makeNode(std::move(environment), std::move(key), std::move(parentSession));
        }

        auto render(NodeBase& node, OutputHandler handler) const -> R override {
            auto forward = [handler = std::move(handler), transform = outputTransform](std::optional<InnerO> output, UpdateDebugInfo info) {
                if (output) {
                    handler(transform(std::move(*output)), std::move(info));
                } else {
                    handler(std::nullopt, std::move(info));
                }
            };
            return renderingTransform(inner.renderNode(node, std::move(forward)));
        }

        AnyWorkflow<InnerR, InnerO> inner;
        std::function<R(InnerR)>    renderingTransform;
        std::function<O(InnerO)>    outputTransform;
    };

    explicit AnyWorkflow(std::shared_ptr<Storage const> storage) : storage(std::move(storage)) {}

    std::shared_ptr<Storage const> storage;
};

} // namespace WT
