#pragma once
#include "worktree/core/Action.hpp"
#include "worktree/runtime/AnyWorkflow.hpp"
#include "worktree/runtime/RenderContext.hpp"

#include <string>
#include <utility>

namespace WT {

/**
 * Renders a child that produces outputs but no rendering, and renders the most
 * recent output instead (`initialValue` until the first one arrives).
 *
 *   RenderLatestOutputWorkflow<int> latest{AnyWorkflow<NoRendering, int>(CounterWorker{}), 0};
 */
template <typename O>
struct RenderLatestOutputWorkflow {
    using State     = O;
    using Rendering = O;
    using Output    = NoOutput;

    AnyWorkflow<NoRendering, O> child;
    O                           initialValue{};
    std::string                 childKey;

    auto makeInitialState() const -> State { return initialValue; }

    auto render(State const& state, RenderContext<RenderLatestOutputWorkflow>& context) const -> Rendering {
        context.renderChild(child, childKey, [](O const& output) {
            return AnyAction<RenderLatestOutputWorkflow>([output](State& latest) { latest = output; });
        });
        return state;
    }
};

} // namespace WT
