#pragma once
#include "worktree/core/Action.hpp"

#include <concepts>
#include <type_traits>

namespace WT {

template <typename W>
class RenderContext;

/**
 * A workflow definition is an immutable value type (its props) declaring
 *
 *   using State     = ...;
 *   using Rendering = ...;
 *   using Output    = ...;   // NoOutput when it never emits
 *
 *   auto makeInitialState() const -> State;
 *   auto render(State const& state, RenderContext<Self>& context) const -> Rendering;
 *
 * and optionally
 *
 *   void update(Self const& previous, State& state) const;
 *
 * which migrates the state when a parent renders the node with new props. Without
 * it the state is carried over untouched.
 *
 * A node's identity among its siblings is (std::type_index of the definition, key).
 */
template <typename W>
concept Workflow = std::copy_constructible<W> && requires(W const& workflow,
                                                          typename W::State const& state,
                                                          RenderContext<W>& context) {
    typename W::State;
    typename W::Rendering;
    typename W::Output;
    { workflow.makeInitialState() } -> std::convertible_to<typename W::State>;
    { workflow.render(state, context) } -> std::convertible_to<typename W::Rendering>;
};

template <typename W>
concept HasUpdate = requires(W const& workflow, W const& previous, typename W::State& state) {
    workflow.update(previous, state);
};

} // namespace WT
