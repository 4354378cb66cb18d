#pragma once
#include "worktree/worker/WorkerContext.hpp"

#include <concepts>

namespace WT {

/**
 * A worker is a cancellable unit of asynchronous work producing zero or more
 * outputs:
 *
 *   using Output = ...;
 *   void run(WorkerContext<Output> const& context) const;
 *   bool isEquivalent(Self const& other) const;
 *
 * run() is called on the loop thread during a render pass and must not block:
 * longer work goes through context.spawn() or a callback API. When a later pass
 * renders the same key with an equivalent worker, the running one is kept.
 */
template <typename Wk>
concept Worker = std::copy_constructible<Wk> && requires(Wk const& worker, Wk const& other, WorkerContext<typename Wk::Output> const& context) {
    typename Wk::Output;
    worker.run(context);
    { worker.isEquivalent(other) } -> std::convertible_to<bool>;
};

} // namespace WT
