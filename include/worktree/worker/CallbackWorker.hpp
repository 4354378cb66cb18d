#pragma once
#include "worktree/worker/WorkerContext.hpp"

#include <functional>
#include <string>
#include <utility>

namespace WT {

/**
 * Adapts a callback-based API. `start` is called on the loop thread with a
 * deliver function usable from any thread and returns the API's cancel
 * function, which runs when the worker's Lifetime ends. Values delivered after
 * that are dropped. Workers with the same identity are equivalent.
 */
template <typename T>
class CallbackWorker {
public:
    using Output  = T;
    using Deliver = std::function<void(T)>;
    using Cancel  = std::function<void()>;
    using Start   = std::function<Cancel(Deliver deliver)>;

    CallbackWorker(std::string identity, Start start)
        : identity(std::move(identity)), start(std::move(start)) {}

    void run(WorkerContext<T> const& context) const {
        auto cancel = start([context](T value) { context.send(std::move(value)); });
        if (cancel) {
            context.lifetime().onEnded(std::move(cancel));
        }
    }

    bool isEquivalent(CallbackWorker const& other) const { return identity == other.identity; }

private:
    std::string identity;
    Start       start;
};

} // namespace WT
