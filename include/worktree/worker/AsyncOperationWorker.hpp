#pragma once
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/worker/WorkerContext.hpp"

#include <functional>
#include <string>
#include <utility>

namespace WT {

/**
 * Runs `operation` once on the executor and delivers its result. Failures belong
 * in T itself (for instance Expected<U>).
 *
 * Two AsyncOperationWorkers are always equivalent: a running operation is kept
 * for as long as its key is rendered. Change the key to start a new one.
 */
template <typename T>
class AsyncOperationWorker {
public:
    using Output = T;

    explicit AsyncOperationWorker(std::function<T()> operation, std::string label = "AsyncOperationWorker")
        : operation(std::move(operation)), label(std::move(label)) {}

    void run(WorkerContext<T> const& context) const {
        auto error = context.spawn(label, [context, operation = operation] {
            auto result = operation();
            if (!context.send(std::move(result))) {
                wt_log("AsyncOperationWorker result dropped after cancellation", "Worker");
            }
        });
        if (error) {
            wt_log("AsyncOperationWorker " + label + " did not start", "Worker", "Error");
        }
    }

    bool isEquivalent(AsyncOperationWorker const&) const { return true; }

private:
    std::function<T()> operation;
    std::string        label;
};

} // namespace WT
