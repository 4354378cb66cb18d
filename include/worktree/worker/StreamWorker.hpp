#pragma once
#include "worktree/core/Lifetime.hpp"
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/worker/WorkerContext.hpp"

#include <functional>
#include <string>
#include <utility>

namespace WT {

/**
 * Runs a producer on the executor. The producer emits any number of values
 * through `emit`, which returns false once the worker is cancelled; the producer
 * should return at that point. Workers with the same identity are equivalent.
 *
 *   StreamWorker<int> numbers("numbers", [](auto const& emit, Lifetime&) {
 *       for (int i = 0; emit(i); ++i) {}
 *   });
 */
template <typename T>
class StreamWorker {
public:
    using Output   = T;
    using Emit     = std::function<bool(T)>;
    using Producer = std::function<void(Emit const& emit, Lifetime& lifetime)>;

    StreamWorker(std::string identity, Producer producer)
        : identity(std::move(identity)), producer(std::move(producer)) {}

    void run(WorkerContext<T> const& context) const {
        auto error = context.spawn("StreamWorker " + identity, [context, producer = producer] {
            Emit emit = [context](T value) { return context.send(std::move(value)); };
            producer(emit, context.lifetime());
        });
        if (error) {
            wt_log("StreamWorker " + identity + " did not start", "Worker", "Error");
        }
    }

    bool isEquivalent(StreamWorker const& other) const { return identity == other.identity; }

    [[nodiscard]] auto name() const -> std::string const& { return identity; }

private:
    std::string identity;
    Producer    producer;
};

} // namespace WT
