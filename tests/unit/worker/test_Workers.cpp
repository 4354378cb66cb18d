#include "WorkTreeTestHelper.hpp"

#include <doctest/doctest.h>
#include "worktree/runtime/WorkflowHost.hpp"
#include "worktree/task/TaskPool.hpp"
#include "worktree/worker/AsyncOperationWorker.hpp"
#include "worktree/worker/CallbackWorker.hpp"
#include "worktree/worker/StreamWorker.hpp"
#include "worktree/worker/TimerWorker.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace WT;
using namespace std::chrono_literals;

static_assert(Worker<AsyncOperationWorker<int>>);
static_assert(Worker<StreamWorker<std::string>>);
static_assert(Worker<CallbackWorker<int>>);
static_assert(Worker<TimerWorker>);

namespace {

auto poolOptions(TaskPool& pool) -> HostOptions {
    HostOptions options;
    options.executor = &pool;
    return options;
}

struct Fetcher {
    using State     = std::vector<std::string>;
    using Rendering = std::vector<std::string>;
    using Output    = NoOutput;

    std::shared_ptr<std::atomic<int>> starts;
    std::string                       key = "fetch";

    auto makeInitialState() const -> State { return {}; }
    auto render(State const& state, RenderContext<Fetcher>& context) const -> Rendering {
        auto counter = starts;
        context.runWorker(AsyncOperationWorker<int>([counter] { return ++*counter * 10; }, "fetch"), key, [key = key](int value) {
            return AnyAction<Fetcher>([entry = key + ":" + std::to_string(value)](State& results) { results.push_back(entry); });
        });
        return state;
    }
};

struct FeedHooks {
    std::mutex                                 mutex;
    std::vector<CallbackWorker<int>::Deliver> delivers;
    int                                        starts  = 0;
    int                                        cancels = 0;

    auto deliver(std::size_t index, int value) -> void {
        CallbackWorker<int>::Deliver fn;
        {
            std::lock_guard<std::mutex> lock(mutex);
            fn = delivers.at(index);
        }
        fn(value);
    }
};

struct Feed {
    using State     = std::vector<std::string>;
    using Rendering = std::vector<std::string>;
    using Output    = NoOutput;

    std::shared_ptr<FeedHooks> hooks;
    std::string                identity = "feed";
    std::string                prefix   = "a";
    bool                       enabled  = true;

    auto makeInitialState() const -> State { return {}; }
    auto render(State const& state, RenderContext<Feed>& context) const -> Rendering {
        if (enabled) {
            auto hooks = this->hooks;
            CallbackWorker<int> worker(identity, [hooks](CallbackWorker<int>::Deliver deliver) -> CallbackWorker<int>::Cancel {
                std::lock_guard<std::mutex> lock(hooks->mutex);
                ++hooks->starts;
                hooks->delivers.push_back(std::move(deliver));
                return [hooks] {
                    std::lock_guard<std::mutex> lock(hooks->mutex);
                    ++hooks->cancels;
                };
            });
            context.runWorker(worker, "feed", [prefix = prefix](int value) {
                return AnyAction<Feed>([entry = prefix + std::to_string(value)](State& entries) { entries.push_back(entry); });
            });
        }
        return state;
    }
};

struct Numbers {
    using State     = std::vector<int>;
    using Rendering = std::vector<int>;
    using Output    = NoOutput;

    std::shared_ptr<std::atomic<bool>> finished;
    int                                count   = 5;
    bool                               enabled = true;

    auto makeInitialState() const -> State { return {}; }
    auto render(State const& state, RenderContext<Numbers>& context) const -> Rendering {
        if (enabled) {
            auto done  = finished;
            int  limit = count;
            StreamWorker<int> stream("numbers", [done, limit](StreamWorker<int>::Emit const& emit, Lifetime&) {
                for (int i = 1; limit < 0 || i <= limit; ++i) {
                    if (!emit(i)) {
                        break;
                    }
                    if (limit < 0) {
                        std::this_thread::sleep_for(1ms);
                    }
                }
                *done = true;
            });
            context.runWorker(stream, "numbers", [](int value) {
                return AnyAction<Numbers>([value](State& values) { values.push_back(value); });
            });
        }
        return state;
    }
};

struct Clock {
    using State     = std::vector<std::uint64_t>;
    using Rendering = std::size_t;
    using Output    = std::uint64_t;

    bool running = true;

    auto makeInitialState() const -> State { return {}; }
    auto render(State const& state, RenderContext<Clock>& context) const -> Rendering {
        if (running) {
            context.runWorker(TimerWorker(5ms), "tick", [](std::uint64_t tick) {
                return AnyAction<Clock>([tick](State& ticks) -> std::optional<std::uint64_t> {
                    ticks.push_back(tick);
                    return tick;
                });
            });
        }
        return state.size();
    }
};

} // namespace

TEST_SUITE("worker.adapters") {

TEST_CASE("equivalence rules of the adapters") {
    CHECK(AsyncOperationWorker<int>([] { return 1; }).isEquivalent(AsyncOperationWorker<int>([] { return 2; })));
    CHECK(StreamWorker<int>("a", {}).isEquivalent(StreamWorker<int>("a", {})));
    CHECK_FALSE(StreamWorker<int>("a", {}).isEquivalent(StreamWorker<int>("b", {})));
    CHECK(CallbackWorker<int>("a", {}).isEquivalent(CallbackWorker<int>("a", {})));
    CHECK_FALSE(CallbackWorker<int>("a", {}).isEquivalent(CallbackWorker<int>("b", {})));
    CHECK(TimerWorker(5ms).isEquivalent(TimerWorker(5ms)));
    CHECK_FALSE(TimerWorker(5ms).isEquivalent(TimerWorker(6ms)));
    CHECK(TimerWorker(7ms).period() == 7ms);
    CHECK(StreamWorker<int>("named", {}).name() == "named");
}

TEST_CASE("an async operation delivers its result once") {
    TaskPool              pool(2);
    auto                  starts = std::make_shared<std::atomic<int>>(0);
    WorkflowHost<Fetcher> host(Fetcher{starts, "fetch"}, poolOptions(pool));

    REQUIRE(test::pumpUntil(host, [&] { return host.rendering().size() == 1; }));
    CHECK(host.rendering()[0] == "fetch:10");

    host.update(Fetcher{starts, "fetch"});
    host.update(Fetcher{starts, "fetch"});
    CHECK(starts->load() == 1);
}

TEST_CASE("a new key starts a new async operation") {
    TaskPool              pool(2);
    auto                  starts = std::make_shared<std::atomic<int>>(0);
    WorkflowHost<Fetcher> host(Fetcher{starts, "first"}, poolOptions(pool));
    REQUIRE(test::pumpUntil(host, [&] { return host.rendering().size() == 1; }));

    host.update(Fetcher{starts, "second"});
    REQUIRE(test::pumpUntil(host, [&] { return host.rendering().size() == 2; }));
    CHECK(host.rendering()[1] == "second:20");
    CHECK(starts->load() == 2);
}

TEST_CASE("an equivalent worker is kept and uses the latest output map") {
    auto               hooks = std::make_shared<FeedHooks>();
    WorkflowHost<Feed> host(Feed{hooks, "feed", "a"});
    CHECK(hooks->starts == 1);

    hooks->deliver(0, 1);
    CHECK(host.rendering() == std::vector<std::string>{"a1"});

    host.update(Feed{hooks, "feed", "b"});
    CHECK(hooks->starts == 1);
    CHECK(hooks->cancels == 0);

    hooks->deliver(0, 2);
    CHECK(host.rendering() == std::vector<std::string>{"a1", "b2"});
}

TEST_CASE("a non-equivalent worker replaces the running one") {
    auto               hooks = std::make_shared<FeedHooks>();
    WorkflowHost<Feed> host(Feed{hooks, "feed", "a"});

    host.update(Feed{hooks, "other", "a"});
    CHECK(hooks->starts == 2);
    CHECK(hooks->cancels == 1);

    hooks->deliver(0, 1);
    CHECK(host.rendering().empty());
    hooks->deliver(1, 2);
    CHECK(host.rendering() == std::vector<std::string>{"a2"});
}

TEST_CASE("a worker no longer rendered is cancelled and its deliveries dropped") {
    auto               hooks = std::make_shared<FeedHooks>();
    WorkflowHost<Feed> host(Feed{hooks, "feed", "a"});
    host.update(Feed{hooks, "feed", "a", false});
    CHECK(hooks->cancels == 1);

    hooks->deliver(0, 5);
    CHECK(host.rendering().empty());
}

TEST_CASE("tearing down the host cancels running workers") {
    auto hooks = std::make_shared<FeedHooks>();
    {
        WorkflowHost<Feed> host(Feed{hooks});
        CHECK(hooks->cancels == 0);
    }
    CHECK(hooks->cancels == 1);
    CHECK_NOTHROW(hooks->deliver(0, 1));
}

TEST_CASE("values delivered off the loop thread arrive in order") {
    auto               hooks = std::make_shared<FeedHooks>();
    WorkflowHost<Feed> host(Feed{hooks, "feed", "n"});
    std::thread([&] {
        for (int i = 0; i < 4; ++i) {
            hooks->deliver(0, i);
        }
    }).join();
    CHECK(host.processEvents() == 4);
    CHECK(host.rendering() == std::vector<std::string>{"n0", "n1", "n2", "n3"});
}

TEST_CASE("a stream delivers every value it emits") {
    TaskPool              pool(2);
    auto                  finished = std::make_shared<std::atomic<bool>>(false);
    WorkflowHost<Numbers> host(Numbers{finished, 5}, poolOptions(pool));

    REQUIRE(test::pumpUntil(host, [&] { return host.rendering().size() == 5; }));
    CHECK(host.rendering() == std::vector<int>{1, 2, 3, 4, 5});
    CHECK(test::waitUntil([&] { return finished->load(); }));
}

TEST_CASE("an endless stream stops once its worker is cancelled") {
    TaskPool              pool(2);
    auto                  finished = std::make_shared<std::atomic<bool>>(false);
    WorkflowHost<Numbers> host(Numbers{finished, -1}, poolOptions(pool));

    REQUIRE(test::pumpUntil(host, [&] { return host.rendering().size() >= 3; }));
    host.update(Numbers{finished, -1, false});
    CHECK(test::waitUntil([&] { return finished->load(); }));

    auto const seen = host.rendering().size();
    host.processEvents();
    CHECK(host.rendering().size() == seen);
}

TEST_CASE("a timer ticks in order until it is stopped") {
    TaskPool            pool(2);
    WorkflowHost<Clock> host(Clock{}, poolOptions(pool));
    std::vector<std::uint64_t> outputs;
    auto subscription = host.subscribeOutput([&](std::uint64_t tick) { outputs.push_back(tick); });

    REQUIRE(test::pumpUntil(host, [&] { return host.rendering() >= 3; }));
    auto const& ticks = host.rootNode().state();
    CHECK(ticks[0] == 1);
    CHECK(ticks[1] == 2);
    CHECK(ticks[2] == 3);
    CHECK(outputs.size() == ticks.size());

    host.update(Clock{false});
    auto const stopped = host.rendering();
    std::this_thread::sleep_for(20ms);
    host.processEvents();
    CHECK(host.rendering() == stopped);
}

}
