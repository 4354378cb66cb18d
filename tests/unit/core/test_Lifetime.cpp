#include <doctest/doctest.h>
#include "worktree/core/Lifetime.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace WT;
using namespace std::chrono_literals;

TEST_SUITE("core.lifetime") {

TEST_CASE("end runs callbacks exactly once") {
    Lifetime lifetime;
    int      calls = 0;
    lifetime.onEnded([&] { ++calls; });
    lifetime.onEnded([&] { ++calls; });
    CHECK_FALSE(lifetime.hasEnded());

    lifetime.end();
    lifetime.end();
    CHECK(lifetime.hasEnded());
    CHECK(calls == 2);
}

TEST_CASE("callbacks registered after the end run immediately") {
    Lifetime lifetime;
    lifetime.end();
    bool ran = false;
    lifetime.onEnded([&] { ran = true; });
    CHECK(ran);
}

TEST_CASE("destroying a lifetime ends it") {
    bool ended = false;
    {
        Lifetime lifetime;
        lifetime.onEnded([&] { ended = true; });
    }
    CHECK(ended);
}

TEST_CASE("retained objects are released at the end") {
    auto     object = std::make_shared<int>(7);
    Lifetime lifetime;
    lifetime.retain(object);
    CHECK(object.use_count() == 2);
    lifetime.end();
    CHECK(object.use_count() == 1);

    lifetime.retain(object);
    CHECK(object.use_count() == 1);
}

TEST_CASE("waitFor returns early when the lifetime ends on another thread") {
    auto lifetime = std::make_shared<Lifetime>();
    std::jthread ender([lifetime] {
        std::this_thread::sleep_for(10ms);
        lifetime->end();
    });
    auto const start = std::chrono::steady_clock::now();
    CHECK(lifetime->waitFor(5s));
    CHECK(std::chrono::steady_clock::now() - start < 4s);
}

TEST_CASE("waitFor times out while the lifetime is live") {
    Lifetime lifetime;
    CHECK_FALSE(lifetime.waitFor(5ms));
}

}
