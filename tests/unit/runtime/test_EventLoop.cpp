#include "WorkTreeTestHelper.hpp"

#include <doctest/doctest.h>
#include "worktree/runtime/EventLoop.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace WT;
using namespace std::chrono_literals;

namespace {

auto recordingEvent(std::vector<std::string>& log, std::string label) -> EventLoop::Event {
    return EventLoop::Event{[&log, label] {
                                log.push_back(label);
                                return true;
                            },
                            label};
}

} // namespace

TEST_SUITE("runtime.event_loop") {

TEST_CASE("posts from the loop thread drain inline when idle") {
    EventLoop                loop(RuntimeConfiguration{});
    std::vector<std::string> log;
    CHECK(loop.isLoopThread());
    CHECK(loop.post(recordingEvent(log, "first")));
    CHECK(log == std::vector<std::string>{"first"});
    CHECK(loop.pendingEvents() == 0);
}

TEST_CASE("without drain_on_send events wait for drain") {
    RuntimeConfiguration configuration;
    configuration.drain_on_send = false;
    EventLoop                loop(configuration);
    std::vector<std::string> log;
    loop.post(recordingEvent(log, "a"));
    loop.post(recordingEvent(log, "b"));
    CHECK(log.empty());
    CHECK(loop.pendingEvents() == 2);
    CHECK(loop.drain() == 2);
    CHECK(log == std::vector<std::string>{"a", "b"});
}

TEST_CASE("events posted while busy are queued, then applied in order") {
    EventLoop                loop(RuntimeConfiguration{});
    std::vector<std::string> log;
    {
        EventLoop::BusyScope busy(loop);
        CHECK(loop.isBusy());
        loop.post(recordingEvent(log, "a"));
        loop.post(recordingEvent(log, "b"));
        CHECK(loop.drain() == 0);
        CHECK(log.empty());
    }
    CHECK_FALSE(loop.isBusy());
    loop.drain();
    CHECK(log == std::vector<std::string>{"a", "b"});
}

TEST_CASE("an event posting another event does not re-enter") {
    EventLoop                loop(RuntimeConfiguration{});
    std::vector<std::string> log;
    loop.post(EventLoop::Event{[&] {
                                   log.push_back("outer begin");
                                   loop.post(recordingEvent(log, "inner"));
                                   log.push_back("outer end");
                                   return true;
                               },
                               "outer"});
    CHECK(log == std::vector<std::string>{"outer begin", "outer end", "inner"});
}

TEST_CASE("max_events_per_drain bounds one drain") {
    RuntimeConfiguration configuration;
    configuration.drain_on_send        = false;
    configuration.max_events_per_drain = 2;
    EventLoop                loop(configuration);
    std::vector<std::string> log;
    for (auto label : {"1", "2", "3"}) {
        loop.post(recordingEvent(log, label));
    }
    CHECK(loop.drain() == 2);
    CHECK(loop.pendingEvents() == 1);
    CHECK(loop.drain() == 1);
    CHECK(log == std::vector<std::string>{"1", "2", "3"});
}

TEST_CASE("events from other threads wait for the loop thread") {
    EventLoop                loop(RuntimeConfiguration{});
    std::vector<std::string> log;
    std::atomic<bool>        posterOnLoopThread{true};
    std::jthread             poster([&] {
        posterOnLoopThread = loop.isLoopThread();
        loop.post(recordingEvent(log, "remote"));
    });
    poster.join();
    CHECK_FALSE(posterOnLoopThread);
    CHECK(log.empty());
    CHECK(loop.waitForEvents(100ms));
    CHECK(loop.drain() == 1);
    CHECK(log == std::vector<std::string>{"remote"});
    CHECK_FALSE(loop.waitForEvents(1ms));
}

TEST_CASE("the dispatcher sees every event") {
    EventLoop                loop(RuntimeConfiguration{});
    std::vector<std::string> seen;
    std::vector<std::string> log;
    loop.setDispatcher([&](EventLoop::Event& event) {
        seen.push_back(event.label);
        event.apply();
    });
    loop.post(recordingEvent(log, "x"));
    CHECK(seen == std::vector<std::string>{"x"});
    CHECK(log == std::vector<std::string>{"x"});
}

TEST_CASE("a closed loop drops queued and new events") {
    RuntimeConfiguration configuration;
    configuration.drain_on_send = false;
    EventLoop                loop(configuration);
    std::vector<std::string> log;
    loop.post(recordingEvent(log, "queued"));
    loop.close();
    CHECK(loop.isClosed());
    CHECK_FALSE(loop.post(recordingEvent(log, "late")));
    CHECK(loop.drain() == 0);
    CHECK(log.empty());
}

TEST_CASE("draining off the loop thread is a contract violation") {
    test::ThrowingContractViolations throwing;
    EventLoop                        loop(RuntimeConfiguration{});
    std::atomic<bool>                threw{false};
    std::jthread                     other([&] {
        try {
            loop.drain();
        } catch (ContractViolationError const&) {
            threw = true;
        }
    });
    other.join();
    CHECK(threw);
}

}
