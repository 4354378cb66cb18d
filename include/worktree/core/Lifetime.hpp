#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace WT {

/**
 * Lifetime is the cancellation scope handed to a side effect. It ends when the
 * side effect's key stops being registered, when its parameters change to a
 * non-equivalent value, or when the owning node is torn down.
 *
 * - hasEnded() may be polled from any thread.
 * - onEnded() callbacks run exactly once, on the thread calling end(), outside
 *   the internal lock. A callback registered after the end runs immediately.
 * - retain() keeps an object alive until the end. Executors hold tasks weakly,
 *   so a task retained here is skipped if the lifetime ends before it starts.
 * - Destroying a Lifetime ends it.
 */
class Lifetime {
public:
    Lifetime() = default;
    ~Lifetime();

    Lifetime(Lifetime const&)            = delete;
    Lifetime& operator=(Lifetime const&) = delete;

    [[nodiscard]] bool hasEnded() const {
        return ended.load(std::memory_order_acquire);
    }

    void end();
    void onEnded(std::function<void()> callback);
    void retain(std::shared_ptr<void> object);

    // Blocks for up to `timeout`. Returns true if the lifetime ended meanwhile.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return ended.load(std::memory_order_acquire); });
    }

private:
    std::atomic<bool>                  ended{false};
    std::mutex                         mutex;
    std::condition_variable            cv;
    std::vector<std::function<void()>> endedCallbacks;
    std::vector<std::shared_ptr<void>> retained;
};

} // namespace WT
