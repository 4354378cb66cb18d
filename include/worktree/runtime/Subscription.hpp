#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace WT {

// Active until cancelled or destroyed.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { cancel(); }

    Subscription(Subscription const&)            = delete;
    Subscription& operator=(Subscription const&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::exchange(other.cancel_, nullptr)) {}
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    void cancel() {
        if (auto fn = std::exchange(cancel_, nullptr)) {
            fn();
        }
    }

    [[nodiscard]] bool isActive() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * Subscribers to one published value. publish() iterates a snapshot, so
 * callbacks may subscribe or cancel while being notified.
 */
template <typename T>
class SubscriberList : public std::enable_shared_from_this<SubscriberList<T>> {
public:
    using Callback = std::function<void(T const&)>;

    auto add(Callback callback) -> Subscription {
        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            id = nextId++;
            entries.emplace_back(id, std::make_shared<Callback>(std::move(callback)));
        }
        return Subscription([weak = this->weak_from_this(), id] {
            if (auto list = weak.lock()) {
                list->remove(id);
            }
        });
    }

    auto publish(T const& value) -> void {
        std::vector<std::shared_ptr<Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            snapshot.reserve(entries.size());
            for (auto const& [id, callback] : entries) {
                snapshot.push_back(callback);
            }
        }
        for (auto const& callback : snapshot) {
            (*callback)(value);
        }
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex);
        return entries.size();
    }

private:
    auto remove(std::uint64_t id) -> void {
        std::lock_guard<std::mutex> lock(mutex);
        std::erase_if(entries, [id](auto const& entry) { return entry.first == id; });
    }

    mutable std::mutex                                               mutex;
    std::vector<std::pair<std::uint64_t, std::shared_ptr<Callback>>> entries;
    std::uint64_t                                                    nextId = 0;
};

} // namespace WT
