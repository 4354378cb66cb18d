#pragma once
#include <functional>
#include <memory>
#include <utility>

namespace WT {

/**
 * Sink is a copyable handle that delivers values into the workflow tree.
 *
 * Sinks returned by a RenderContext are bound to the node that made them, not to
 * the render pass: they may be stored and invoked later from any thread. Values
 * sent after the node is torn down are dropped.
 */
template <typename Value>
class Sink {
public:
    Sink() = default;
    explicit Sink(std::function<void(Value)> onValue)
        : onValue_(std::make_shared<std::function<void(Value)>>(std::move(onValue))) {}

    void send(Value value) const {
        if (onValue_) {
            (*onValue_)(std::move(value));
        }
    }

    void operator()(Value value) const {
        send(std::move(value));
    }

    // Sink that converts its input with `transform` before forwarding here.
    template <typename NewValue, typename Transform>
    auto contraMap(Transform&& transform) const -> Sink<NewValue> {
        return Sink<NewValue>([target = *this, fn = std::forward<Transform>(transform)](NewValue value) {
            target.send(fn(std::move(value)));
        });
    }

    explicit operator bool() const {
        return static_cast<bool>(onValue_);
    }

private:
    std::shared_ptr<std::function<void(Value)>> onValue_;
};

} // namespace WT
