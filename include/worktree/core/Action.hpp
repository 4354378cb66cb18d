#pragma once
#include "worktree/core/TypeName.hpp"

#include <concepts>
#include <filesystem>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace WT {

// Output type of workflows that never emit output.
using NoOutput = std::monostate;
// Rendering type of workflows that render nothing (workers, output-only children).
using NoRendering = std::monostate;

/**
 * Read-only view of the applying node handed to actions. Valid only for the
 * duration of one apply() call.
 */
template <typename W>
class ApplyContext {
public:
    explicit ApplyContext(W const& props) : props_(&props) {}

    [[nodiscard]] auto props() const -> W const& { return *props_; }

private:
    W const* props_;
};

/**
 * An action for workflow W is any value type with
 *   apply(State&) const -> std::optional<Output>
 * or
 *   apply(State&, ApplyContext<W> const&) const -> std::optional<Output>
 */
template <typename A, typename W>
concept ActionFor =
        requires(A const& action, typename W::State& state) {
            { action.apply(state) } -> std::convertible_to<std::optional<typename W::Output>>;
        } || requires(A const& action, typename W::State& state, ApplyContext<W> const& context) {
            { action.apply(state, context) } -> std::convertible_to<std::optional<typename W::Output>>;
        };

/**
 * Type-erased action for workflow W.
 *
 * Built implicitly from any ActionFor<W> value, explicitly from a closure taking
 * `State&` (optionally followed by `ApplyContext<W> const&`) and returning void or
 * something convertible to std::optional<Output>, or through sendingOutput() and
 * noAction().
 */
template <typename W>
class AnyAction {
public:
    using State  = typename W::State;
    using Output = typename W::Output;

    template <typename A>
        requires(ActionFor<std::decay_t<A>, W> && !std::same_as<std::decay_t<A>, AnyAction>)
    AnyAction(A&& action)
        : description_(describe(action)) {
        using Stored = std::decay_t<A>;
        apply_ = [stored = Stored(std::forward<A>(action))](State& state, ApplyContext<W> const& context) -> std::optional<Output> {
            if constexpr (requires { stored.apply(state, context); }) {
                return stored.apply(state, context);
            } else {
                return stored.apply(state);
            }
        };
    }

    template <typename F>
        requires(!ActionFor<std::decay_t<F>, W> && !std::same_as<std::decay_t<F>, AnyAction>
                 && (std::invocable<std::decay_t<F>&, State&> || std::invocable<std::decay_t<F>&, State&, ApplyContext<W> const&>))
    explicit AnyAction(F&& closure, std::source_location location = std::source_location::current())
        : description_(closureDescription(location)),
          closureBased_(true) {
        apply_ = [fn = std::decay_t<F>(std::forward<F>(closure))](State& state, ApplyContext<W> const& context) mutable -> std::optional<Output> {
            if constexpr (std::invocable<decltype(fn)&, State&, ApplyContext<W> const&>) {
                return invokeClosure(fn, state, context);
            } else {
                return invokeClosure(fn, state);
            }
        };
    }

    static auto sendingOutput(Output output) -> AnyAction {
        AnyAction action;
        action.description_ = "sendingOutput";
        action.apply_       = [output = std::move(output)](State&, ApplyContext<W> const&) -> std::optional<Output> {
            return output;
        };
        return action;
    }

    static auto noAction() -> AnyAction {
        AnyAction action;
        action.description_ = "noAction";
        action.apply_       = [](State&, ApplyContext<W> const&) -> std::optional<Output> { return std::nullopt; };
        return action;
    }

    auto apply(State& state, ApplyContext<W> const& context) const -> std::optional<Output> {
        return apply_(state, context);
    }

    [[nodiscard]] auto description() const -> std::string const& { return description_; }
    [[nodiscard]] auto isClosureBased() const -> bool { return closureBased_; }

private:
    AnyAction() = default;

    template <typename Fn, typename... Args>
    static auto invokeClosure(Fn& fn, Args&&... args) -> std::optional<Output> {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Args...>>) {
            std::invoke(fn, std::forward<Args>(args)...);
            return std::nullopt;
        } else {
            return std::invoke(fn, std::forward<Args>(args)...);
        }
    }

    static auto closureDescription(std::source_location const& location) -> std::string {
        return "closure(" + std::filesystem::path(location.file_name()).filename().string() + ":" + std::to_string(location.line()) + ")";
    }

    std::function<std::optional<Output>(State&, ApplyContext<W> const&)> apply_;
    std::string                                                          description_;
    bool                                                                 closureBased_ = false;
};

} // namespace WT
