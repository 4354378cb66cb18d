#pragma once
#include "worktree/core/Action.hpp"
#include "worktree/core/Sink.hpp"

#include <concepts>
#include <utility>

namespace WT {

/**
 * Sink that sends state mutations instead of named actions. Each send() becomes
 * one closure-based action applied on the loop thread; it never produces output.
 *
 *   auto mutations = context.makeStateMutationSink();
 *   mutations.send([](State& state) { state.count += 1; });
 *   mutations.send(&State::title, std::string("hello"));
 */
template <typename W>
class StateMutationSink {
public:
    using State = typename W::State;

    explicit StateMutationSink(Sink<AnyAction<W>> sink) : sink_(std::move(sink)) {}

    template <typename Mutation>
        requires std::invocable<Mutation&, State&>
    void send(Mutation&& mutation) const {
        sink_.send(AnyAction<W>([fn = std::forward<Mutation>(mutation)](State& state) mutable { fn(state); }));
    }

    template <typename Member, typename Value>
    void send(Member State::*member, Value&& value) const {
        sink_.send(AnyAction<W>([member, stored = Member(std::forward<Value>(value))](State& state) { state.*member = stored; }));
    }

private:
    Sink<AnyAction<W>> sink_;
};

} // namespace WT
