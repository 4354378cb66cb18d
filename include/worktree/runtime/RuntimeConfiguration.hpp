#pragma once
#include "worktree/core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace WT {

struct RuntimeConfiguration {
    // Reuse a node's last rendering when nothing in its subtree changed since it
    // was last rendered and it was updated with equal props.
    bool render_only_if_state_changed = false;

    // A sink invoked on the loop thread while no event is being processed drains
    // the queue before returning.
    bool drain_on_send = true;

    // Upper bound on events applied by one drain. 0 means unlimited.
    std::size_t max_events_per_drain = 0;

    /**
     * Reads WORKTREE_RENDER_ONLY_IF_STATE_CHANGED, WORKTREE_DRAIN_ON_SEND and
     * WORKTREE_MAX_EVENTS_PER_DRAIN on top of the defaults. Unset variables keep
     * the default. Booleans accept 1/0, true/false, on/off, yes/no in any case.
     */
    static auto fromEnvironment() -> Expected<RuntimeConfiguration>;

    bool operator==(RuntimeConfiguration const&) const = default;
};

auto parseBooleanSetting(std::string_view name, std::string_view value) -> Expected<bool>;
auto parseCountSetting(std::string_view name, std::string_view value) -> Expected<std::size_t>;

} // namespace WT
