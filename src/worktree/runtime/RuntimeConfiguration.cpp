#include "worktree/runtime/RuntimeConfiguration.hpp"
#include "worktree/log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

namespace WT {

namespace {

auto lowered(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

} // namespace

auto parseBooleanSetting(std::string_view name, std::string_view value) -> Expected<bool> {
    auto const normalized = lowered(value);
    if (normalized == "1" || normalized == "true" || normalized == "on" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return std::unexpected(Error{Error::Code::MalformedInput,
                                 std::string(name) + " expects a boolean, got '" + std::string(value) + "'"});
}

auto parseCountSetting(std::string_view name, std::string_view value) -> Expected<std::size_t> {
    auto const  normalized = lowered(value);
    std::size_t parsed     = 0;
    auto const  begin      = normalized.data();
    auto const  end        = normalized.data() + normalized.size();
    auto [ptr, ec]         = std::from_chars(begin, end, parsed);
    if (normalized.empty() || ec != std::errc{} || ptr != end) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     std::string(name) + " expects a non-negative integer, got '" + std::string(value) + "'"});
    }
    return parsed;
}

auto RuntimeConfiguration::fromEnvironment() -> Expected<RuntimeConfiguration> {
    RuntimeConfiguration configuration;

    if (char const* raw = std::getenv("WORKTREE_RENDER_ONLY_IF_STATE_CHANGED")) {
        auto parsed = parseBooleanSetting("WORKTREE_RENDER_ONLY_IF_STATE_CHANGED", raw);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        configuration.render_only_if_state_changed = *parsed;
    }
    if (char const* raw = std::getenv("WORKTREE_DRAIN_ON_SEND")) {
        auto parsed = parseBooleanSetting("WORKTREE_DRAIN_ON_SEND", raw);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        configuration.drain_on_send = *parsed;
    }
    if (char const* raw = std::getenv("WORKTREE_MAX_EVENTS_PER_DRAIN")) {
        auto parsed = parseCountSetting("WORKTREE_MAX_EVENTS_PER_DRAIN", raw);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        configuration.max_events_per_drain = *parsed;
    }

    wt_log("RuntimeConfiguration::fromEnvironment render_only_if_state_changed=" + std::to_string(configuration.render_only_if_state_changed)
                   + " drain_on_send=" + std::to_string(configuration.drain_on_send)
                   + " max_events_per_drain=" + std::to_string(configuration.max_events_per_drain),
           "Host", "INFO");
    return configuration;
}

} // namespace WT
