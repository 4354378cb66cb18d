#include "worktree/runtime/SideEffectRegistry.hpp"
#include "worktree/core/ContractViolation.hpp"
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/runtime/Observer.hpp"
#include "worktree/runtime/Session.hpp"

#include <algorithm>

namespace WT {

SideEffectRegistry::SideEffectRegistry(std::shared_ptr<WorkflowObserver> observer, std::shared_ptr<WorkflowSession const> session)
    : observer(std::move(observer)), session(std::move(session)) {}

SideEffectRegistry::~SideEffectRegistry() {
    endAll();
}

auto SideEffectRegistry::equivalent(Parameters const& previous, Parameters const& next) -> bool {
    if (previous.type != next.type) {
        return false;
    }
    if (!previous.value || !next.value) {
        return !previous.value && !next.value;
    }
    return next.equivalent && next.equivalent(previous.value.get(), next.value.get());
}

auto SideEffectRegistry::end(std::string const& key, Entry& entry) -> void {
    wt_log("SideEffectRegistry ending '" + key + "' on " + session->workflowType, "SideEffect");
    entry.lifetime->end();
    if (observer) {
        observer->sideEffectDidEnd(*session, key);
    }
}

auto SideEffectRegistry::endEach(Map& map) -> std::size_t {
    auto const count = map.size();
    for (auto& [key, entry] : map) {
        end(key, entry);
    }
    map.clear();
    return count;
}

auto SideEffectRegistry::beginPass() -> void {
    if (!previous.empty()) {
        endEach(previous);
    }
    previous.swap(current);
    inPass = true;
}

auto SideEffectRegistry::run(std::string const& key, Parameters parameters, std::shared_ptr<void> slot, Start const& start) -> Registration {
    WT_REQUIRE(inPass, "side effect '" + key + "' registered outside of a render pass");
    if (current.contains(key)) {
        contractViolation("side effect key '" + key + "' registered twice in one render pass on " + session->workflowType);
    }

    if (auto it = previous.find(key); it != previous.end()) {
        if (equivalent(it->second.parameters, parameters)) {
            auto entry = std::move(it->second);
            previous.erase(it);
            Registration kept{entry.lifetime, entry.slot, false};
            current.emplace(key, std::move(entry));
            return kept;
        }
        wt_log("SideEffectRegistry restarting '" + key + "' with non-equivalent parameters", "SideEffect");
        end(key, it->second);
        previous.erase(it);
    }

    auto lifetime = std::make_shared<Lifetime>();
    current.emplace(key, Entry{std::move(parameters), lifetime, slot});
    wt_log("SideEffectRegistry starting '" + key + "' on " + session->workflowType, "SideEffect");
    if (observer) {
        observer->sideEffectDidStart(*session, key);
    }
    start(lifetime);
    return Registration{std::move(lifetime), std::move(slot), true};
}

auto SideEffectRegistry::endPass() -> std::size_t {
    inPass = false;
    return endEach(previous);
}

auto SideEffectRegistry::endAll() -> void {
    endEach(previous);
    endEach(current);
    inPass = false;
}

auto SideEffectRegistry::isRunning(std::string const& key) const -> bool {
    return current.contains(key);
}

auto SideEffectRegistry::keys() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(current.size());
    for (auto const& [key, entry] : current) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace WT
