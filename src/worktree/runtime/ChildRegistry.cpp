#include "worktree/runtime/ChildRegistry.hpp"
#include "worktree/core/ContractViolation.hpp"
#include "worktree/core/TypeName.hpp"
#include "worktree/log/TaggedLogger.hpp"
#include "worktree/runtime/NodeBase.hpp"

#include <algorithm>
#include <tuple>

namespace WT {

namespace {

auto tearDownEach(ChildRegistry::Map& map) -> std::size_t {
    auto const count = map.size();
    for (auto& [key, node] : map) {
        node->tearDown();
    }
    map.clear();
    return count;
}

} // namespace

ChildRegistry::ChildRegistry() = default;

ChildRegistry::~ChildRegistry() {
    tearDownAll();
}

auto ChildRegistry::beginPass() -> void {
    if (!previous.empty()) {
        // Leftovers of a pass that never reached endPass().
        tearDownEach(previous);
    }
    previous.swap(current);
    inPass = true;
}

auto ChildRegistry::claim(ChildKey const& key) -> NodeBase* {
    WT_REQUIRE(inPass, "child rendered outside of a render pass");
    if (current.contains(key)) {
        contractViolation("child " + typeName(key.type) + " with key '" + key.key + "' rendered twice in one render pass");
    }
    auto it = previous.find(key);
    if (it == previous.end()) {
        return nullptr;
    }
    auto node = std::move(it->second);
    previous.erase(it);
    auto* raw = node.get();
    current.emplace(key, std::move(node));
    return raw;
}

auto ChildRegistry::adopt(ChildKey key, std::unique_ptr<NodeBase> node) -> NodeBase& {
    WT_REQUIRE(!current.contains(key), "child adopted under a key already in use");
    auto* raw = node.get();
    current.emplace(std::move(key), std::move(node));
    return *raw;
}

auto ChildRegistry::endPass() -> std::size_t {
    inPass = false;
    auto const removed = tearDownEach(previous);
    if (removed > 0) {
        wt_log("ChildRegistry::endPass tore down " + std::to_string(removed) + " children", "Node");
    }
    return removed;
}

auto ChildRegistry::tearDownAll() -> void {
    tearDownEach(previous);
    tearDownEach(current);
    inPass = false;
}

auto ChildRegistry::find(ChildKey const& key) const -> NodeBase* {
    if (auto it = current.find(key); it != current.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto ChildRegistry::sorted() const -> std::vector<std::pair<std::string, NodeBase const*>> {
    std::vector<std::tuple<std::string, std::string, NodeBase const*>> entries;
    entries.reserve(current.size());
    for (auto const& [key, node] : current) {
        entries.emplace_back(key.key, typeName(key.type), node.get());
    }
    std::sort(entries.begin(), entries.end(), [](auto const& lhs, auto const& rhs) {
        return std::tie(std::get<0>(lhs), std::get<1>(lhs)) < std::tie(std::get<0>(rhs), std::get<1>(rhs));
    });
    std::vector<std::pair<std::string, NodeBase const*>> result;
    result.reserve(entries.size());
    for (auto& entry : entries) {
        result.emplace_back(std::move(std::get<0>(entry)), std::get<2>(entry));
    }
    return result;
}

} // namespace WT
