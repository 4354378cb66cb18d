#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace WT {

class NodeBase;

// Identity of a child among its siblings.
struct ChildKey {
    std::type_index type;
    std::string     key;

    bool operator==(ChildKey const& other) const = default;
};

struct ChildKeyHash {
    std::size_t operator()(ChildKey const& childKey) const {
        return phmap::HashState().combine(0, childKey.type.hash_code(), childKey.key);
    }
};

/**
 * Keyed children of one node, reconciled once per render pass:
 *
 *   beginPass()  every child becomes a candidate for reuse
 *   claim(key)   reuses the candidate with the same (type, key), or returns
 *                nullptr so the caller creates one and adopt()s it
 *   endPass()    tears down and releases every candidate not claimed
 *
 * Claiming the same (type, key) twice within one pass is a contract violation.
 * Only touched on the loop thread.
 */
class ChildRegistry {
public:
    using Map = phmap::flat_hash_map<ChildKey, std::unique_ptr<NodeBase>, ChildKeyHash>;

    ChildRegistry();
    ~ChildRegistry();

    ChildRegistry(ChildRegistry const&)            = delete;
    ChildRegistry& operator=(ChildRegistry const&) = delete;

    auto beginPass() -> void;
    auto claim(ChildKey const& key) -> NodeBase*;
    auto adopt(ChildKey key, std::unique_ptr<NodeBase> node) -> NodeBase&;
    // Returns the number of children torn down.
    auto endPass() -> std::size_t;
    auto tearDownAll() -> void;

    [[nodiscard]] auto size() const -> std::size_t { return current.size(); }
    [[nodiscard]] auto find(ChildKey const& key) const -> NodeBase*;
    // Children of the last pass ordered by key, then by type name.
    [[nodiscard]] auto sorted() const -> std::vector<std::pair<std::string, NodeBase const*>>;

private:
    Map  current;
    Map  previous;
    bool inPass = false;
};

} // namespace WT
