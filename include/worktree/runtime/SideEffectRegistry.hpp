#pragma once
#include "worktree/core/Lifetime.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace WT {

class WorkflowObserver;
struct WorkflowSession;

/**
 * Keyed side effects of one node, reconciled once per render pass.
 *
 * run(key, ...) during a pass:
 * - key running with equivalent parameters: left running, start is not called;
 * - key running with non-equivalent parameters: its Lifetime ends, then it is
 *   started again with a fresh Lifetime;
 * - new key: started with a fresh Lifetime.
 * endPass() ends every key that was not run during the pass.
 *
 * Parameters are compared only when their types match. Two parameterless
 * registrations (null value) of the same key are always equivalent.
 * Running a key twice within one pass is a contract violation.
 */
class SideEffectRegistry {
public:
    struct Parameters {
        std::type_index             type = typeid(void);
        std::shared_ptr<void const> value;
        // Called with (previous, next) only when both values are non-null and types match.
        std::function<bool(void const*, void const*)> equivalent;
    };

    using Start = std::function<void(std::shared_ptr<Lifetime> const&)>;

    struct Registration {
        std::shared_ptr<Lifetime> lifetime;
        // Per-key state owned by the registry. A kept side effect returns the slot
        // it was started with; a (re)started one returns the slot passed to run().
        std::shared_ptr<void> slot;
        bool                  started = false;
    };

    SideEffectRegistry(std::shared_ptr<WorkflowObserver> observer, std::shared_ptr<WorkflowSession const> session);
    ~SideEffectRegistry();

    SideEffectRegistry(SideEffectRegistry const&)            = delete;
    SideEffectRegistry& operator=(SideEffectRegistry const&) = delete;

    auto beginPass() -> void;
    auto run(std::string const& key, Parameters parameters, std::shared_ptr<void> slot, Start const& start) -> Registration;
    // Returns the number of side effects ended.
    auto endPass() -> std::size_t;
    auto endAll() -> void;

    [[nodiscard]] auto isRunning(std::string const& key) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t { return current.size(); }
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

private:
    struct Entry {
        Parameters                parameters;
        std::shared_ptr<Lifetime> lifetime;
        std::shared_ptr<void>     slot;
    };

    using Map = phmap::flat_hash_map<std::string, Entry>;

    auto end(std::string const& key, Entry& entry) -> void;
    auto endEach(Map& map) -> std::size_t;
    static auto equivalent(Parameters const& previous, Parameters const& next) -> bool;

    std::shared_ptr<WorkflowObserver>      observer;
    std::shared_ptr<WorkflowSession const> session;
    Map                                    current;
    Map                                    previous;
    bool                                   inPass = false;
};

} // namespace WT
