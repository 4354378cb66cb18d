#pragma once
#include "worktree/core/Error.hpp"

#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace WT {

/**
 * Hierarchy snapshot of a live tree: each node's type, a description of its
 * state, and its children ordered by key.
 */
struct DebugSnapshot {
    struct Child;

    std::string        workflowType;
    std::string        stateDescription;
    std::vector<Child> children;

    bool operator==(DebugSnapshot const& other) const;
    bool operator!=(DebugSnapshot const& other) const { return !(*this == other); }

    // Child snapshot registered under `key`, or nullptr.
    [[nodiscard]] auto child(std::string_view key) const -> DebugSnapshot const*;
};

struct DebugSnapshot::Child {
    std::string   key;
    DebugSnapshot snapshot;

    bool operator==(Child const& other) const;
};

/**
 * Why a tree update happened, from the root's point of view down to the node
 * that applied the action.
 *
 * kind == DidUpdate:      this node applied an action. `source` says where the
 *                         action came from; for Source::Subtree, `nested`
 *                         describes the child update whose output produced it.
 * kind == ChildDidUpdate: a descendant changed without producing output for this
 *                         node. `nested` describes the child update.
 */
struct UpdateDebugInfo {
    enum class Kind { DidUpdate, ChildDidUpdate };
    enum class Source { External, Worker, SideEffect, Subtree };

    std::string                            workflowType;
    Kind                                   kind   = Kind::DidUpdate;
    Source                                 source = Source::External;
    std::shared_ptr<UpdateDebugInfo const> nested;

    static auto didUpdate(std::string workflowType, Source source) -> UpdateDebugInfo;
    static auto didUpdateFromSubtree(std::string workflowType, UpdateDebugInfo child) -> UpdateDebugInfo;
    static auto childDidUpdate(std::string workflowType, UpdateDebugInfo child) -> UpdateDebugInfo;

    // Type of the node that applied the original action.
    [[nodiscard]] auto originWorkflowType() const -> std::string const&;

    bool operator==(UpdateDebugInfo const& other) const;
    bool operator!=(UpdateDebugInfo const& other) const { return !(*this == other); }
};

auto updateSourceToString(UpdateDebugInfo::Source source) -> std::string_view;

// JSON form: {"workflowType", "stateDescription", "children": [{"key", "snapshot"}]}
auto toJson(DebugSnapshot const& snapshot) -> nlohmann::json;
auto snapshotFromJson(nlohmann::json const& json) -> Expected<DebugSnapshot>;

// JSON form: {"workflowType", "kind": {"type": "didUpdate", "source": {"type": ...}}}
//        or  {"workflowType", "kind": {"type": "childDidUpdate", "childUpdate": {...}}}
// with source types "external", "worker", "side-effect" and
// "subtree" (carrying "debugInfo").
auto toJson(UpdateDebugInfo const& info) -> nlohmann::json;
auto updateInfoFromJson(nlohmann::json const& json) -> Expected<UpdateDebugInfo>;

auto dumpSnapshot(DebugSnapshot const& snapshot, int indent = -1) -> std::string;
auto parseSnapshot(std::string_view text) -> Expected<DebugSnapshot>;
auto dumpUpdateInfo(UpdateDebugInfo const& info, int indent = -1) -> std::string;
auto parseUpdateInfo(std::string_view text) -> Expected<UpdateDebugInfo>;

/**
 * Receives the tree snapshot once the host rendered its initial state, then after
 * every update together with the reason for it. Called on the loop thread.
 */
class WorkflowDebugger {
public:
    virtual ~WorkflowDebugger() = default;

    virtual void didEnterInitialState(DebugSnapshot const& snapshot)                     = 0;
    virtual void didUpdate(DebugSnapshot const& snapshot, UpdateDebugInfo const& update) = 0;
};

// Writes one JSON object per line:
//   {"event":"initialState","snapshot":{...}}
//   {"event":"update","snapshot":{...},"update":{...}}
class StreamDebugger final : public WorkflowDebugger {
public:
    explicit StreamDebugger(std::ostream& out);

    void didEnterInitialState(DebugSnapshot const& snapshot) override;
    void didUpdate(DebugSnapshot const& snapshot, UpdateDebugInfo const& update) override;

private:
    std::mutex    mutex;
    std::ostream& out;
};

} // namespace WT
