#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace WT {

/**
 * Identity of one node for its whole life, handed to observers. Ids are unique
 * within the process; the parent link lets observers rebuild the tree.
 */
struct WorkflowSession {
    std::string                            workflowType;
    std::string                            renderKey;
    std::uint64_t                          sessionId = 0;
    std::shared_ptr<WorkflowSession const> parent;

    static auto make(std::string workflowType,
                     std::string renderKey,
                     std::shared_ptr<WorkflowSession const> parent) -> std::shared_ptr<WorkflowSession const>;

    [[nodiscard]] auto isRoot() const -> bool { return parent == nullptr; }
    [[nodiscard]] auto depth() const -> std::size_t;
};

auto nextSessionId() -> std::uint64_t;

} // namespace WT
