#pragma once
#include "worktree/runtime/Session.hpp"

#include <memory>
#include <string>
#include <vector>

namespace WT {

/**
 * Read-only notifications about the runtime. Every hook defaults to a no-op.
 * Observers run synchronously on the loop thread and cannot alter results:
 * they only ever see sessions and descriptions, never state or definitions.
 */
class WorkflowObserver {
public:
    virtual ~WorkflowObserver() = default;

    // Node lifecycle
    virtual void sessionDidBegin(WorkflowSession const& /*session*/) {}
    virtual void sessionDidEnd(WorkflowSession const& /*session*/) {}
    virtual void workflowDidMakeInitialState(WorkflowSession const& /*session*/, std::string const& /*stateDescription*/) {}
    virtual void workflowDidChange(WorkflowSession const& /*session*/, std::string const& /*stateDescription*/) {}

    // One render pass of one node. `reused` is true when the cached rendering was returned.
    virtual void workflowWillRender(WorkflowSession const& /*session*/, std::string const& /*stateDescription*/) {}
    virtual void workflowDidRender(WorkflowSession const& /*session*/, bool /*reused*/) {}

    // Event application on one node
    virtual void workflowDidReceiveAction(WorkflowSession const& /*session*/, std::string const& /*actionDescription*/) {}
    virtual void workflowWillApplyAction(WorkflowSession const& /*session*/, std::string const& /*actionDescription*/, std::string const& /*stateDescription*/) {}
    virtual void workflowDidApplyAction(WorkflowSession const& /*session*/, std::string const& /*actionDescription*/, bool /*producedOutput*/) {}

    // Side effects
    virtual void sideEffectDidStart(WorkflowSession const& /*session*/, std::string const& /*key*/) {}
    virtual void sideEffectDidEnd(WorkflowSession const& /*session*/, std::string const& /*key*/) {}

    // Host pass and event boundaries, reported against the root session
    virtual void hostWillRender(WorkflowSession const& /*root*/) {}
    virtual void hostDidRender(WorkflowSession const& /*root*/) {}
    virtual void hostWillApplyEvent(WorkflowSession const& /*root*/, std::string const& /*eventLabel*/) {}
    virtual void hostDidApplyEvent(WorkflowSession const& /*root*/, std::string const& /*eventLabel*/, bool /*applied*/) {}
};

/**
 * Fans every hook out to a list of observers. Opening and unpaired hooks run in
 * registration order. Closing hooks (did-render, did-apply, session and side
 * effect end) run in reverse so that observers nest.
 */
class ChainedObserver final : public WorkflowObserver {
public:
    explicit ChainedObserver(std::vector<std::shared_ptr<WorkflowObserver>> observers);

    [[nodiscard]] auto size() const -> std::size_t { return observers_.size(); }

    void sessionDidBegin(WorkflowSession const& session) override;
    void sessionDidEnd(WorkflowSession const& session) override;
    void workflowDidMakeInitialState(WorkflowSession const& session, std::string const& stateDescription) override;
    void workflowDidChange(WorkflowSession const& session, std::string const& stateDescription) override;
    void workflowWillRender(WorkflowSession const& session, std::string const& stateDescription) override;
    void workflowDidRender(WorkflowSession const& session, bool reused) override;
    void workflowDidReceiveAction(WorkflowSession const& session, std::string const& actionDescription) override;
    void workflowWillApplyAction(WorkflowSession const& session, std::string const& actionDescription, std::string const& stateDescription) override;
    void workflowDidApplyAction(WorkflowSession const& session, std::string const& actionDescription, bool producedOutput) override;
    void sideEffectDidStart(WorkflowSession const& session, std::string const& key) override;
    void sideEffectDidEnd(WorkflowSession const& session, std::string const& key) override;
    void hostWillRender(WorkflowSession const& root) override;
    void hostDidRender(WorkflowSession const& root) override;
    void hostWillApplyEvent(WorkflowSession const& root, std::string const& eventLabel) override;
    void hostDidApplyEvent(WorkflowSession const& root, std::string const& eventLabel, bool applied) override;

private:
    template <typename Fn>
    void forward(Fn&& fn);
    template <typename Fn>
    void reverse(Fn&& fn);

    std::vector<std::shared_ptr<WorkflowObserver>> observers_;
};

// Combines the observers into one: nullptr for none, the observer itself for one.
auto chainObservers(std::vector<std::shared_ptr<WorkflowObserver>> observers) -> std::shared_ptr<WorkflowObserver>;

} // namespace WT
