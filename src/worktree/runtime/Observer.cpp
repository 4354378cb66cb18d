#include "worktree/runtime/Observer.hpp"

#include <algorithm>

namespace WT {

ChainedObserver::ChainedObserver(std::vector<std::shared_ptr<WorkflowObserver>> observers)
    : observers_(std::move(observers)) {
    std::erase(observers_, nullptr);
}

template <typename Fn>
void ChainedObserver::forward(Fn&& fn) {
    for (auto const& observer : observers_) {
        fn(*observer);
    }
}

template <typename Fn>
void ChainedObserver::reverse(Fn&& fn) {
    for (auto it = observers_.rbegin(); it != observers_.rend(); ++it) {
        fn(**it);
    }
}

void ChainedObserver::sessionDidBegin(WorkflowSession const& session) {
    forward([&](WorkflowObserver& o) { o.sessionDidBegin(session); });
}

void ChainedObserver::sessionDidEnd(WorkflowSession const& session) {
    reverse([&](WorkflowObserver& o) { o.sessionDidEnd(session); });
}

void ChainedObserver::workflowDidMakeInitialState(WorkflowSession const& session, std::string const& stateDescription) {
    forward([&](WorkflowObserver& o) { o.workflowDidMakeInitialState(session, stateDescription); });
}

void ChainedObserver::workflowDidChange(WorkflowSession const& session, std::string const& stateDescription) {
    forward([&](WorkflowObserver& o) { o.workflowDidChange(session, stateDescription); });
}

void ChainedObserver::workflowWillRender(WorkflowSession const& session, std::string const& stateDescription) {
    forward([&](WorkflowObserver& o) { o.workflowWillRender(session, stateDescription); });
}

void ChainedObserver::workflowDidRender(WorkflowSession const& session, bool reused) {
    reverse([&](WorkflowObserver& o) { o.workflowDidRender(session, reused); });
}

void ChainedObserver::workflowDidReceiveAction(WorkflowSession const& session, std::string const& actionDescription) {
    forward([&](WorkflowObserver& o) { o.workflowDidReceiveAction(session, actionDescription); });
}

void ChainedObserver::workflowWillApplyAction(WorkflowSession const& session, std::string const& actionDescription, std::string const& stateDescription) {
    forward([&](WorkflowObserver& o) { o.workflowWillApplyAction(session, actionDescription, stateDescription); });
}

void ChainedObserver::workflowDidApplyAction(WorkflowSession const& session, std::string const& actionDescription, bool producedOutput) {
    reverse([&](WorkflowObserver& o) { o.workflowDidApplyAction(session, actionDescription, producedOutput); });
}

void ChainedObserver::sideEffectDidStart(WorkflowSession const& session, std::string const& key) {
    forward([&](WorkflowObserver& o) { o.sideEffectDidStart(session, key); });
}

void ChainedObserver::sideEffectDidEnd(WorkflowSession const& session, std::string const& key) {
    reverse([&](WorkflowObserver& o) { o.sideEffectDidEnd(session, key); });
}

void ChainedObserver::hostWillRender(WorkflowSession const& root) {
    forward([&](WorkflowObserver& o) { o.hostWillRender(root); });
}

void ChainedObserver::hostDidRender(WorkflowSession const& root) {
    reverse([&](WorkflowObserver& o) { o.hostDidRender(root); });
}

void ChainedObserver::hostWillApplyEvent(WorkflowSession const& root, std::string const& eventLabel) {
    forward([&](WorkflowObserver& o) { o.hostWillApplyEvent(root, eventLabel); });
}

void ChainedObserver::hostDidApplyEvent(WorkflowSession const& root, std::string const& eventLabel, bool applied) {
    reverse([&](WorkflowObserver& o) { o.hostDidApplyEvent(root, eventLabel, applied); });
}

auto chainObservers(std::vector<std::shared_ptr<WorkflowObserver>> observers) -> std::shared_ptr<WorkflowObserver> {
    std::erase(observers, nullptr);
    if (observers.empty()) {
        return nullptr;
    }
    if (observers.size() == 1) {
        return observers.front();
    }
    return std::make_shared<ChainedObserver>(std::move(observers));
}

} // namespace WT
