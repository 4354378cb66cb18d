#include "WorkTreeTestHelper.hpp"

#include <doctest/doctest.h>
#include "worktree/runtime/Node.hpp"
#include "worktree/runtime/TreeEnvironment.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

using namespace WT;

namespace {

struct LeafState {
    int         updates = 0;
    std::string previousLabel;

    auto description() const -> std::string { return "updates=" + std::to_string(updates); }
};

struct Leaf {
    using State     = LeafState;
    using Rendering = std::string;
    using Output    = NoOutput;

    std::string label;

    auto makeInitialState() const -> State { return {}; }
    void update(Leaf const& previous, State& state) const {
        ++state.updates;
        state.previousLabel = previous.label;
    }
    auto render(State const& state, RenderContext<Leaf>&) const -> Rendering {
        return label + "#" + std::to_string(state.updates);
    }
};

struct Parent {
    using State     = int;
    using Rendering = std::vector<std::string>;
    using Output    = NoOutput;

    std::vector<std::string> keys;

    auto makeInitialState() const -> State { return 0; }
    auto render(State const&, RenderContext<Parent>& context) const -> Rendering {
        Rendering rendered;
        for (auto const& key : keys) {
            rendered.push_back(context.renderChild(Leaf{key}, key));
        }
        return rendered;
    }
};

auto leafKey(std::string key) -> ChildKey {
    return ChildKey{std::type_index(typeid(Leaf)), std::move(key)};
}

struct Emitter {
    using State     = int;
    using Rendering = Sink<AnyAction<Emitter>>;
    using Output    = int;

    auto makeInitialState() const -> State { return 0; }
    auto render(State const&, RenderContext<Emitter>& context) const -> Rendering { return context.makeSink(); }
};

struct Collector {
    using State     = std::vector<int>;
    using Rendering = Sink<AnyAction<Emitter>>;
    using Output    = std::string;

    auto makeInitialState() const -> State { return {}; }
    auto render(State const&, RenderContext<Collector>& context) const -> Rendering {
        return context.renderChild(Emitter{}, "emitter", [](int value) {
            return AnyAction<Collector>([value](State& state) -> std::optional<std::string> {
                state.push_back(value);
                return "collected " + std::to_string(value);
            });
        });
    }
};

struct EffectLog;

struct Effectful {
    using State     = int;
    using Rendering = int;
    using Output    = NoOutput;

    std::shared_ptr<EffectLog> effects;
    bool                   enabled   = true;
    int                    parameter = 0;
    bool                   withChild = false;

    auto makeInitialState() const -> State { return 0; }
    auto render(State const& state, RenderContext<Effectful>& context) const -> Rendering;
};

struct EffectLog {
    int                                    starts = 0;
    std::vector<std::shared_ptr<Lifetime>> lifetimes;
    std::optional<SideEffect<Effectful>>   handle;
};

auto Effectful::render(State const& state, RenderContext<Effectful>& context) const -> Rendering {
    if (enabled) {
        context.runSideEffect("effect", parameter, [effects = effects](SideEffect<Effectful> const& effect) {
            ++effects->starts;
            effects->lifetimes.push_back(effect.lifetimePtr());
            effects->handle.emplace(effect);
        });
    }
    if (withChild) {
        context.renderChild(Effectful{std::make_shared<EffectLog>(), true, 0, false}, "inner");
    }
    return state;
}

struct Doubled {
    using State     = int;
    using Rendering = int;
    using Output    = NoOutput;

    std::shared_ptr<std::vector<std::shared_ptr<Lifetime>>> started;

    auto makeInitialState() const -> State { return 0; }
    auto render(State const& state, RenderContext<Doubled>& context) const -> Rendering {
        for (int i = 0; i < 2; ++i) {
            context.runSideEffect("dup", [started = started](SideEffect<Doubled> const& effect) { started->push_back(effect.lifetimePtr()); });
        }
        return state;
    }
};

struct Stasher {
    using State     = int;
    using Rendering = int;
    using Output    = NoOutput;

    auto makeInitialState() const -> State { return 0; }
    auto render(State const& state, RenderContext<Stasher>& context) const -> Rendering;
};

std::optional<RenderContext<Stasher>> stashedContext;

auto Stasher::render(State const& state, RenderContext<Stasher>& context) const -> Rendering {
    stashedContext.emplace(context);
    return state;
}

auto environmentWith(std::shared_ptr<WorkflowObserver> observer = nullptr) -> std::shared_ptr<TreeEnvironment> {
    return TreeEnvironment::make(RuntimeConfiguration{}, std::move(observer));
}

auto contains(std::vector<std::string> const& events, std::string const& event) -> bool {
    return std::find(events.begin(), events.end(), event) != events.end();
}

} // namespace

TEST_SUITE("runtime.node") {

TEST_CASE("first render makes the initial state and activates the node") {
    auto observer = std::make_shared<test::RecordingObserver>();
    WorkflowNode<Leaf> node(Leaf{"solo"}, environmentWith(observer));
    CHECK(node.phase() == NodeBase::Phase::Uninitialized);

    CHECK(node.render() == "solo#0");
    CHECK(node.phase() == NodeBase::Phase::Active);
    CHECK(node.state().updates == 0);
    CHECK(node.session().isRoot());
    CHECK(observer->events() == std::vector<std::string>{"sessionDidBegin:Leaf", "didMakeInitialState:Leaf", "willRender:Leaf", "didRender:Leaf"});
}

TEST_CASE("rendering again runs update against the previous props") {
    WorkflowNode<Leaf> node(Leaf{"one"}, environmentWith());
    node.render();
    CHECK(node.render(Leaf{"two"}) == "two#1");
    CHECK(node.state().previousLabel == "one");
    CHECK(node.definition().label == "two");
}

TEST_CASE("children are matched by type and key across passes") {
    auto observer = std::make_shared<test::RecordingObserver>();
    WorkflowNode<Parent> node(Parent{{"a", "b"}}, environmentWith(observer));
    CHECK(node.render() == std::vector<std::string>{"a#0", "b#0"});

    auto* a = node.children().find(leafKey("a"));
    auto* b = node.children().find(leafKey("b"));
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);
    auto const bSession = b->session().sessionId;

    observer->clear();
    CHECK(node.render(Parent{{"b", "c"}}) == std::vector<std::string>{"b#1", "c#0"});

    CHECK(node.children().find(leafKey("a")) == nullptr);
    REQUIRE(node.children().find(leafKey("b")) == b);
    CHECK(b->session().sessionId == bSession);
    CHECK(node.children().find(leafKey("c")) != nullptr);
    CHECK(node.children().size() == 2);

    auto events = observer->events();
    CHECK(contains(events, "sessionDidEnd:Leaf[a]"));
    CHECK(contains(events, "didChange:Leaf[b]"));
    CHECK(contains(events, "didMakeInitialState:Leaf[c]"));
    CHECK_FALSE(contains(events, "sessionDidEnd:Leaf[b]"));
}

TEST_CASE("a child dropped and re-added starts over") {
    WorkflowNode<Parent> node(Parent{{"a"}}, environmentWith());
    node.render();
    node.render(Parent{{"a"}});
    CHECK(node.render(Parent{{"a"}}) == std::vector<std::string>{"a#2"});
    node.render(Parent{{}});
    CHECK(node.render(Parent{{"a"}}) == std::vector<std::string>{"a#0"});
}

TEST_CASE("debug snapshots list children by key") {
    WorkflowNode<Parent> node(Parent{{"b", "a"}}, environmentWith());
    node.render();
    node.render();
    auto snapshot = node.debugSnapshot();
    CHECK(snapshot.workflowType.find("Parent") != std::string::npos);
    CHECK(snapshot.stateDescription == "0");
    REQUIRE(snapshot.children.size() == 2);
    CHECK(snapshot.children[0].key == "a");
    CHECK(snapshot.children[1].key == "b");
    CHECK(snapshot.children[0].snapshot.stateDescription == "updates=1");
}

TEST_CASE("duplicate child keys in one pass are a contract violation") {
    test::ThrowingContractViolations throwing;
    WorkflowNode<Parent>             node(Parent{{"a", "a"}}, environmentWith());
    CHECK_THROWS_WITH_AS(node.render(), doctest::Contains("rendered twice"), ContractViolationError);
    CHECK_NOTHROW(node.tearDown());
}

TEST_CASE("a node stays usable after a pass aborted by a contract violation") {
    test::ThrowingContractViolations throwing;
    WorkflowNode<Parent>             node(Parent{{"a"}}, environmentWith());
    node.render();
    CHECK_THROWS_AS(node.render(Parent{{"b", "b"}}), ContractViolationError);
    CHECK(node.render(Parent{{"a"}}) == std::vector<std::string>{"a#0"});
}

TEST_CASE("a render context used after its pass is a contract violation") {
    test::ThrowingContractViolations throwing;
    stashedContext.reset();
    {
        WorkflowNode<Stasher> node(Stasher{}, environmentWith());
        node.render();
        REQUIRE(stashedContext.has_value());
        CHECK_FALSE(stashedContext->isValid());
        CHECK_THROWS_WITH_AS(stashedContext->makeSink(), doctest::Contains("after its render pass ended"), ContractViolationError);
        CHECK_THROWS_AS(stashedContext->runSideEffect("late", [](SideEffect<Stasher> const&) {}), ContractViolationError);
    }
    stashedContext.reset();
}

TEST_CASE("applying an action from inside another action is a contract violation") {
    test::ThrowingContractViolations throwing;
    WorkflowNode<Leaf>               node(Leaf{"x"}, environmentWith());
    node.render();
    auto* self = &node;
    AnyAction<Leaf> reentrant([self](LeafState&) { self->handle(AnyAction<Leaf>::noAction()); });
    CHECK_THROWS_WITH_AS(node.handle(reentrant), doctest::Contains("while another action is being applied"), ContractViolationError);
    CHECK_FALSE(node.environment().applying);
}

TEST_CASE("actions before the first render are a contract violation") {
    test::ThrowingContractViolations throwing;
    WorkflowNode<Leaf>               node(Leaf{"x"}, environmentWith());
    CHECK_THROWS_AS(node.handle(AnyAction<Leaf>::noAction()), ContractViolationError);
}

TEST_CASE("child output is mapped to a parent action and bubbles up once") {
    WorkflowNode<Collector>                           node(Collector{}, environmentWith());
    std::vector<std::pair<std::optional<std::string>, UpdateDebugInfo>> received;
    node.setOutputHandler([&](std::optional<std::string> output, UpdateDebugInfo info) { received.emplace_back(std::move(output), std::move(info)); });

    auto sink = node.render();
    sink.send(AnyAction<Emitter>::sendingOutput(7));

    CHECK(node.state() == std::vector<int>{7});
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].first.has_value());
    CHECK(*received[0].first == "collected 7");

    auto const& info = received[0].second;
    CHECK(info.kind == UpdateDebugInfo::Kind::DidUpdate);
    CHECK(info.source == UpdateDebugInfo::Source::Subtree);
    REQUIRE(info.nested != nullptr);
    CHECK(info.nested->source == UpdateDebugInfo::Source::External);
    CHECK(info.originWorkflowType().find("Emitter") != std::string::npos);
}

TEST_CASE("a child update without output is reported as childDidUpdate") {
    WorkflowNode<Collector>        node(Collector{}, environmentWith());
    std::optional<UpdateDebugInfo> last;
    int                            calls = 0;
    node.setOutputHandler([&](std::optional<std::string> output, UpdateDebugInfo info) {
        ++calls;
        CHECK_FALSE(output.has_value());
        last = std::move(info);
    });

    auto sink = node.render();
    sink.send(AnyAction<Emitter>([](int& state) { state = 3; }));
    CHECK(calls == 1);
    REQUIRE(last.has_value());
    CHECK(last->kind == UpdateDebugInfo::Kind::ChildDidUpdate);
    CHECK(node.state().empty());
    CHECK(node.isDirty());
}

TEST_CASE("side effects start once and restart when their parameters change") {
    auto effects = std::make_shared<EffectLog>();
    WorkflowNode<Effectful> node(Effectful{effects, true, 1}, environmentWith());
    node.render();
    for (int pass = 0; pass < 4; ++pass) {
        node.render(Effectful{effects, true, 1});
    }
    CHECK(effects->starts == 1);
    REQUIRE(effects->lifetimes.size() == 1);
    CHECK_FALSE(effects->lifetimes[0]->hasEnded());
    CHECK(node.sideEffects().size() == 1);

    node.render(Effectful{effects, true, 2});
    CHECK(effects->starts == 2);
    REQUIRE(effects->lifetimes.size() == 2);
    CHECK(effects->lifetimes[0]->hasEnded());
    CHECK_FALSE(effects->lifetimes[1]->hasEnded());

    node.render(Effectful{effects, false, 2});
    CHECK(effects->lifetimes[1]->hasEnded());
    CHECK(node.sideEffects().size() == 0);
}

TEST_CASE("one side effect key registered twice in a pass is a contract violation") {
    test::ThrowingContractViolations throwing;
    auto                             started = std::make_shared<std::vector<std::shared_ptr<Lifetime>>>();
    {
        WorkflowNode<Doubled> node(Doubled{started}, environmentWith());
        CHECK_THROWS_WITH_AS(node.render(), doctest::Contains("registered twice"), ContractViolationError);
        REQUIRE(started->size() == 1);
        CHECK_NOTHROW(node.tearDown());
        CHECK(node.isTornDown());
    }
    CHECK(started->front()->hasEnded());
}

TEST_CASE("deliveries from an ended side effect are dropped") {
    auto effects = std::make_shared<EffectLog>();
    WorkflowNode<Effectful> node(Effectful{effects, true, 1}, environmentWith());
    node.render();
    REQUIRE(effects->handle.has_value());
    auto first = *effects->handle;

    CHECK(first.send(AnyAction<Effectful>([](int& state) { state += 1; })));
    CHECK(node.state() == 1);

    node.render(Effectful{effects, true, 2});
    CHECK(first.isCancelled());
    CHECK_FALSE(first.send(AnyAction<Effectful>([](int& state) { state += 10; })));
    CHECK(node.state() == 1);
}

TEST_CASE("teardown ends side effects and tears down children before the node") {
    auto observer = std::make_shared<test::RecordingObserver>();
    auto effects    = std::make_shared<EffectLog>();
    {
        WorkflowNode<Effectful> node(Effectful{effects, true, 0, true}, environmentWith(observer));
        node.render();
        observer->clear();

        node.tearDown();
        CHECK(node.isTornDown());
        CHECK(node.stateDescription() == "<no state>");
        CHECK(effects->lifetimes.back()->hasEnded());
        CHECK(observer->events() == std::vector<std::string>{"sideEffectDidEnd:Effectful:effect", "sideEffectDidEnd:Effectful[inner]:effect",
                                                             "sessionDidEnd:Effectful[inner]", "sessionDidEnd:Effectful"});

        node.tearDown();
        CHECK(observer->count("sessionDidEnd") == 2);
    }
    CHECK(observer->count("sessionDidEnd") == 2);
}

TEST_CASE("sinks of a torn-down node drop everything") {
    auto effects = std::make_shared<EffectLog>();
    auto node  = std::make_unique<WorkflowNode<Effectful>>(Effectful{effects, true, 0}, environmentWith());
    node->render();
    auto handle = *effects->handle;
    node.reset();
    CHECK_FALSE(handle.send(AnyAction<Effectful>([](int& state) { state += 1; })));
}

TEST_CASE("rendering a torn-down node is a contract violation") {
    test::ThrowingContractViolations throwing;
    WorkflowNode<Leaf>               node(Leaf{"x"}, environmentWith());
    node.render();
    node.tearDown();
    CHECK_THROWS_AS(node.render(), ContractViolationError);
}

}
