/// @file test_stateful.cpp
/// @brief Tests for State lifecycle and set_state contracts

#include <catch2/catch.hpp>

#include "test_widgets.hpp"

#include <future>

using namespace arbor_test;
using arbor_core::TreeException;

namespace {

class Retained;

/// State exposing its hooks to the test body
class RetainedState : public StateOf<Retained> {
public:
    std::function<void(RetainedState&)> on_init;
    std::function<void(RetainedState&)> on_build;
    std::function<void(RetainedState&)> on_dispose;
    int builds = 0;
    int value = 0;

    void init_state() override {
        if (on_init) {
            on_init(*this);
        }
    }

    void dispose() override {
        if (on_dispose) {
            on_dispose(*this);
        }
    }

    WidgetPtr build(BuildContext&) override {
        ++builds;
        if (on_build) {
            on_build(*this);
        }
        return make<Leaf>("value:" + std::to_string(value));
    }

    void bump() {
        set_state([this] { ++value; });
    }

    template<typename F>
    void apply(F&& fn) {
        set_state(std::forward<F>(fn));
    }
};

using StateSetup = std::function<void(RetainedState&)>;

/// Stateful widget handing its state out to the test
class Retained : public StatefulWidget {
public:
    explicit Retained(std::shared_ptr<RetainedState>* out, StateSetup setup = {}, KeyPtr key = nullptr)
        : StatefulWidget(std::move(key)), m_out(out), m_setup(std::move(setup)) {}

    [[nodiscard]] std::shared_ptr<State> create_state() const override {
        auto state = std::make_shared<RetainedState>();
        if (m_setup) {
            m_setup(*state);
        }
        if (m_out) {
            *m_out = state;
        }
        return state;
    }

private:
    std::shared_ptr<RetainedState>* m_out;
    StateSetup m_setup;
};

const std::string& only_error(const TreeHarness& tree) {
    REQUIRE(tree.errors().size() == 1);
    return tree.errors().front().summary;
}

} // anonymous namespace

TEST_CASE("State hooks run in lifecycle order", "[widgets][stateful]") {
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;

    tree.pump(make<Wrapper>(make<Probe>("p", log)));
    REQUIRE(log->events == std::vector<std::string>{"init_state", "did_change_dependencies", "build"});

    log->clear();
    tree.pump(make<Wrapper>(make<Probe>("p", log)));
    REQUIRE(log->events == std::vector<std::string>{"did_update_widget", "build"});

    log->clear();
    tree.pump(make<Wrapper>());
    REQUIRE(log->events == std::vector<std::string>{"deactivate", "dispose"});
}

TEST_CASE("State survives updates of its element", "[widgets][stateful]") {
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;
    tree.pump(make<Probe>("p", log));

    auto& element = dynamic_cast<StatefulElement&>(*tree.child());
    State* state = element.state();
    REQUIRE(state->lifecycle() == StateLifecycle::Ready);
    REQUIRE(state->mounted());
    REQUIRE(&state->context() == static_cast<BuildContext*>(&element));

    for (int i = 0; i < 3; ++i) {
        tree.pump(make<Probe>("p", log));
    }
    REQUIRE(tree.child() == &element);
    REQUIRE(element.state() == state);
    REQUIRE(log->count("init_state") == 1);
    REQUIRE(log->count("did_update_widget") == 3);
    REQUIRE(log->count("dispose") == 0);
}

TEST_CASE("set_state schedules a rebuild", "[widgets][stateful]") {
    std::shared_ptr<RetainedState> state;
    TreeHarness tree;
    tree.pump(make<Wrapper>(make<Retained>(&state)));
    REQUIRE(state->builds == 1);

    state->bump();
    REQUIRE(tree.owner().dirty_count() == 1);
    REQUIRE(state->context().owner() == &tree.owner());

    tree.pump();
    REQUIRE(state->builds == 2);
    REQUIRE(tree.owner().dirty_count() == 0);
    auto& leaf = static_cast<RenderLeaf&>(*tree.render_child<RenderWrapper>().child());
    REQUIRE(leaf.label == "value:1");

    // Two calls before the next frame rebuild once
    state->bump();
    state->bump();
    tree.pump();
    REQUIRE(state->builds == 3);
    REQUIRE(leaf.label == "value:3");
}

TEST_CASE("Build scheduling callback fires once per frame", "[widgets][stateful]") {
    std::shared_ptr<RetainedState> state;
    TreeHarness tree;
    int scheduled = 0;
    tree.owner().set_on_build_scheduled([&] { ++scheduled; });
    tree.pump(make<Retained>(&state));
    REQUIRE(scheduled == 0);

    state->bump();
    REQUIRE(scheduled == 1);
    REQUIRE(tree.owner().build_scheduled());
    tree.pump();
    REQUIRE_FALSE(tree.owner().build_scheduled());

    state->bump();
    REQUIRE(scheduled == 2);
    tree.pump();
}

TEST_CASE("set_state after dispose is a contract violation", "[widgets][stateful]") {
    std::shared_ptr<RetainedState> state;
    TreeHarness tree;
    tree.pump(make<Retained>(&state));
    tree.pump(make<Leaf>("other"));

    REQUIRE(state->lifecycle() == StateLifecycle::Defunct);
    REQUIRE_FALSE(state->mounted());
    try {
        state->bump();
        FAIL("expected a TreeException");
    } catch (const TreeException& e) {
        REQUIRE(e.kind() == arbor_core::TreeError::Kind::ContractViolation);
        REQUIRE(std::string(e.what()).find("after dispose()") != std::string::npos);
    }
    REQUIRE_THROWS_AS(state->context(), TreeException);
}

TEST_CASE("A State is not mounted until its element is", "[widgets][stateful]") {
    std::shared_ptr<RetainedState> state;
    bool mounted_in_init = false;
    std::unique_ptr<Element> element = make<Retained>(&state, [&](RetainedState& s) {
        s.on_init = [&](RetainedState& self) { mounted_in_init = self.mounted(); };
    })->create_element();

    REQUIRE(state != nullptr);
    REQUIRE(state->lifecycle() == StateLifecycle::Created);
    REQUIRE_FALSE(state->mounted());
    REQUIRE_THROWS_AS(state->context(), TreeException);
    try {
        state->bump();
        FAIL("expected a TreeException");
    } catch (const TreeException& e) {
        REQUIRE(e.kind() == arbor_core::TreeError::Kind::ContractViolation);
        REQUIRE(std::string(e.what()).find("before the State was mounted") != std::string::npos);
    }
    REQUIRE(state->value == 0);

    element.reset();
    REQUIRE_FALSE(state->mounted());

    TreeHarness tree;
    tree.pump(make<Retained>(&state, [&](RetainedState& s) {
        s.on_init = [&](RetainedState& self) { mounted_in_init = self.mounted(); };
    }));
    REQUIRE(mounted_in_init);
    REQUIRE(state->mounted());
}

TEST_CASE("set_state rejects deferred results", "[widgets][stateful]") {
    std::shared_ptr<RetainedState> state;
    TreeHarness tree;
    tree.pump(make<Retained>(&state));

    auto deferred = [] {
        std::promise<void> promise;
        promise.set_value();
        return promise.get_future();
    };
    REQUIRE_THROWS_AS(state->apply(deferred), TreeException);
    REQUIRE(tree.owner().dirty_count() == 0);

    // A synchronous callback is still accepted afterwards
    REQUIRE_NOTHROW(state->apply([] {}));
    tree.pump();
}

TEST_CASE("set_state during build", "[widgets][stateful]") {
    SECTION("on the element being built is ignored") {
        std::shared_ptr<RetainedState> state;
        TreeHarness tree;
        bool first = true;
        tree.pump(make<Retained>(&state));
        state->on_build = [&](RetainedState& s) {
            if (first) {
                first = false;
                s.bump();
            }
        };
        state->bump();
        tree.pump();

        REQUIRE(tree.errors().empty());
        REQUIRE(state->builds == 2);
        REQUIRE_FALSE(tree.child()->dirty());
        REQUIRE(tree.owner().dirty_count() == 0);
    }

    SECTION("on an element outside the build target is rejected") {
        std::shared_ptr<RetainedState> sibling;
        TreeHarness tree;

        tree.pump(make<Column>(WidgetList{
            make<Retained>(&sibling),
            make<Builder>([&](BuildContext&) -> WidgetPtr {
                sibling->bump();
                return make<Leaf>("never");
            }),
        }));

        REQUIRE(only_error(tree).find("called during build") != std::string::npos);
        REQUIRE(find_by_widget<ErrorWidget>(tree.root()) != nullptr);
        REQUIRE(find_leaf(tree.root(), "never") == nullptr);
        REQUIRE(sibling->builds == 1);
    }
}

TEST_CASE("set_state while the tree is locked", "[widgets][stateful]") {
    std::shared_ptr<RetainedState> survivor;
    std::shared_ptr<RetainedState> doomed;
    TreeHarness tree;
    tree.pump(make<Column>(WidgetList{make<Retained>(&survivor, StateSetup{}, make_value_key(1)),
                                      make<Retained>(&doomed, StateSetup{}, make_value_key(2))}));

    doomed->on_dispose = [&](RetainedState&) { survivor->bump(); };
    tree.build(make<Column>(WidgetList{make<Retained>(&survivor, StateSetup{}, make_value_key(1))}));

    try {
        tree.owner().finalize_tree();
        FAIL("expected a TreeException");
    } catch (const TreeException& e) {
        REQUIRE(std::string(e.what()).find("locked") != std::string::npos);
    }
    REQUIRE_FALSE(tree.owner().state_locked());
}

TEST_CASE("init_state failures", "[widgets][stateful]") {
    SECTION("a throwing init_state gets neither deactivate nor dispose") {
        std::shared_ptr<RetainedState> state;
        int disposed = 0;
        TreeHarness tree;

        tree.pump(make<Ambient>(0, make<Retained>(&state, [&](RetainedState& s) {
            s.on_init = [](RetainedState&) { throw std::runtime_error("init failed"); };
            s.on_dispose = [&](RetainedState&) { ++disposed; };
        })));

        REQUIRE(only_error(tree) == "init failed");
        REQUIRE(find_by_widget<ErrorWidget>(tree.root()) != nullptr);
        REQUIRE(disposed == 0);
        REQUIRE(state->builds == 0);
        REQUIRE(state->lifecycle() == StateLifecycle::Defunct);
    }

    SECTION("dependency lookups in init_state are rejected") {
        std::shared_ptr<RetainedState> state;
        TreeHarness tree;

        tree.pump(make<Ambient>(1, make<Retained>(&state, [](RetainedState& s) {
            s.on_init = [](RetainedState& self) {
                (void)self.context().depend_on_inherited_widget_of_exact_type<Ambient>();
            };
        })));

        REQUIRE(only_error(tree).find("init_state() completed") != std::string::npos);
        REQUIRE(find_by_widget<ErrorWidget>(tree.root()) != nullptr);
    }
}

TEST_CASE("Reassemble rebuilds every element", "[widgets][stateful]") {
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;
    tree.pump(make<Wrapper>(make<Probe>("p", log)));
    log->clear();

    tree.owner().reassemble(tree.root());
    REQUIRE(tree.child()->dirty());
    tree.pump();

    REQUIRE(log->events == std::vector<std::string>{"reassemble", "build"});
    REQUIRE_FALSE(tree.child()->dirty());
}
