/// @file test_build_owner.cpp
/// @brief Tests for build scopes, the dirty list and state locking

#include <catch2/catch.hpp>

#include "test_widgets.hpp"

using namespace arbor_test;
using arbor_core::TreeError;
using arbor_core::TreeException;

namespace {

/// Leaf whose render object update throws once armed
class FragileLeaf : public LeafRenderObjectWidget {
public:
    explicit FragileLeaf(std::shared_ptr<bool> armed) : m_armed(std::move(armed)) {}

    [[nodiscard]] std::unique_ptr<RenderObject> create_render_object(BuildContext&) const override {
        return std::make_unique<RenderLeaf>("fragile");
    }

    void update_render_object(BuildContext&, RenderObject&) const override {
        if (*m_armed) {
            throw std::runtime_error("update failed");
        }
    }

private:
    std::shared_ptr<bool> m_armed;
};

WidgetPtr logging_builder(const std::shared_ptr<EventLog>& log, const std::string& name, WidgetPtr child) {
    return make<Builder>([log, name, child](BuildContext&) -> WidgetPtr {
        log->record(name);
        return child;
    });
}

} // anonymous namespace

TEST_CASE("build_scope rebuilds every dirty element", "[widgets][build_owner]") {
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;
    auto a = make_global_key("a");
    auto b = make_global_key("b");
    tree.pump(make<Column>(WidgetList{make<Probe>("a", log, a), make<Wrapper>(make<Probe>("b", log, b))}));

    a->current_state<ProbeState>(tree.owner())->increment();
    b->current_state<ProbeState>(tree.owner())->increment();
    REQUIRE(tree.owner().dirty_count() == 2);

    tree.pump();
    REQUIRE(tree.owner().dirty_count() == 0);
    REQUIRE_FALSE(a->current_element(tree.owner())->dirty());
    REQUIRE_FALSE(b->current_element(tree.owner())->dirty());
    REQUIRE(find_leaf(tree.root(), "a:1") != nullptr);
    REQUIRE(find_leaf(tree.root(), "b:1") != nullptr);
}

TEST_CASE("Parents rebuild before their descendants", "[widgets][build_owner]") {
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;

    // The outer builder returns a fresh inner builder on every build
    tree.pump(make<Builder>([log](BuildContext&) -> WidgetPtr {
        log->record("outer");
        return logging_builder(log, "inner", make<Leaf>("x"));
    }));
    Element* outer = tree.child();
    Element* inner = find_element(*outer, [outer](Element& e) { return e.parent() == outer; });
    REQUIRE(inner != nullptr);
    log->clear();

    inner->mark_needs_build();
    outer->mark_needs_build();
    tree.pump();

    REQUIRE(log->events == std::vector<std::string>{"outer", "inner"});
}

TEST_CASE("Elements made dirty during a scope are built in the same scope", "[widgets][build_owner]") {
    auto log = std::make_shared<EventLog>();
    auto key = make_global_key("late");
    TreeHarness tree;
    tree.pump(make<Column>(WidgetList{
        make<Builder>([&](BuildContext&) -> WidgetPtr {
            log->record("first");
            return make<Leaf>("first");
        }),
        make<Probe>("late", log, key),
    }));
    Element* first = find_by_widget<Builder>(tree.root());
    REQUIRE(first != nullptr);
    log->clear();

    // The callback schedules the probe after the builder was already queued
    first->mark_needs_build();
    tree.owner().build_scope(tree.root(), [&] {
        key->current_state<ProbeState>(tree.owner())->increment();
    });
    tree.owner().finalize_tree();

    REQUIRE(log->count("first") == 1);
    REQUIRE(log->count("build") == 1);
    REQUIRE(tree.owner().dirty_count() == 0);
}

TEST_CASE("State locking", "[widgets][build_owner]") {
    TreeHarness tree;
    tree.pump(make<Wrapper>(make<Leaf>("a")));
    Element* leaf = find_leaf(tree.root(), "a");

    SECTION("mark_needs_build while locked throws") {
        try {
            tree.owner().lock_state([&] { leaf->mark_needs_build(); });
            FAIL("expected a TreeException");
        } catch (const TreeException& e) {
            REQUIRE(e.kind() == TreeError::Kind::ContractViolation);
        }
        REQUIRE_FALSE(tree.owner().state_locked());
        REQUIRE_FALSE(leaf->dirty());
    }

    SECTION("locks nest") {
        tree.owner().lock_state([&] {
            tree.owner().lock_state([] {});
            REQUIRE(tree.owner().state_locked());
        });
        REQUIRE_FALSE(tree.owner().state_locked());
    }
}

TEST_CASE("Build scope contracts", "[widgets][build_owner]") {
    TreeHarness tree;
    tree.pump(make<Column>(WidgetList{make<Wrapper>(make<Leaf>("a")), make<Wrapper>(make<Leaf>("b"))}));
    Element* a = find_leaf(tree.root(), "a");
    Element* b = find_leaf(tree.root(), "b");

    SECTION("rebuild outside a scope is rejected") {
        a->mark_needs_build();
        REQUIRE_THROWS_AS(a->rebuild(), TreeException);
        tree.pump();
        REQUIRE_FALSE(a->dirty());
    }

    SECTION("scopes do not nest") {
        bool inner_ran = false;
        REQUIRE_THROWS_AS(tree.owner().build_scope(tree.root(), [&] {
            tree.owner().build_scope(tree.root(), [&] { inner_ran = true; });
        }), TreeException);
        REQUIRE_FALSE(inner_ran);
        REQUIRE_FALSE(tree.owner().building());
        REQUIRE_FALSE(tree.owner().state_locked());
    }

    SECTION("dirty elements outside the scope context are rejected") {
        a->mark_needs_build();
        REQUIRE_THROWS_AS(tree.owner().build_scope(*b->parent()), TreeException);

        // The aborted scope keeps the element scheduled
        REQUIRE(tree.owner().dirty_count() == 1);
        REQUIRE(a->dirty());
        tree.pump();
        REQUIRE(tree.owner().dirty_count() == 0);
    }

    SECTION("an empty scope without a callback does nothing") {
        bool scheduled = false;
        tree.owner().set_on_build_scheduled([&] { scheduled = true; });
        REQUIRE_NOTHROW(tree.owner().build_scope(tree.root()));
        REQUIRE_FALSE(scheduled);
    }
}

TEST_CASE("Failures while rebuilding dirty elements are reported", "[widgets][build_owner]") {
    auto armed = std::make_shared<bool>(false);
    TreeHarness tree;
    tree.pump(make<Column>(WidgetList{make<FragileLeaf>(armed), make<Leaf>("ok")}));
    Element* fragile = find_by_widget<FragileLeaf>(tree.root());
    Element* ok = find_leaf(tree.root(), "ok");

    *armed = true;
    fragile->mark_needs_build();
    ok->mark_needs_build();
    REQUIRE_NOTHROW(tree.pump());

    REQUIRE(tree.errors().size() == 1);
    REQUIRE(tree.errors().front().summary == "update failed");
    REQUIRE(tree.errors().front().context == "rebuilding dirty elements");
    REQUIRE_FALSE(fragile->dirty());
    REQUIRE_FALSE(ok->dirty());
    REQUIRE(static_cast<RenderLeaf*>(ok->render_object())->updates == 1);
}

TEST_CASE("finalize_tree unmounts what was not reclaimed", "[widgets][build_owner]") {
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;
    tree.pump(make<Wrapper>());
    const auto baseline = tree.owner().arena().live_count();

    tree.build(make<Wrapper>(make<Column>(WidgetList{make<Probe>("a", log), make<Probe>("b", log)})));
    tree.owner().finalize_tree();
    REQUIRE(tree.owner().arena().live_count() > baseline);

    tree.build(make<Wrapper>());
    REQUIRE(tree.owner().inactive_elements().size() == 1);
    REQUIRE(log->count("dispose") == 0);

    tree.owner().finalize_tree();
    REQUIRE(tree.owner().inactive_elements().size() == 0);
    REQUIRE(log->count("deactivate") == 2);
    REQUIRE(log->count("dispose") == 2);
    REQUIRE(tree.owner().arena().live_count() == baseline);
}

TEST_CASE("Build passes are traced when enabled", "[widgets][build_owner]") {
    FrameworkConfig config;
    config.print_build_scope = true;
    config.print_schedule_build = true;
    LogCapture build_log(arbor_core::LogChannel::Build);

    auto log = std::make_shared<EventLog>();
    TreeHarness tree(config);
    tree.pump(make<Column>(WidgetList{make<Probe>("a", log)}));
    REQUIRE(build_log.contains("build_scope() started"));
    REQUIRE(build_log.contains("build_scope() finished {context=\""));
    REQUIRE(build_log.contains("finalize_tree() finished {unmounted=\"0\", released=\"0\""));

    auto* state = static_cast<ProbeState*>(
        static_cast<StatefulElement*>(find_by_widget<Probe>(tree.root()))->state());
    state->increment();
    REQUIRE(build_log.contains("schedule_build_for() {element=\""));
    tree.pump();
    REQUIRE(build_log.contains("scheduled=\"1\", rebuilt=\"1\""));

    tree.pump(make<Column>(WidgetList{}));
    REQUIRE(build_log.contains("finalize_tree() finished {unmounted=\""));
}

TEST_CASE("Build passes are silent by default", "[widgets][build_owner]") {
    LogCapture build_log(arbor_core::LogChannel::Build);
    TreeHarness tree;
    tree.pump(make<Leaf>("a"));
    REQUIRE_FALSE(build_log.contains("build_scope()"));
    REQUIRE_FALSE(build_log.contains("finalize_tree()"));
}
