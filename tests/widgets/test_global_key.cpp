/// @file test_global_key.cpp
/// @brief Tests for global key reparenting and duplicate detection

#include <catch2/catch.hpp>

#include "test_widgets.hpp"

using namespace arbor_test;
using arbor_core::TreeError;
using arbor_core::TreeException;

TEST_CASE("Global keys reparent state within one frame", "[widgets][global]") {
    auto key = make_global_key("a");
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;

    tree.pump(make<Column>(WidgetList{make<Probe>("a", log, key), make<Wrapper>()}));
    Element* element = key->current_element(tree.owner());
    auto* state = key->current_state<ProbeState>(tree.owner());
    REQUIRE(element != nullptr);
    REQUIRE(element->depth() == 3);

    state->increment();
    tree.pump();

    tree.pump(make<Column>(WidgetList{make<Wrapper>(make<Probe>("a", log, key))}));

    REQUIRE(tree.errors().empty());
    REQUIRE(key->current_element(tree.owner()) == element);
    REQUIRE(key->current_state<ProbeState>(tree.owner()) == state);
    REQUIRE(element->active());
    REQUIRE(element->depth() == 4);
    REQUIRE(state->counter == 1);

    REQUIRE(log->count("init_state") == 1);
    REQUIRE(log->count("deactivate") == 1);
    REQUIRE(log->count("dispose") == 0);

    // The old slot is vacated and the render object moved under the wrapper
    auto& column = tree.render_child<RenderColumn>();
    REQUIRE(column.labels() == std::vector<std::string>{"RenderWrapper"});
    auto* wrapper = dynamic_cast<RenderWrapper*>(column.children().front());
    REQUIRE(wrapper != nullptr);
    REQUIRE(static_cast<RenderLeaf*>(wrapper->child())->label == "a:1");
}

TEST_CASE("Global keys reparent from a discarded subtree", "[widgets][global]") {
    auto key = make_global_key("a");
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;

    tree.pump(make<Column>(WidgetList{make<Probe>("a", log, key)}));
    Element* element = key->current_element(tree.owner());

    // The column is replaced outright; its keyed child is picked up by the wrapper
    tree.pump(make<Wrapper>(make<Probe>("a", log, key)));

    REQUIRE(key->current_element(tree.owner()) == element);
    REQUIRE(element->parent() == tree.child());
    REQUIRE(log->count("init_state") == 1);
    REQUIRE(log->count("dispose") == 0);
    REQUIRE(find_by_widget<Column>(tree.root()) == nullptr);
}

TEST_CASE("Global keys do not survive a frame boundary", "[widgets][global]") {
    auto key = make_global_key("a");
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;

    tree.pump(make<Wrapper>(make<Probe>("a", log, key)));
    tree.pump(make<Wrapper>());
    REQUIRE(key->current_element(tree.owner()) == nullptr);
    REQUIRE(log->count("dispose") == 1);

    tree.pump(make<Wrapper>(make<Probe>("a", log, key)));
    REQUIRE(log->count("init_state") == 2);
}

TEST_CASE("A global key bound to a new type hands off cleanly", "[widgets][global]") {
    auto key = make_global_key("k");
    TreeHarness tree;

    tree.pump(make<Wrapper>(make<Leaf>("a", key)));
    Element* old_element = key->current_element(tree.owner());

    REQUIRE_NOTHROW(tree.pump(make<Wrapper>(make<OtherLeaf>("b", key))));
    Element* new_element = key->current_element(tree.owner());
    REQUIRE(new_element != nullptr);
    REQUIRE(new_element != old_element);
    REQUIRE(dynamic_cast<const OtherLeaf*>(new_element->widget().get()) != nullptr);
    REQUIRE(tree.owner().global_keys().size() == 1);
}

TEST_CASE("Duplicate global keys are reported at finalize", "[widgets][global]") {
    auto key = make_global_key("dup");
    auto log = std::make_shared<EventLog>();

    SECTION("same type under two parents") {
        TreeHarness tree;
        // Building succeeds; the second use steals the element from the first parent
        REQUIRE_NOTHROW(tree.build(make<Column>(WidgetList{
            make<Wrapper>(make<Probe>("a", log, key)),
            make<Wrapper>(make<Probe>("b", log, key)),
        })));

        try {
            tree.owner().finalize_tree();
            FAIL("expected a TreeException");
        } catch (const TreeException& e) {
            REQUIRE(e.kind() == TreeError::Kind::DuplicateGlobalKey);
            REQUIRE(std::string(e.what()) == "Multiple widgets used the same GlobalKey.");
            REQUIRE(e.error().chains.size() == 2);
        }

        // The frame's bookkeeping was cleared despite the failure
        REQUIRE(tree.owner().global_keys().reservation_count() == 0);
        REQUIRE_NOTHROW(tree.owner().finalize_tree());
    }

    SECTION("different types under two parents") {
        TreeHarness tree;
        tree.build(make<Column>(WidgetList{
            make<Wrapper>(make<Leaf>("a", key)),
            make<Wrapper>(make<OtherLeaf>("b", key)),
        }));
        REQUIRE_THROWS_AS(tree.owner().finalize_tree(), TreeException);
    }

    SECTION("verification can be switched off") {
        FrameworkConfig config;
        config.verify_global_keys = false;
        TreeHarness tree(config);
        tree.build(make<Column>(WidgetList{
            make<Wrapper>(make<Probe>("a", log, key)),
            make<Wrapper>(make<Probe>("b", log, key)),
        }));
        REQUIRE_NOTHROW(tree.owner().finalize_tree());
    }
}

TEST_CASE("Duplicate global keys in one child list", "[widgets][global]") {
    auto key = make_global_key("dup");
    try {
        (void)make<Column>(WidgetList{make<Leaf>("a", key), make<OtherLeaf>("b", key)});
        FAIL("expected a TreeException");
    } catch (const TreeException& e) {
        REQUIRE(e.kind() == TreeError::Kind::DuplicateKeys);
    }
}

TEST_CASE("Global key reservations are released on rebuild", "[widgets][global]") {
    auto key = make_global_key("a");
    auto log = std::make_shared<EventLog>();
    TreeHarness tree;

    tree.build(make<Wrapper>(make<Probe>("a", log, key)));
    REQUIRE(tree.owner().global_keys().reservation_count() == 1);
    tree.owner().finalize_tree();
    REQUIRE(tree.owner().global_keys().reservation_count() == 0);

    // Reusing the key in a later frame after dropping it is fine
    tree.pump(make<Wrapper>(make<Leaf>("gap")));
    REQUIRE_NOTHROW(tree.pump(make<Column>(WidgetList{make<Probe>("a", log, key)})));
    REQUIRE(key->current_element(tree.owner()) != nullptr);
}
