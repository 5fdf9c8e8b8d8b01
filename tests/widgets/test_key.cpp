/// @file test_key.cpp
/// @brief Tests for identity keys and widget compatibility

#include <catch2/catch.hpp>

#include "test_widgets.hpp"

using namespace arbor_test;

TEST_CASE("Key equality", "[widgets][key]") {
    SECTION("value keys compare by value and type") {
        REQUIRE(keys_equal(make_value_key(1), make_value_key(1)));
        REQUIRE_FALSE(keys_equal(make_value_key(1), make_value_key(2)));
        REQUIRE(keys_equal(make_value_key("a"), make_value_key(std::string("a"))));
        // Same printed value, different wrapped type
        REQUIRE_FALSE(keys_equal(make_value_key(1), make_value_key(1L)));
    }

    SECTION("equal value keys hash alike") {
        KeyHash hash;
        REQUIRE(hash(make_value_key(7)) == hash(make_value_key(7)));
    }

    SECTION("unique keys equal only themselves") {
        KeyPtr a = make_unique_key();
        KeyPtr b = make_unique_key();
        REQUIRE(keys_equal(a, a));
        REQUIRE_FALSE(keys_equal(a, b));
    }

    SECTION("object keys compare identity of the wrapped object") {
        auto object = std::make_shared<int>(3);
        auto other = std::make_shared<int>(3);
        REQUIRE(keys_equal(std::make_shared<ObjectKey>(object), std::make_shared<ObjectKey>(object)));
        REQUIRE_FALSE(keys_equal(std::make_shared<ObjectKey>(object), std::make_shared<ObjectKey>(other)));
    }

    SECTION("absent keys are equal to each other only") {
        REQUIRE(keys_equal(nullptr, nullptr));
        REQUIRE_FALSE(keys_equal(nullptr, make_value_key(1)));
        REQUIRE_FALSE(keys_equal(make_value_key(1), nullptr));
    }

    SECTION("global keys") {
        auto labeled = make_global_key("editor");
        REQUIRE(labeled->is_global());
        REQUIRE_FALSE(keys_equal(labeled, make_global_key("editor")));

        auto object = std::make_shared<int>(0);
        auto a = std::make_shared<GlobalObjectKey>(object);
        auto b = std::make_shared<GlobalObjectKey>(object);
        REQUIRE(keys_equal(a, b));
        REQUIRE(KeyHash{}(a) == KeyHash{}(b));
        REQUIRE_FALSE(keys_equal(a, std::make_shared<ObjectKey>(object)));
    }
}

TEST_CASE("Key descriptions", "[widgets][key]") {
    REQUIRE(make_value_key(42)->to_string() == "[42]");
    REQUIRE(make_value_key("x")->to_string() == "['x']");
    REQUIRE(make_global_key("editor")->to_string().find("editor") != std::string::npos);
}

TEST_CASE("Widget::can_update", "[widgets][key]") {
    SECTION("same type, no keys") {
        REQUIRE(Widget::can_update(*make<Leaf>("a"), *make<Leaf>("b")));
    }

    SECTION("same type, equal keys") {
        REQUIRE(Widget::can_update(*make<Leaf>("a", make_value_key(1)), *make<Leaf>("b", make_value_key(1))));
    }

    SECTION("different keys") {
        REQUIRE_FALSE(Widget::can_update(*make<Leaf>("a", make_value_key(1)), *make<Leaf>("a", make_value_key(2))));
        REQUIRE_FALSE(Widget::can_update(*make<Leaf>("a"), *make<Leaf>("a", make_value_key(1))));
    }

    SECTION("different types") {
        REQUIRE_FALSE(Widget::can_update(*make<Leaf>("a"), *make<OtherLeaf>("a")));
    }
}

TEST_CASE("Widget descriptions", "[widgets][key]") {
    REQUIRE(make<Leaf>("a")->type_name() == "Leaf");
    REQUIRE(make<Leaf>("a", make_value_key(3))->to_string_short() == "Leaf-[3]");
    REQUIRE(make<Leaf>("a")->to_string_short() == "Leaf");
}

TEST_CASE("GlobalKey lookups are scoped to one owner", "[widgets][key][global]") {
    auto key = make_global_key("probe");
    auto log = std::make_shared<EventLog>();

    TreeHarness first;
    TreeHarness second;
    first.pump(make<Probe>("p", log, key));

    REQUIRE(key->current_element(first.owner()) != nullptr);
    REQUIRE(key->current_element(second.owner()) == nullptr);
    REQUIRE(dynamic_cast<const Probe*>(key->current_widget(first.owner())) != nullptr);
    REQUIRE(key->current_state<ProbeState>(first.owner()) != nullptr);
    REQUIRE(key->current_state<ProbeState>(second.owner()) == nullptr);

    first.pump(make<Leaf>("gone"));
    REQUIRE(key->current_element(first.owner()) == nullptr);
}
