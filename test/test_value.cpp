// test_value.cpp - Tests for Value, Object and ObjectGraph
// Module 1: value model the comparison engine walks

#include <catch2/catch_all.hpp>
#include <deepeq/builders.h>
#include <deepeq/value.h>

#include "fixtures.h"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace deepeq;

// ============================================================
// Value Tests
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.type_name() == "null");
    REQUIRE(v.size() == 0);
}

TEST_CASE("Value primitive construction", "[value][construction]") {
    SECTION("int32_t") {
        Value v{int32_t{42}};
        REQUIRE(v.is<int32_t>());
        REQUIRE(v.as_int() == 42);
        REQUIRE(v.type_name() == type_names::INT32);
    }

    SECTION("int64_t") {
        Value v{int64_t{42}};
        REQUIRE(v.is<int64_t>());
        REQUIRE(v.as_int64() == 42);
        REQUIRE(v.type_name() == type_names::INT64);
    }

    SECTION("double") {
        Value v{3.5};
        REQUIRE(v.as_double() == 3.5);
        REQUIRE(v.type_name() == type_names::DOUBLE);
    }

    SECTION("bool") {
        Value v{true};
        REQUIRE(v.as_bool());
        REQUIRE(v.type_name() == type_names::BOOL);
    }

    SECTION("string") {
        Value v{"hello"};
        REQUIRE(v.as_string() == "hello");
        REQUIRE(v.as_string_view() == "hello");
        REQUIRE(v.type_name() == type_names::STRING);
    }

    SECTION("null object pointer is null") {
        ObjectRef none = nullptr;
        Value v{none};
        REQUIRE(v.is_null());
    }
}

TEST_CASE("Value atoms", "[value][atom]") {
    auto d = test::date(10);

    REQUIRE(d.is_atom());
    REQUIRE(d.type_name() == "Date");
    REQUIRE(d.unwrap_atom() == Value{int64_t{10}});
    REQUIRE(d.as_number() == 10.0);

    SECTION("atoms of different types are not equal") {
        REQUIRE(test::date(10) != test::timestamp(10));
    }

    SECTION("atoms with equal type and payload are equal") {
        REQUIRE(test::date(10) == test::date(10));
    }
}

TEST_CASE("Value containers", "[value][container]") {
    auto m = Value::map({
        {"name", Value{"Alice"}},
        {"scores", Value::vector({Value{1}, Value{2}, Value{3}})}
    });

    REQUIRE(m.type_name() == type_names::MAP);
    REQUIRE(m.size() == 2);
    REQUIRE(m.at("name").as_string() == "Alice");
    REQUIRE(m.at("scores").at(std::size_t{1}).as_int() == 2);

    SECTION("missing key and index yield null") {
        REQUIRE(m.at("missing").is_null());
        REQUIRE(m.at("scores").at(std::size_t{10}).is_null());
    }

    SECTION("at_or falls back on missing keys") {
        REQUIRE(m.at_or("missing", Value{7}).as_int() == 7);
    }

    SECTION("containers compare element-wise") {
        auto copy = Value::map({
            {"name", Value{"Alice"}},
            {"scores", Value::vector({Value{1}, Value{2}, Value{3}})}
        });
        REQUIRE(m == copy);
    }
}

TEST_CASE("Value NaN equality", "[value][number]") {
    REQUIRE(Value{std::nan("")} == Value{std::nan("")});
    REQUIRE(Value{std::nan("")} != Value{1.0});
    REQUIRE(Value{1.0} != Value{std::nan("")});
    REQUIRE(Value::atom("Reading", Value{std::nan("")}) == Value::atom("Reading", Value{std::nan("")}));
    REQUIRE(Value::vector({Value{std::nan("")}}) == Value::vector({Value{std::nan("")}}));
}

TEST_CASE("Value numeric view", "[value][number]") {
    REQUIRE(Value{int32_t{2}}.as_number() == 2.0);
    REQUIRE(Value{int64_t{3}}.as_number() == 3.0);
    REQUIRE(Value{1.5}.as_number() == 1.5);
    REQUIRE_FALSE(Value{"1.5"}.as_number().has_value());
}

// ============================================================
// Object / ObjectGraph Tests
// ============================================================

TEST_CASE("Object fields keep declaration order", "[value][object]") {
    ObjectGraph graph;
    Object& obj = graph.make("Address");
    obj.set("number", 1).set("street", "Baker Street");

    REQUIRE(obj.type_name() == "Address");
    REQUIRE(obj.size() == 2);
    REQUIRE(obj.fields()[0].first == "number");
    REQUIRE(obj.fields()[1].first == "street");

    SECTION("set overwrites in place") {
        obj.set("number", 221);
        REQUIRE(obj.size() == 2);
        REQUIRE(obj.fields()[0].first == "number");
        REQUIRE(obj.get("number").as_int() == 221);
    }

    SECTION("missing fields") {
        REQUIRE_FALSE(obj.has("zip"));
        REQUIRE(obj.find("zip") == nullptr);
        REQUIRE(obj.get("zip").is_null());
    }
}

TEST_CASE("Object values are references", "[value][object]") {
    ObjectGraph graph;
    Object& john = test::make_person(graph, "John");
    john.set("neighbour", john);

    Value root{john};
    REQUIRE(root.is_object());
    REQUIRE(root.as_object() == &john);
    REQUIRE(root.type_name() == "Person");
    REQUIRE(root.at("neighbour").as_object() == &john);
    REQUIRE(root.size() == john.size());

    SECTION("equality is identity") {
        Object& twin = test::make_person(graph, "John");
        REQUIRE(Value{john} == Value{john});
        REQUIRE(Value{john} != Value{twin});
    }
}

TEST_CASE("Built-in type names are reserved", "[value][graph]") {
    ObjectGraph graph;

    REQUIRE(is_builtin_type_name("map"));
    REQUIRE(is_builtin_type_name("int32"));
    REQUIRE_FALSE(is_builtin_type_name("Person"));

    REQUIRE_THROWS_AS(graph.make("map"), std::invalid_argument);
    REQUIRE_THROWS_AS(graph.make("null"), std::invalid_argument);
    REQUIRE(graph.empty());

    REQUIRE_THROWS_AS(Value::atom("int32", Value{1}), std::invalid_argument);
    REQUIRE_NOTHROW(Value::atom("Money", Value{1}));
}

TEST_CASE("ObjectGraph owns its objects", "[value][graph]") {
    ObjectGraph graph;
    REQUIRE(graph.empty());

    Object& a = graph.make("A");
    Object& b = graph.make("B");
    REQUIRE(graph.size() == 2);

    SECTION("addresses survive further allocations") {
        for (int i = 0; i < 100; ++i) {
            graph.make("Filler");
        }
        REQUIRE(a.type_name() == "A");
        REQUIRE(b.type_name() == "B");
    }

    SECTION("moving the graph keeps addresses stable") {
        ObjectGraph moved = std::move(graph);
        REQUIRE(moved.size() == 2);
        REQUIRE(a.type_name() == "A");
    }
}

// ============================================================
// Formatting Tests
// ============================================================

TEST_CASE("value_to_string", "[value][format]") {
    REQUIRE(value_to_string(Value{}) == "null");
    REQUIRE(value_to_string(Value{1}) == "1");
    REQUIRE(value_to_string(Value{int64_t{1}}) == "1L");
    REQUIRE(value_to_string(Value{3.0}) == "3.0");
    REQUIRE(value_to_string(Value{"x"}) == "\"x\"");
    REQUIRE(value_to_string(test::date(5)) == "Date(5L)");
    REQUIRE(value_to_string(Value::vector({Value{1}, Value{2}})) == "[1, 2]");
    REQUIRE(value_to_string(Value::map({{"b", Value{2}}, {"a", Value{1}}})) == "{a: 1, b: 2}");

    SECTION("objects render one level deep") {
        ObjectGraph graph;
        Object& address = test::make_address(graph, 1, "Baker");
        REQUIRE(value_to_string(Value{address}) == "Address{number=1, street=\"Baker\"}");

        Object& home = graph.make("Home").set("address", address);
        REQUIRE(value_to_string(Value{home}) == "Home{address=Address{...}}");
    }

    SECTION("self-referencing objects print finitely") {
        ObjectGraph graph;
        Object& node = graph.make("Node");
        node.set("next", node);
        REQUIRE(value_to_string(Value{node}) == "Node{next=Node{...}}");
    }
}

// ============================================================
// Builder Tests
// ============================================================

TEST_CASE("MapBuilder", "[value][builder]") {
    auto v = MapBuilder()
        .set("a", 1)
        .set("b", "two")
        .finish();

    REQUIRE(v.size() == 2);
    REQUIRE(v.at("a").as_int() == 1);
    REQUIRE(v.at("b").as_string() == "two");

    SECTION("extends an existing map") {
        MapBuilder builder{v.as_map()};
        builder.set("c", 3.0);
        REQUIRE(builder.contains("a"));
        REQUIRE(builder.size() == 3);
    }
}

TEST_CASE("VectorBuilder", "[value][builder]") {
    VectorBuilder builder;
    builder.push_back(1).push_back(2).push_back(3);
    builder.set(1, 20);
    builder.set(10, 99);  // out of range, ignored

    auto vec = builder.finish_vector();
    REQUIRE(vec.size() == 3);
    REQUIRE(vec[1]->as_int() == 20);
}
