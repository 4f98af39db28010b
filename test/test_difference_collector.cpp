// test_difference_collector.cpp - Tests for ComparisonDifference and DifferenceCollector

#include <catch2/catch_all.hpp>
#include <deepeq/difference_collector.h>

#include <sstream>
#include <string>
#include <vector>

using namespace deepeq;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ComparisonDifference accessors", "[collector][difference]") {
    ComparisonDifference diff{ComparisonDifference::Kind::ValueMismatch,
                              FieldPath::parse("home.address.number"),
                              Value{1}, Value{2}};

    REQUIRE(diff.kind() == ComparisonDifference::Kind::ValueMismatch);
    REQUIRE(diff.path_string() == "home.address.number");
    REQUIRE(diff.actual().as_int() == 1);
    REQUIRE(diff.expected().as_int() == 2);
    REQUIRE_FALSE(diff.explanation().has_value());

    SECTION("to_string") {
        REQUIRE(diff.to_string() ==
                "field/property 'home.address.number' differ: actual=1, expected=2 [value mismatch]");
    }

    SECTION("root differences") {
        ComparisonDifference root{ComparisonDifference::Kind::ShapeMismatch, FieldPath{},
                                  Value::vector({Value{1}}), Value::vector({}),
                                  std::string{"size"}};
        REQUIRE_THAT(root.to_string(), ContainsSubstring("top-level values differ"));
        REQUIRE_THAT(root.to_string(), ContainsSubstring("(size)"));
    }

    SECTION("equality") {
        ComparisonDifference same{ComparisonDifference::Kind::ValueMismatch,
                                  FieldPath::parse("home.address.number"),
                                  Value{1}, Value{2}};
        REQUIRE(diff == same);
    }
}

TEST_CASE("Kind to_string", "[collector][difference]") {
    REQUIRE(to_string(ComparisonDifference::Kind::ValueMismatch) == "value mismatch");
    REQUIRE(to_string(ComparisonDifference::Kind::NullnessMismatch) == "nullness mismatch");
    REQUIRE(to_string(ComparisonDifference::Kind::ShapeMismatch) == "shape mismatch");
    REQUIRE(to_string(ComparisonDifference::Kind::ComparatorRejected) == "comparator rejected");
}

TEST_CASE("DifferenceCollector find matches printed paths", "[collector][find]") {
    FieldPath key_path;
    key_path.push_field("m");
    key_path.push_key("1");

    DifferenceCollector collector;
    collector.add({ComparisonDifference::Kind::ValueMismatch, key_path, Value{1}, Value{2}});

    REQUIRE(collector.find("m[1]") != nullptr);
    REQUIRE(collector.find(FieldPath::parse("m[1]")) != nullptr);
    REQUIRE(collector.find(key_path) != nullptr);
    REQUIRE(collector.find(FieldPath::parse("m[2]")) == nullptr);
}

TEST_CASE("DifferenceCollector", "[collector]") {
    DifferenceCollector collector;
    REQUIRE(collector.empty());

    collector.add({ComparisonDifference::Kind::ValueMismatch, FieldPath::parse("name"),
                   Value{"John"}, Value{"Jack"}});
    collector.add({ComparisonDifference::Kind::NullnessMismatch, FieldPath::parse("neighbour"),
                   Value{}, Value{"x"}});

    REQUIRE(collector.size() == 2);
    REQUIRE(collector[0].path_string() == "name");
    REQUIRE(collector.paths() == std::vector<std::string>{"name", "neighbour"});

    SECTION("find by string and by path") {
        REQUIRE(collector.contains("neighbour"));
        REQUIRE_FALSE(collector.contains("home"));
        auto* found = collector.find(FieldPath::parse("name"));
        REQUIRE(found != nullptr);
        REQUIRE(found->actual().as_string() == "John");
    }

    SECTION("iteration keeps insertion order") {
        std::vector<ComparisonDifference::Kind> kinds;
        for (const auto& d : collector) {
            kinds.push_back(d.kind());
        }
        REQUIRE(kinds == std::vector<ComparisonDifference::Kind>{
            ComparisonDifference::Kind::ValueMismatch,
            ComparisonDifference::Kind::NullnessMismatch});
    }

    SECTION("print lists one line per difference") {
        std::ostringstream oss;
        collector.print(oss);
        auto text = oss.str();
        REQUIRE_THAT(text, ContainsSubstring("field/property 'name' differ"));
        REQUIRE_THAT(text, ContainsSubstring("field/property 'neighbour' differ"));
        REQUIRE(text == collector.to_string());
    }

    SECTION("clear") {
        collector.clear();
        REQUIRE(collector.empty());
        REQUIRE(collector.to_string() == "  (no differences)\n");
    }
}
