// test_comparator_registry.cpp - Tests for ComparatorRegistry
// Module 4: comparator lookup and resolution order

#include <catch2/catch_all.hpp>
#include <deepeq/comparator_registry.h>
#include <deepeq/comparators.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace deepeq;

// ============================================================
// Registration
// ============================================================

TEST_CASE("ComparatorRegistry register and lookup", "[registry]") {
    ComparatorRegistry registry;
    REQUIRE(registry.empty());
    REQUIRE_FALSE(registry.lookup("double").has_value());

    registry.register_comparator("double", comparators::at_precision(0.5));
    REQUIRE(registry.contains("double"));
    REQUIRE(registry.size() == 1);

    auto found = registry.lookup("double");
    REQUIRE(found.has_value());
    REQUIRE(found->equals(Value{1.0}, Value{1.4}));

    SECTION("re-registration replaces the comparator") {
        registry.register_comparator("double", comparators::never_equal());
        REQUIRE(registry.size() == 1);
        REQUIRE_FALSE(registry.lookup("double")->equals(Value{1.0}, Value{1.0}));
    }

    SECTION("unregister") {
        REQUIRE(registry.unregister("double"));
        REQUIRE_FALSE(registry.unregister("double"));
        REQUIRE(registry.empty());
    }

    SECTION("empty predicates are ignored") {
        registry.register_comparator("string", TypeComparator{});
        REQUIRE_FALSE(registry.contains("string"));
    }

    SECTION("missing description gets a default") {
        registry.register_comparator("Date", comparators::asymmetric(
            [](const Value&, const Value&) { return true; }));
        REQUIRE(registry.lookup("Date")->description == "comparator for Date");
    }

    SECTION("registered_types is sorted") {
        registry.register_comparator("Address", comparators::always_equal());
        registry.register_comparator("Person", comparators::always_equal());
        REQUIRE(registry.registered_types() == std::vector<std::string>{"Address", "Person", "double"});
    }

    SECTION("clear") {
        registry.register_bridge("Date", "Timestamp", comparators::same_payload());
        registry.clear();
        REQUIRE(registry.empty());
        REQUIRE(registry.bridge_count() == 0);
    }
}

TEST_CASE("ComparatorRegistry bridges", "[registry][bridge]") {
    ComparatorRegistry registry;
    registry.register_bridge("Timestamp", "Date", comparators::asymmetric(
        [](const Value&, const Value&) { return true; }));

    REQUIRE(registry.bridge_count() == 1);
    REQUIRE(registry.has_bridge("Date", "Timestamp"));
    REQUIRE(registry.has_bridge("Timestamp", "Date"));
    REQUIRE_FALSE(registry.contains("Date"));

    SECTION("bridges are always symmetric") {
        auto resolved = registry.resolve("Date", "Timestamp");
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->comparator.symmetric);
        REQUIRE(resolved->comparator.description == "comparator bridging Timestamp and Date");
    }

    SECTION("a bridge from a type to itself is an exact comparator") {
        registry.register_bridge("Money", "Money", comparators::always_equal());
        REQUIRE(registry.contains("Money"));
        REQUIRE(registry.bridge_count() == 1);
    }
}

// ============================================================
// Resolution order
// ============================================================

TEST_CASE("ComparatorRegistry resolve order", "[registry][resolve]") {
    ComparatorRegistry registry;

    SECTION("nothing registered") {
        REQUIRE_FALSE(registry.resolve("Date", "Date").has_value());
    }

    SECTION("exact type of the actual value") {
        registry.register_comparator("Date", comparators::always_equal());
        auto resolved = registry.resolve("Date", "Timestamp");
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->strategy == ResolutionStrategy::ExactType);
        REQUIRE(resolved->matched == "Date");
    }

    SECTION("exact type wins over a bridge") {
        registry.register_comparator("Date", comparators::never_equal());
        registry.register_bridge("Date", "Timestamp", comparators::always_equal());
        auto resolved = registry.resolve("Date", "Timestamp");
        REQUIRE(resolved->strategy == ResolutionStrategy::ExactType);
        REQUIRE_FALSE(resolved->comparator.equals(Value{}, Value{}));
    }

    SECTION("bridge wins over the expected type's comparator") {
        registry.register_comparator("Timestamp", comparators::never_equal());
        registry.register_bridge("Date", "Timestamp", comparators::always_equal());
        auto resolved = registry.resolve("Date", "Timestamp");
        REQUIRE(resolved->strategy == ResolutionStrategy::Bridge);
        REQUIRE(resolved->matched == "Date|Timestamp");
    }

    SECTION("bridges only apply to distinct types") {
        registry.register_bridge("Date", "Timestamp", comparators::always_equal());
        REQUIRE_FALSE(registry.resolve("Date", "Date").has_value());
    }

    SECTION("symmetric comparator of the expected type") {
        registry.register_comparator("Timestamp", comparators::same_payload());
        auto resolved = registry.resolve("Date", "Timestamp");
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->strategy == ResolutionStrategy::SymmetricExpected);
        REQUIRE(resolved->matched == "Timestamp");
    }

    SECTION("asymmetric comparator of the expected type is not used") {
        registry.register_comparator("Timestamp", comparators::asymmetric(
            [](const Value&, const Value&) { return true; }));
        REQUIRE_FALSE(registry.resolve("Date", "Timestamp").has_value());
    }
}

TEST_CASE("ResolutionStrategy to_string", "[registry]") {
    REQUIRE(to_string(ResolutionStrategy::ExactType) == "exact type");
    REQUIRE(to_string(ResolutionStrategy::Bridge) == "bridge");
    REQUIRE(to_string(ResolutionStrategy::SymmetricExpected) == "symmetric expected type");
}

// ============================================================
// Copy and concurrency
// ============================================================

TEST_CASE("ComparatorRegistry copies are independent", "[registry][copy]") {
    ComparatorRegistry original;
    original.register_comparator("double", comparators::always_equal());

    ComparatorRegistry copy{original};
    copy.register_comparator("string", comparators::always_equal());
    REQUIRE(copy.size() == 2);
    REQUIRE(original.size() == 1);

    ComparatorRegistry assigned;
    assigned = original;
    REQUIRE(assigned.contains("double"));
}

TEST_CASE("ComparatorRegistry concurrent readers", "[registry][thread]") {
    ComparatorRegistry registry;
    registry.register_comparator("double", comparators::at_precision(0.1));
    registry.register_bridge("Date", "Timestamp", comparators::same_payload());

    std::atomic<int> hits{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                if (registry.resolve("double", "double") && registry.resolve("Timestamp", "Date")) {
                    ++hits;
                }
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    REQUIRE(hits.load() == 4000);
}
