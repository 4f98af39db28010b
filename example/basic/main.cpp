// main.cpp
// Recursive comparison example - comparing object graphs field by field
//
// Walks through the main features of deepeq:
//
// Demo 1: Plain comparison, differences listed with their paths
// Demo 2: Type comparators (precision, case-insensitive, always-equal)
// Demo 3: Symmetric comparator bridging two temporal types
// Demo 4: Cyclic graphs
// Demo 5: Ignored fields and field comparators
// Demo 6: A comparator that throws

#include <deepeq/builders.h>
#include <deepeq/comparators.h>
#include <deepeq/recursive_comparison.h>
#include <deepeq/value.h>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace deepeq;

// ============================================================
// Sample data
// ============================================================

Object& make_person(ObjectGraph& graph, const std::string& name, int32_t number, double height)
{
    Object& address = graph.make("Address");
    address.set("number", number).set("street", "Baker Street");

    Object& home = graph.make("Home");
    home.set("address", address);

    Object& person = graph.make("Person");
    person.set("name", name)
          .set("dateOfBirth", Value::atom("Date", int64_t{10'000}))
          .set("height", height)
          .set("home", home)
          .set("neighbour", nullptr)
          .set("tags", MapBuilder().set("team", "red").set("level", 3).finish());
    return person;
}

void show(const std::string& title, const DifferenceCollector& diffs)
{
    std::cout << title << " -> " << (diffs.empty() ? "equal" : "different") << "\n";
    diffs.print();
    std::cout << "\n";
}

// ============================================================
// Demos
// ============================================================

void demo_plain()
{
    std::cout << "=== Demo 1: plain comparison ===\n";
    ObjectGraph graph;
    Object& actual = make_person(graph, "John", 221, 1.80);
    Object& expected = make_person(graph, "Jack", 222, 1.80);

    print_value(Value{actual});
    show("John vs Jack", compare(Value{actual}, Value{expected}));
}

void demo_type_comparators()
{
    std::cout << "=== Demo 2: type comparators ===\n";
    ObjectGraph graph;
    Object& actual = make_person(graph, "John", 221, 1.80);
    Object& expected = make_person(graph, "JOHN", 222, 1.85);

    RecursiveComparisonConfiguration config;
    config.register_comparator_for_type("double", comparators::at_precision(0.1))
          .register_comparator_for_type("string", comparators::case_insensitive_string())
          .register_comparator_for_type("Address", comparators::always_equal());

    std::cout << config.describe();
    show("with comparators", compare(Value{actual}, Value{expected}, config));
}

void demo_bridge()
{
    std::cout << "=== Demo 3: bridging Date and Timestamp ===\n";
    auto to_millis = [](const Value& v) {
        auto payload = v.unwrap_atom().as_int64();
        return v.type_name() == "Date" ? payload * 86'400'000 : payload;
    };

    RecursiveComparisonConfiguration config;
    config.register_symmetric_comparator_for_types(
        "Date", "Timestamp",
        comparators::symmetric([to_millis](const Value& a, const Value& e) { return to_millis(a) == to_millis(e); },
                               "same instant"));

    auto date = Value::atom("Date", int64_t{1});
    auto timestamp = Value::atom("Timestamp", int64_t{86'400'000});

    show("Date vs Timestamp (no comparator)", compare(date, timestamp));
    show("Date vs Timestamp", compare(date, timestamp, config));
    show("Timestamp vs Date", compare(timestamp, date, config));
}

void demo_cycles()
{
    std::cout << "=== Demo 4: cyclic graphs ===\n";
    ObjectGraph graph;
    Object& john = make_person(graph, "John", 221, 1.80);
    Object& jane = make_person(graph, "John", 221, 1.80);
    john.set("neighbour", jane);
    jane.set("neighbour", john);

    show("mutual neighbours", compare(Value{john}, Value{jane}));
}

void demo_field_rules()
{
    std::cout << "=== Demo 5: field rules ===\n";
    ObjectGraph graph;
    Object& actual = make_person(graph, "John", 221, 1.80);
    Object& expected = make_person(graph, "John", 222, 1.80);
    expected.set("neighbour", make_person(graph, "Sherlock", 221, 1.85));

    RecursiveComparisonConfiguration config;
    config.ignore_field("home.address.number")
          .set_ignore_all_actual_null_fields(true);

    show("ignoring number and actual nulls", compare(Value{actual}, Value{expected}, config));
}

void demo_failing_comparator()
{
    std::cout << "=== Demo 6: failing comparator ===\n";
    ObjectGraph graph;
    Object& actual = make_person(graph, "John", 221, 1.80);
    Object& expected = make_person(graph, "John", 222, 1.80);

    RecursiveComparisonConfiguration config;
    config.register_comparator_for_field("home.address.number", comparators::asymmetric(
        [](const Value&, const Value&) -> bool { throw std::runtime_error("address service unavailable"); },
        "remote address check"));

    try {
        (void)compare(Value{actual}, Value{expected}, config);
    } catch (const ComparatorError& e) {
        std::cout << "ComparatorError: " << e.what() << "\n";
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& cause) {
            std::cout << "  caused by: " << cause.what() << "\n";
        }
    }
}

int main()
{
    std::cout << "=== deepeq Recursive Comparison Example ===\n\n";

    demo_plain();
    demo_type_comparators();
    demo_bridge();
    demo_cycles();
    demo_field_rules();
    demo_failing_comparator();

    return 0;
}
