// fixtures.h - Shared object graphs for the comparison tests
//
// Person { name, dateOfBirth, height, home, neighbour, friends }
// Home { address }
// Address { number, street }
// Employee mirrors Person's first fields under another type name.

#pragma once

#include <deepeq/value.h>

#include <cstdint>
#include <string>

namespace deepeq::test {

inline Value date(int64_t days)
{
    return Value::atom("Date", Value{days});
}

inline Value timestamp(int64_t millis)
{
    return Value::atom("Timestamp", Value{millis});
}

inline Object& make_address(ObjectGraph& graph, int32_t number, std::string street = "Baker Street")
{
    return graph.make("Address").set("number", number).set("street", std::move(street));
}

inline Object& make_home(ObjectGraph& graph, int32_t number)
{
    return graph.make("Home").set("address", make_address(graph, number));
}

inline Object& make_person(ObjectGraph& graph, std::string name, int32_t house_number = 1)
{
    return graph.make("Person")
        .set("name", std::move(name))
        .set("dateOfBirth", date(1000))
        .set("height", 1.80)
        .set("home", make_home(graph, house_number))
        .set("neighbour", nullptr)
        .set("friends", ValueVector{});
}

inline Object& make_employee(ObjectGraph& graph, std::string name, Object& neighbour)
{
    return graph.make("Employee")
        .set("name", std::move(name))
        .set("dateOfBirth", date(1000))
        .set("home", make_home(graph, 1))
        .set("neighbour", neighbour);
}

} // namespace deepeq::test
