// comparators.cpp - stock comparators

#include <deepeq/comparators.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace deepeq::comparators {

TypeComparator always_equal()
{
    return TypeComparator{
        [](const Value&, const Value&) { return true; },
        true,
        "always equal"};
}

TypeComparator never_equal()
{
    return TypeComparator{
        [](const Value&, const Value&) { return false; },
        true,
        "never equal"};
}

TypeComparator case_insensitive_string()
{
    return TypeComparator{
        [](const Value& actual, const Value& expected) {
            auto* a = actual.get_if<std::string>();
            auto* e = expected.get_if<std::string>();
            if (!a || !e) {
                return actual == expected;
            }
            return std::ranges::equal(*a, *e, [](unsigned char x, unsigned char y) {
                return std::tolower(x) == std::tolower(y);
            });
        },
        true,
        "case insensitive string comparator"};
}

TypeComparator at_precision(double precision)
{
    return TypeComparator{
        [precision](const Value& actual, const Value& expected) {
            auto a = actual.as_number();
            auto e = expected.as_number();
            if (!a || !e) {
                return actual == expected;
            }
            return std::fabs(*a - *e) <= precision;
        },
        true,
        "at precision " + std::to_string(precision)};
}

TypeComparator same_payload()
{
    return TypeComparator{
        [](const Value& actual, const Value& expected) {
            return actual.unwrap_atom() == expected.unwrap_atom();
        },
        true,
        "same payload comparator"};
}

TypeComparator symmetric(ComparatorFn fn, std::string description)
{
    return TypeComparator{std::move(fn), true, std::move(description)};
}

TypeComparator asymmetric(ComparatorFn fn, std::string description)
{
    return TypeComparator{std::move(fn), false, std::move(description)};
}

} // namespace deepeq::comparators
