// recursive_comparison.cpp - RecursiveComparator implementation

#include <deepeq/recursive_comparison.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace deepeq {

namespace {

std::string join(const std::vector<std::string>& items)
{
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) result += ", ";
        result += item;
    }
    return result;
}

std::vector<std::string> sorted_keys(const ValueMap& m)
{
    std::vector<std::string> keys;
    keys.reserve(m.size());
    for (const auto& [k, v] : m) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::string describe_path(const FieldPath& path)
{
    return path.empty() ? std::string{"<root>"} : path.to_string();
}

} // anonymous namespace

// ============================================================
// ComparatorError
// ============================================================

ComparatorError::ComparatorError(std::string path, std::string comparator, const std::string& reason)
    : std::runtime_error("comparator '" + comparator + "' failed while comparing '" + path + "': " + reason)
    , path_(std::move(path))
    , comparator_(std::move(comparator))
{
}

// ============================================================
// Identity
// ============================================================

bool same_identity(const Value& actual, const Value& expected) noexcept
{
    if (&actual.data == &expected.data) {
        return true;
    }
    if (actual.data.index() != expected.data.index()) {
        return false;
    }
    if (actual.is_null()) {
        return true;
    }
    if (auto* a = actual.get_if<ObjectRef>()) {
        return *a == *expected.get_if<ObjectRef>();
    }
    if (auto* a = actual.get_if<ValueVector>()) {
        const auto& e = *expected.get_if<ValueVector>();
        return a->impl().root == e.impl().root &&
               a->impl().tail == e.impl().tail &&
               a->impl().size == e.impl().size;
    }
    if (auto* a = actual.get_if<ValueMap>()) {
        const auto& e = *expected.get_if<ValueMap>();
        return a->impl().root == e.impl().root &&
               a->impl().size == e.impl().size;
    }
    return false;
}

// ============================================================
// RecursiveComparator
// ============================================================

DifferenceCollector RecursiveComparator::compare(const Value& actual, const Value& expected)
{
    // Fresh traversal state for every call; a previous call may have been
    // aborted by a ComparatorError halfway through.
    visited_.clear();
    path_ = FieldPath{};
    differences_.clear();

    compare_value(actual, expected);

    return std::exchange(differences_, DifferenceCollector{});
}

void RecursiveComparator::compare_value(const Value& actual, const Value& expected)
{
    if (config_.has_field_rules() && config_.is_ignored(path_)) {
        return;
    }
    if (config_.ignore_all_actual_null_fields() && actual.is_null()) {
        return;
    }

    if (same_identity(actual, expected)) {
        return;
    }

    if (actual.is_null() || expected.is_null()) {
        report(ComparisonDifference::Kind::NullnessMismatch, actual, expected,
               actual.is_null() ? "actual value is null" : "expected value is null");
        return;
    }

    if (apply_comparator(actual, expected)) {
        return;
    }

    if (config_.strict_type_checking() && actual.type_name() != expected.type_name()) {
        report(ComparisonDifference::Kind::ShapeMismatch, actual, expected,
               "actual type " + std::string{actual.type_name()} +
               " differs from expected type " + std::string{expected.type_name()});
        return;
    }

    if (auto* a_obj = actual.as_object()) {
        if (auto* e_obj = expected.as_object()) {
            compare_objects(*a_obj, *e_obj, actual, expected);
            return;
        }
    } else if (auto* a_vec = actual.get_if<ValueVector>()) {
        if (auto* e_vec = expected.get_if<ValueVector>()) {
            compare_vectors(*a_vec, *e_vec, actual, expected);
            return;
        }
    } else if (auto* a_map = actual.get_if<ValueMap>()) {
        if (auto* e_map = expected.get_if<ValueMap>()) {
            compare_maps(*a_map, *e_map, actual, expected);
            return;
        }
    }

    if (actual.is_structured() || expected.is_structured()) {
        report(ComparisonDifference::Kind::ShapeMismatch, actual, expected,
               "cannot compare " + std::string{actual.type_name()} +
               " with " + std::string{expected.type_name()});
        return;
    }

    compare_leaves(actual, expected);
}

bool RecursiveComparator::apply_comparator(const Value& actual, const Value& expected)
{
    if (config_.has_field_rules() && !path_.empty()) {
        if (auto* field_cmp = config_.field_comparator(path_.to_string())) {
            if (!call_comparator(*field_cmp, actual, expected)) {
                report(ComparisonDifference::Kind::ComparatorRejected, actual, expected,
                       "rejected by " + field_cmp->description);
            }
            return true;
        }
    }

    const auto& registry = config_.registry();
    if (registry.empty()) {
        return false;
    }

    auto resolved = registry.resolve(actual.type_name(), expected.type_name());
    if (!resolved) {
        return false;
    }

#if DEEPEQ_TRACE_RESOLUTION
    detail::log_message("RecursiveComparator",
                        "'" + describe_path(path_) + "' uses " + resolved->comparator.description +
                        " (" + std::string{to_string(resolved->strategy)} + " match on " +
                        resolved->matched + ")");
#endif

    if (!call_comparator(resolved->comparator, actual, expected)) {
        report(ComparisonDifference::Kind::ComparatorRejected, actual, expected,
               "rejected by " + resolved->comparator.description +
               " (" + std::string{to_string(resolved->strategy)} + " match on " + resolved->matched + ")");
    }
    return true;
}

bool RecursiveComparator::call_comparator(const TypeComparator& comparator,
                                          const Value& actual,
                                          const Value& expected)
{
    try {
        return comparator.equals(actual, expected);
    } catch (const std::exception& ex) {
        std::throw_with_nested(ComparatorError{describe_path(path_), comparator.description, ex.what()});
    } catch (...) {
        std::throw_with_nested(ComparatorError{describe_path(path_), comparator.description,
                                               "non-standard exception"});
    }
}

void RecursiveComparator::compare_objects(const Object& actual_obj,
                                          const Object& expected_obj,
                                          const Value& actual,
                                          const Value& expected)
{
    if (visited_.contains(&actual_obj, &expected_obj)) {
#if DEEPEQ_VERBOSE_LOG
        detail::log_message("RecursiveComparator",
                            "cycle at '" + describe_path(path_) + "' (" + actual_obj.type_name() +
                            "), treating as equal");
#endif
        return;
    }
    VisitGuard guard{visited_, &actual_obj, &expected_obj};

    std::vector<std::string> missing;
    for (const auto& [name, value] : actual_obj.fields()) {
        if (!expected_obj.has(name)) {
            missing.push_back(name);
        }
    }
    if (!missing.empty()) {
        report(ComparisonDifference::Kind::ShapeMismatch, actual, expected,
               "expected " + expected_obj.type_name() + " has no field(s) " + join(missing));
        return;
    }

    if (config_.strict_type_checking()) {
        std::vector<std::string> unexpected;
        for (const auto& [name, value] : expected_obj.fields()) {
            if (!actual_obj.has(name)) {
                unexpected.push_back(name);
            }
        }
        if (!unexpected.empty()) {
            report(ComparisonDifference::Kind::ShapeMismatch, actual, expected,
                   "actual " + actual_obj.type_name() + " has no field(s) " + join(unexpected));
            return;
        }
    }

    for (const auto& [name, actual_field] : actual_obj.fields()) {
        path_.push_field(name);
        compare_value(actual_field, *expected_obj.find(name));
        path_.pop();
    }
}

void RecursiveComparator::compare_vectors(const ValueVector& actual_vec,
                                          const ValueVector& expected_vec,
                                          const Value& actual,
                                          const Value& expected)
{
    if (actual_vec.size() != expected_vec.size()) {
        report(ComparisonDifference::Kind::ShapeMismatch, actual, expected,
               "actual size " + std::to_string(actual_vec.size()) +
               " differs from expected size " + std::to_string(expected_vec.size()));
        return;
    }

    for (std::size_t i = 0; i < actual_vec.size(); ++i) {
        path_.push_index(i);
        compare_value(*actual_vec[i], *expected_vec[i]);
        path_.pop();
    }
}

void RecursiveComparator::compare_maps(const ValueMap& actual_map,
                                       const ValueMap& expected_map,
                                       const Value& actual,
                                       const Value& expected)
{
    const auto actual_keys = sorted_keys(actual_map);

    std::vector<std::string> only_actual;
    for (const auto& key : actual_keys) {
        if (expected_map.count(key) == 0) {
            only_actual.push_back(key);
        }
    }
    std::vector<std::string> only_expected;
    for (const auto& [key, box] : expected_map) {
        if (actual_map.count(key) == 0) {
            only_expected.push_back(key);
        }
    }
    std::sort(only_expected.begin(), only_expected.end());

    if (!only_actual.empty() || !only_expected.empty()) {
        std::string explanation;
        if (!only_actual.empty()) {
            explanation = "keys only in actual: " + join(only_actual);
        }
        if (!only_expected.empty()) {
            if (!explanation.empty()) explanation += "; ";
            explanation += "keys only in expected: " + join(only_expected);
        }
        report(ComparisonDifference::Kind::ShapeMismatch, actual, expected, std::move(explanation));
    }

    for (const auto& key : actual_keys) {
        const auto* expected_box = expected_map.find(key);
        if (!expected_box) {
            continue;
        }
        path_.push_key(key);
        compare_value(actual_map.find(key)->get(), expected_box->get());
        path_.pop();
    }
}

void RecursiveComparator::compare_leaves(const Value& actual, const Value& expected)
{
    if (actual == expected) {
        return;
    }
    if (actual.type_name() != expected.type_name()) {
        report(ComparisonDifference::Kind::ValueMismatch, actual, expected,
               "actual type " + std::string{actual.type_name()} +
               " differs from expected type " + std::string{expected.type_name()});
        return;
    }
    report(ComparisonDifference::Kind::ValueMismatch, actual, expected);
}

void RecursiveComparator::report(ComparisonDifference::Kind kind,
                                 const Value& actual,
                                 const Value& expected,
                                 std::optional<std::string> explanation)
{
    differences_.add(ComparisonDifference{kind, path_, actual, expected, std::move(explanation)});
}

// ============================================================
// Free functions
// ============================================================

DifferenceCollector compare(const Value& actual, const Value& expected,
                            const RecursiveComparisonConfiguration& config)
{
    RecursiveComparator engine{config};
    return engine.compare(actual, expected);
}

DifferenceCollector compare(const Value& actual, const Value& expected)
{
    const RecursiveComparisonConfiguration config;
    return compare(actual, expected, config);
}

bool are_recursively_equal(const Value& actual, const Value& expected,
                           const RecursiveComparisonConfiguration& config)
{
    return compare(actual, expected, config).empty();
}

} // namespace deepeq
