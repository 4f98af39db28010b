// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file recursive_comparison.h
/// @brief Field-by-field recursive comparison of two Value graphs.
///
/// The engine walks actual and expected in lock-step and records every
/// divergence instead of stopping at the first one. At each node:
///
/// 1. Ignored paths, and null actual values when
///    `ignore_all_actual_null_fields` is set, are skipped.
/// 2. Identical nodes (both null, same object, same container root) are equal;
///    no comparator is consulted.
/// 3. Exactly one null side is a NullnessMismatch; no comparator is consulted.
/// 4. A field comparator for the path, else a type comparator resolved by
///    ComparatorRegistry::resolve(), decides the node on its own. The node's
///    members are never visited. Type comparators apply to the root pair as
///    well, so two Person roots with a Person comparator registered give at
///    most one difference, at the empty path. Field comparators never apply
///    to the root, which has no field path.
/// 5. With strict type checking, different runtime types are a ShapeMismatch.
/// 6. Objects already on the recursion path are equal (cycle). Otherwise the
///    actual object's fields are compared in declaration order. Only
///    ancestors are tracked: an object reached twice through different
///    fields (a diamond) is compared, and reported, on both paths.
/// 7. Vectors of different sizes are a ShapeMismatch, else compared by index.
/// 8. Maps report keys present on one side only as a ShapeMismatch, then
///    compare shared keys in sorted order.
/// 9. Leaves use natural equality.
///
/// Differences come out in depth-first, left-to-right order of the actual
/// graph, so equal inputs always give the same sequence.

#pragma once

#include <deepeq/api.h>
#include <deepeq/difference_collector.h>
#include <deepeq/field_path.h>
#include <deepeq/recursive_comparison_configuration.h>
#include <deepeq/value.h>
#include <deepeq/visited_pairs.h>

#include <stdexcept>
#include <string>

namespace deepeq {

/// @brief A registered comparator threw instead of answering.
///
/// The comparison is aborted: a comparator that cannot answer makes every
/// result of the call untrustworthy. The original exception is nested
/// (see std::rethrow_if_nested).
class DEEPEQ_API ComparatorError : public std::runtime_error
{
public:
    ComparatorError(std::string path, std::string comparator, const std::string& reason);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& comparator() const noexcept { return comparator_; }

private:
    std::string path_;
    std::string comparator_;
};

/// @brief Recursive comparison engine.
///
/// One instance holds the traversal state (path, visited pairs, collected
/// differences) of the call in progress, so an instance must not be used by
/// two threads at once. Separate instances may share one configuration.
class DEEPEQ_API RecursiveComparator
{
public:
    explicit RecursiveComparator(const RecursiveComparisonConfiguration& config) : config_(config) {}
    /// The engine keeps a reference to its configuration.
    explicit RecursiveComparator(RecursiveComparisonConfiguration&&) = delete;

    RecursiveComparator(const RecursiveComparator&) = delete;
    RecursiveComparator& operator=(const RecursiveComparator&) = delete;

    /// Compare two graphs and return every difference found.
    /// @throws ComparatorError if a registered comparator throws
    [[nodiscard]] DifferenceCollector compare(const Value& actual, const Value& expected);

private:
    void compare_value(const Value& actual, const Value& expected);
    bool apply_comparator(const Value& actual, const Value& expected);
    bool call_comparator(const TypeComparator& comparator, const Value& actual, const Value& expected);
    void compare_objects(const Object& actual_obj, const Object& expected_obj,
                         const Value& actual, const Value& expected);
    void compare_vectors(const ValueVector& actual_vec, const ValueVector& expected_vec,
                         const Value& actual, const Value& expected);
    void compare_maps(const ValueMap& actual_map, const ValueMap& expected_map,
                      const Value& actual, const Value& expected);
    void compare_leaves(const Value& actual, const Value& expected);
    void report(ComparisonDifference::Kind kind, const Value& actual, const Value& expected,
                std::optional<std::string> explanation = std::nullopt);

    const RecursiveComparisonConfiguration& config_;
    VisitedPairSet visited_;
    FieldPath path_;
    DifferenceCollector differences_;
};

/// Compare `actual` against `expected` with a fresh engine.
/// @throws ComparatorError if a registered comparator throws
[[nodiscard]] DEEPEQ_API DifferenceCollector compare(const Value& actual,
                                                     const Value& expected,
                                                     const RecursiveComparisonConfiguration& config);

/// Compare with an empty configuration (no comparators, no ignored fields).
[[nodiscard]] DEEPEQ_API DifferenceCollector compare(const Value& actual, const Value& expected);

/// True if the two graphs are recursively equal under `config`.
[[nodiscard]] DEEPEQ_API bool are_recursively_equal(const Value& actual,
                                                    const Value& expected,
                                                    const RecursiveComparisonConfiguration& config);

/// True if the two graphs share a node identity at the root: same storage,
/// both null, same object, or immer containers sharing their root.
[[nodiscard]] DEEPEQ_API bool same_identity(const Value& actual, const Value& expected) noexcept;

} // namespace deepeq
