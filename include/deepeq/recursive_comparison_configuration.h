// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file recursive_comparison_configuration.h
/// @brief Options and comparator overrides for one or many comparisons.
///
/// A configuration is passed explicitly to every comparison; there is no
/// process-wide default. Build it once, then share it (read-only) between
/// as many comparisons as needed:
///
/// ```cpp
/// RecursiveComparisonConfiguration config;
/// config.register_comparator_for_type("double", comparators::at_precision(0.01))
///       .register_comparator_for_field("home.address.number", comparators::always_equal())
///       .ignore_fields({"id", "audit.lastModified"});
///
/// auto diffs = compare(actual, expected, config);
/// ```
///
/// Field paths use the FieldPath syntax ("a.b[2].c") and are validated on
/// registration.

#pragma once

#include <deepeq/api.h>
#include <deepeq/comparator_registry.h>
#include <deepeq/field_path.h>

#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace deepeq {

class DEEPEQ_API RecursiveComparisonConfiguration
{
public:
    RecursiveComparisonConfiguration() = default;

    // ------------------------------------------------------------
    // Comparators
    // ------------------------------------------------------------

    /// Compare every node whose actual value has this type with `comparator`.
    /// Replaces any comparator previously registered for the type.
    RecursiveComparisonConfiguration& register_comparator_for_type(std::string type,
                                                                   TypeComparator comparator);

    /// Shorthand for an asymmetric comparator.
    RecursiveComparisonConfiguration& register_comparator_for_type(std::string type, ComparatorFn fn);

    /// Register a symmetric comparator for nodes pairing `type1` with `type2`
    /// (in either order).
    RecursiveComparisonConfiguration& register_symmetric_comparator_for_types(std::string type1,
                                                                              std::string type2,
                                                                              TypeComparator comparator);

    /// Compare the node at exactly this path with `comparator`. Field
    /// comparators take precedence over type comparators.
    /// @throws std::invalid_argument if `path` is malformed
    RecursiveComparisonConfiguration& register_comparator_for_field(std::string_view path,
                                                                    TypeComparator comparator);

    [[nodiscard]] const ComparatorRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] ComparatorRegistry& registry() noexcept { return registry_; }

    /// Comparator registered for the exact printed path, or nullptr.
    [[nodiscard]] const TypeComparator* field_comparator(std::string_view path) const;

    // ------------------------------------------------------------
    // Ignored fields
    // ------------------------------------------------------------

    /// Skip the node at `path` and everything below it.
    /// @throws std::invalid_argument if `path` is malformed
    RecursiveComparisonConfiguration& ignore_field(std::string_view path);
    RecursiveComparisonConfiguration& ignore_fields(std::initializer_list<std::string_view> paths);

    [[nodiscard]] bool is_ignored(const FieldPath& path) const;
    [[nodiscard]] const std::set<std::string>& ignored_fields() const noexcept { return ignored_; }

    // ------------------------------------------------------------
    // Options
    // ------------------------------------------------------------

    /// Skip every node where the actual value is null (expected may be anything).
    RecursiveComparisonConfiguration& set_ignore_all_actual_null_fields(bool value) {
        ignore_all_actual_null_fields_ = value;
        return *this;
    }
    [[nodiscard]] bool ignore_all_actual_null_fields() const noexcept { return ignore_all_actual_null_fields_; }

    /// Require both sides of a node to have the same runtime type before
    /// comparing their members (objects of different types then differ even
    /// with identical fields).
    RecursiveComparisonConfiguration& set_strict_type_checking(bool value) {
        strict_type_checking_ = value;
        return *this;
    }
    [[nodiscard]] bool strict_type_checking() const noexcept { return strict_type_checking_; }

    /// True if any path-based rule is configured (field comparators or ignores).
    [[nodiscard]] bool has_field_rules() const noexcept {
        return !field_comparators_.empty() || !ignored_.empty();
    }

    /// Multi-line summary, suitable for assertion failure messages.
    [[nodiscard]] std::string describe() const;

private:
    ComparatorRegistry registry_;
    std::map<std::string, TypeComparator, std::less<>> field_comparators_;
    std::set<std::string> ignored_;
    bool ignore_all_actual_null_fields_ = false;
    bool strict_type_checking_ = false;
};

} // namespace deepeq
