// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file comparison_difference.h
/// @brief One divergence found by a recursive comparison.

#pragma once

#include <deepeq/api.h>
#include <deepeq/field_path.h>
#include <deepeq/value.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deepeq {

/// @brief Immutable record of a single difference between actual and expected.
///
/// Values are held through ValueBox, so recording a difference on a large
/// subtree only bumps a reference count.
class DEEPEQ_API ComparisonDifference
{
public:
    enum class Kind : uint8_t {
        ValueMismatch,       ///< leaf values differ under natural equality
        NullnessMismatch,    ///< one side absent, the other present
        ShapeMismatch,       ///< sizes, key sets, field sets or structural kinds differ
        ComparatorRejected   ///< a registered comparator reported inequality
    };

    ComparisonDifference(Kind kind, FieldPath path, const Value& actual, const Value& expected,
                         std::optional<std::string> explanation = std::nullopt)
        : kind_(kind)
        , path_(std::move(path))
        , actual_(ValueBox{actual})
        , expected_(ValueBox{expected})
        , explanation_(std::move(explanation)) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const FieldPath& path() const noexcept { return path_; }
    [[nodiscard]] std::string path_string() const { return path_.to_string(); }
    [[nodiscard]] const Value& actual() const { return *actual_; }
    [[nodiscard]] const Value& expected() const { return *expected_; }
    [[nodiscard]] const std::optional<std::string>& explanation() const noexcept { return explanation_; }

    /// One-line rendering:
    /// `field/property 'home.address.number' differ: actual=1, expected=2 (...)`
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ComparisonDifference& other) const;

private:
    Kind kind_;
    FieldPath path_;
    ValueBox actual_;
    ValueBox expected_;
    std::optional<std::string> explanation_;
};

[[nodiscard]] DEEPEQ_API std::string_view to_string(ComparisonDifference::Kind kind) noexcept;

} // namespace deepeq
