// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file comparators.h
/// @brief Ready-made TypeComparator factories.
///
/// ```cpp
/// RecursiveComparisonConfiguration config;
/// config.register_comparator_for_type("double", comparators::at_precision(0.2));
/// config.register_comparator_for_type("string", comparators::case_insensitive_string());
/// config.register_comparator_for_type("Timestamp", comparators::same_payload());
/// ```

#pragma once

#include <deepeq/api.h>
#include <deepeq/comparator_registry.h>

#include <string>

namespace deepeq::comparators {

/// Every pair is equal.
[[nodiscard]] DEEPEQ_API TypeComparator always_equal();

/// No pair is equal.
[[nodiscard]] DEEPEQ_API TypeComparator never_equal();

/// Strings equal ignoring ASCII case. Non-string values fall back to
/// natural equality.
[[nodiscard]] DEEPEQ_API TypeComparator case_insensitive_string();

/// Numbers (int32, int64, double, or atoms wrapping one) equal when
/// |actual - expected| <= precision. Non-numeric values fall back to natural
/// equality.
[[nodiscard]] DEEPEQ_API TypeComparator at_precision(double precision);

/// Atoms equal when their payloads are equal, whatever their type names.
/// Bridges temporal types of different precision, e.g. Date and Timestamp
/// holding the same instant.
[[nodiscard]] DEEPEQ_API TypeComparator same_payload();

/// Wrap any predicate as a symmetric comparator.
[[nodiscard]] DEEPEQ_API TypeComparator symmetric(ComparatorFn fn, std::string description = {});

/// Wrap any predicate as an asymmetric comparator.
[[nodiscard]] DEEPEQ_API TypeComparator asymmetric(ComparatorFn fn, std::string description = {});

} // namespace deepeq::comparators
