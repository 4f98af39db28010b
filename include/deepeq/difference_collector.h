// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file difference_collector.h
/// @brief Ordered differences produced by one top-level comparison.
///
/// The collector keeps the differences in the order the engine found them,
/// which is a depth-first, left-to-right walk of the actual graph. An empty
/// collector means the two graphs are recursively equal.

#pragma once

#include <deepeq/api.h>
#include <deepeq/comparison_difference.h>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace deepeq {

class DEEPEQ_API DifferenceCollector
{
public:
    using const_iterator = std::vector<ComparisonDifference>::const_iterator;

    /// Append a difference (engine side).
    void add(ComparisonDifference difference);

    [[nodiscard]] bool empty() const noexcept { return differences_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return differences_.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return differences_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return differences_.end(); }
    [[nodiscard]] const ComparisonDifference& operator[](std::size_t i) const { return differences_[i]; }
    [[nodiscard]] const std::vector<ComparisonDifference>& differences() const noexcept { return differences_; }

    /// Difference recorded at the path that prints like `path`, or nullptr.
    /// Matching is on the printed form, so FieldPath::parse("m[1]") finds a
    /// difference under map key "1" as well as one under index 1.
    [[nodiscard]] const ComparisonDifference* find(const FieldPath& path) const;

    /// Difference recorded at the path printed as `path` ("home.address"), or nullptr.
    [[nodiscard]] const ComparisonDifference* find(std::string_view path) const;

    [[nodiscard]] bool contains(std::string_view path) const { return find(path) != nullptr; }

    /// Paths of all differences, in order.
    [[nodiscard]] std::vector<std::string> paths() const;

    void clear() noexcept { differences_.clear(); }

    /// Print one difference per line, or "(no differences)".
    void print(std::ostream& os) const;
    void print() const;

    [[nodiscard]] std::string to_string() const;

private:
    std::vector<ComparisonDifference> differences_;
};

} // namespace deepeq
