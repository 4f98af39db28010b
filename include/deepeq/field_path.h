// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field_path.h
/// @brief Location of a node inside a compared graph, relative to the root.
///
/// A FieldPath is a sequence of segments:
/// - FieldSegment: a named object field, printed as `.name`
/// - IndexSegment: a vector position, printed as `[i]`
/// - KeySegment:   a map key, printed as `[key]`
///
/// The root path is empty and prints as an empty string. A leading field is
/// printed without the dot, so paths read the way they are usually written
/// in assertion messages:
///
/// ```cpp
/// FieldPath path;
/// path.push_field("home");
/// path.push_field("address");
/// path.push_field("number");
/// path.to_string();                       // "home.address.number"
///
/// FieldPath::parse("friends[1].name");    // field, index, field
/// ```
///
/// Ignored fields and field comparators are matched on the printed form, so
/// a map key made of digits is addressed like an index ("m[1]"), and keys
/// containing ']' cannot be addressed at all.
///
/// The comparison engine pushes a segment when it descends into a member and
/// pops it when it returns, so the path always mirrors the recursion depth.

#pragma once

#include <deepeq/api.h>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace deepeq {

struct FieldSegment {
    std::string name;
    bool operator==(const FieldSegment&) const = default;
};

struct IndexSegment {
    std::size_t index;
    bool operator==(const IndexSegment&) const = default;
};

struct KeySegment {
    std::string key;
    bool operator==(const KeySegment&) const = default;
};

using PathSegment = std::variant<FieldSegment, IndexSegment, KeySegment>;

class DEEPEQ_API FieldPath
{
public:
    using const_iterator = std::vector<PathSegment>::const_iterator;

    FieldPath() = default;
    FieldPath(std::initializer_list<PathSegment> segments) : segments_(segments) {}

    /// Parse "a.b[2].c" / "scores[alice]". Bracketed all-digit text is an
    /// index, anything else a key.
    /// @throws std::invalid_argument on empty field names or unbalanced brackets
    [[nodiscard]] static FieldPath parse(std::string_view text);

    void push_field(std::string name) { segments_.emplace_back(FieldSegment{std::move(name)}); }
    void push_index(std::size_t index) { segments_.emplace_back(IndexSegment{index}); }
    void push_key(std::string key) { segments_.emplace_back(KeySegment{std::move(key)}); }

    /// Remove the deepest segment; no-op on the root path.
    void pop();

    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] const PathSegment& operator[](std::size_t i) const { return segments_[i]; }
    [[nodiscard]] const PathSegment& back() const { return segments_.back(); }
    [[nodiscard]] const std::vector<PathSegment>& segments() const noexcept { return segments_; }

    [[nodiscard]] const_iterator begin() const noexcept { return segments_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return segments_.end(); }

    /// True if this path equals `other` or lies below it.
    [[nodiscard]] bool starts_with(const FieldPath& other) const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const FieldPath&) const = default;

private:
    std::vector<PathSegment> segments_;
};

} // namespace deepeq
