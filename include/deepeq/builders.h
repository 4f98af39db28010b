// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of Value containers.
///
/// This file provides transient-based builders for constructing Value containers:
/// - MapBuilder: Build ValueMap efficiently
/// - VectorBuilder: Build ValueVector efficiently
///
/// Usage:
/// @code
///   #include <deepeq/builders.h>
///
///   Value scores = MapBuilder()
///       .set("alice", 12)
///       .set("bob", 7)
///       .finish();
///
///   Value friends = VectorBuilder()
///       .push_back(sherlock)
///       .push_back(watson)
///       .finish();
/// @endcode
///
/// Note: This header must be included separately from value.h if you need Builder functionality.

#pragma once

#include <deepeq/value.h>

namespace deepeq {

/// Builder for constructing ValueMap efficiently - O(n) complexity
class MapBuilder {
public:
    using transient_type = ValueMap::transient_type;

    MapBuilder() : transient_(ValueMap{}.transient()) {}
    explicit MapBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    // Move operations (allowed)
    MapBuilder(MapBuilder&&) noexcept = default;
    MapBuilder& operator=(MapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

    /// Set a key-value pair
    /// @param key The key
    /// @param val The value (any type convertible to Value)
    /// @return Reference to this builder for chaining
    template <typename T>
    MapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value
    /// @note The builder should not be used after calling finish()
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    /// Finish building and return the raw container
    [[nodiscard]] ValueMap finish_map() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for constructing ValueVector efficiently - O(n) complexity
class VectorBuilder {
public:
    using transient_type = ValueVector::transient_type;

    VectorBuilder() : transient_(ValueVector{}.transient()) {}
    explicit VectorBuilder(const ValueVector& existing) : transient_(existing.transient()) {}

    VectorBuilder(VectorBuilder&&) noexcept = default;
    VectorBuilder& operator=(VectorBuilder&&) noexcept = default;

    VectorBuilder(const VectorBuilder&) = delete;
    VectorBuilder& operator=(const VectorBuilder&) = delete;

    template <typename T>
    VectorBuilder& push_back(T&& val) {
        transient_.push_back(ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    /// Replace an element already pushed; out-of-range indices are ignored
    template <typename T>
    VectorBuilder& set(std::size_t index, T&& val) {
        if (index < transient_.size()) {
            transient_.set(index, ValueBox{Value{std::forward<T>(val)}});
        } else {
            detail::log_index_error("VectorBuilder::set", index, "out of range");
        }
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    [[nodiscard]] ValueVector finish_vector() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

} // namespace deepeq
