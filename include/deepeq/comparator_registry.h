// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file comparator_registry.h
/// @brief Type-keyed equality overrides for recursive comparison.
///
/// A comparator registered for a type turns every node of that type into an
/// atomic leaf: the comparison engine asks the comparator and never looks at
/// the node's fields. Types are identified by Value::type_name(), so built-in
/// types ("int32", "string", ...), atom types ("Date") and object types
/// ("Person") are all registered the same way. Atoms and objects cannot take
/// a built-in name (see is_builtin_type_name()), so the two never collide.
///
/// ## Resolution order
///
/// For a node whose actual value has type A and expected value has type E:
/// 1. ExactType: comparator registered for A
/// 2. Bridge: comparator registered for the unordered pair {A, E} (A != E)
/// 3. SymmetricExpected: comparator registered for E, if it is symmetric
///
/// The first match wins, so an exact match on the actual type always beats a
/// bridge between two types.
///
/// ## Thread safety
///
/// Lookups take a shared lock, registrations an exclusive one (unless
/// DEEPEQ_THREAD_SAFE_REGISTRY is 0). Lookups return copies, so a
/// comparator replaced mid-comparison never dangles.

#pragma once

#include <deepeq/api.h>
#include <deepeq/deepeq_config.h>
#include <deepeq/value.h>

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deepeq {

/// Equality predicate: true if actual and expected are considered equal.
using ComparatorFn = std::function<bool(const Value& actual, const Value& expected)>;

struct TypeComparator {
    ComparatorFn equals;
    /// Result does not depend on argument order. Only symmetric comparators
    /// are applied when the registered type shows up on the expected side.
    bool symmetric = false;
    /// Shown in explanations of rejected differences.
    std::string description;
};

enum class ResolutionStrategy : uint8_t {
    ExactType,
    Bridge,
    SymmetricExpected
};

[[nodiscard]] DEEPEQ_API std::string_view to_string(ResolutionStrategy strategy) noexcept;

struct ResolvedComparator {
    TypeComparator comparator;
    ResolutionStrategy strategy;
    /// Registered key that matched ("Timestamp", or "Date|Timestamp" for a bridge).
    std::string matched;
};

class DEEPEQ_API ComparatorRegistry
{
public:
    ComparatorRegistry() = default;
    ComparatorRegistry(const ComparatorRegistry& other);
    ComparatorRegistry& operator=(const ComparatorRegistry& other);

    /// Register (or replace) the comparator for an exact type.
    void register_comparator(std::string type, TypeComparator comparator);

    /// Register (or replace) a comparator for an unordered pair of distinct
    /// types. Bridges are symmetric by construction.
    void register_bridge(std::string type1, std::string type2, TypeComparator comparator);

    /// Remove the exact-type comparator. Returns false if none was registered.
    bool unregister(std::string_view type);

    /// Exact-type lookup only.
    [[nodiscard]] std::optional<TypeComparator> lookup(std::string_view type) const;

    /// Full resolution for an (actual type, expected type) node, see file docs.
    [[nodiscard]] std::optional<ResolvedComparator> resolve(std::string_view actual_type,
                                                            std::string_view expected_type) const;

    [[nodiscard]] bool contains(std::string_view type) const;
    [[nodiscard]] bool has_bridge(std::string_view type1, std::string_view type2) const;

    /// Number of exact-type comparators (bridges not included).
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t bridge_count() const;
    [[nodiscard]] bool empty() const;

    /// Registered exact types, sorted.
    [[nodiscard]] std::vector<std::string> registered_types() const;

    void clear();

private:
    using BridgeKey = std::pair<std::string, std::string>;

    static BridgeKey make_bridge_key(std::string_view type1, std::string_view type2);

    mutable std::shared_mutex mutex_;
    std::map<std::string, TypeComparator, std::less<>> by_type_;
    std::map<BridgeKey, TypeComparator> bridges_;
};

} // namespace deepeq
