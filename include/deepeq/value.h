// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic Value type describing the object graphs deepeq compares.
///
/// This file defines the core Value type that can represent:
/// - Primitive types: bool, int32, int64, double, string
/// - Atoms: named leaf types with a scalar payload (e.g. Date, Timestamp)
/// - Container types: map and vector (using immer's immutable containers)
/// - Object references: identity-bearing records owned by an ObjectGraph
/// - Null (std::monostate), the representation of "absent"
///
/// Immutable containers can never contain themselves, so every cycle in a
/// Value graph passes through an Object. Objects are mutable records whose
/// fields may point back at any object of the same ObjectGraph.
///
/// ## Usage Example
/// ```cpp
/// ObjectGraph graph;
/// Object& john = graph.make("Person");
/// john.set("name", "John")
///     .set("dateOfBirth", Value::atom("Date", int64_t{123}))
///     .set("neighbour", john);             // self reference
///
/// Value root{john};
/// root.at("name");                          // "John"
/// root.type_name();                         // "Person"
/// ```

#pragma once

#include <deepeq/deepeq_config.h>
#include <deepeq/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace deepeq {

namespace detail {

inline void log_message(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPEQ_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPEQ_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPEQ_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

// Forward declarations
struct Value;
class Object;

/// Values may be shared by concurrently running comparisons, so the
/// containers use immer's default (thread-safe) memory policy.
using memory_policy = immer::default_memory_policy;

using ValueBox    = immer::box<Value, memory_policy>;
using ValueMap    = immer::map<std::string,
                               ValueBox,
                               std::hash<std::string>,
                               std::equal_to<std::string>,
                               memory_policy>;
using ValueVector = immer::vector<ValueBox, memory_policy>;

/// Non-owning reference to a record node. The ObjectGraph owns the node.
using ObjectRef = Object*;

/// Stable names of the built-in runtime types (see Value::type_name()).
namespace type_names {
    inline constexpr std::string_view NUL     = "null";
    inline constexpr std::string_view BOOL    = "bool";
    inline constexpr std::string_view INT32   = "int32";
    inline constexpr std::string_view INT64   = "int64";
    inline constexpr std::string_view DOUBLE  = "double";
    inline constexpr std::string_view STRING  = "string";
    inline constexpr std::string_view VECTOR  = "vector";
    inline constexpr std::string_view MAP     = "map";
}

/// True for the names in type_names. Atoms and objects may not use them,
/// otherwise a comparator registered for e.g. "map" would also match them.
[[nodiscard]] inline bool is_builtin_type_name(std::string_view name) noexcept
{
    return name == type_names::NUL || name == type_names::BOOL ||
           name == type_names::INT32 || name == type_names::INT64 ||
           name == type_names::DOUBLE || name == type_names::STRING ||
           name == type_names::VECTOR || name == type_names::MAP;
}

/// @brief Named atomic leaf: a value of a user type with no decomposable
/// structure (Date, Timestamp, Money, ...).
///
/// Two atoms are naturally equal only when both the type name and the
/// payload are equal, so a `Date` never equals a `Timestamp` unless a
/// comparator bridging the two has been registered.
struct Atom {
    std::string type;
    ValueBox payload;

    bool operator==(const Atom& other) const;
    bool operator!=(const Atom& other) const { return !(*this == other); }
};

struct DEEPEQ_API Value
{
    using Data = std::variant<std::monostate,
                              bool,
                              int32_t,
                              int64_t,
                              double,
                              std::string,
                              Atom,
                              ValueVector,
                              ValueMap,
                              ObjectRef>;

    Data data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int32_t v) noexcept : data(v) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(Atom v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(Object& obj) noexcept : data(ObjectRef{&obj}) {}
    Value(ObjectRef obj) noexcept : data(std::monostate{}) {
        if (obj) data = obj;
    }

    // Factory functions
    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    /// @throws std::invalid_argument if `type` is a built-in type name
    static Value atom(std::string type, Value payload) {
        if (is_builtin_type_name(type)) {
            throw std::invalid_argument("atom type name '" + type + "' is reserved for a built-in type");
        }
        return Value{Atom{std::move(type), ValueBox{std::move(payload)}}};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<ObjectRef>(data); }
    [[nodiscard]] bool is_atom() const noexcept { return is<Atom>(); }

    /// Vectors, maps and objects can be descended into; everything else is a leaf.
    [[nodiscard]] bool is_structured() const noexcept {
        return is<ValueVector>() || is<ValueMap>() || is_object();
    }

    [[nodiscard]] Object* as_object() const noexcept {
        if (auto* p = get_if<ObjectRef>()) return *p;
        return nullptr;
    }

    /// Runtime type name used as the comparator registry key: a built-in
    /// name from type_names, an atom's type or an object's type.
    /// The view stays valid as long as this value (or the object) lives.
    [[nodiscard]] std::string_view type_name() const noexcept;

    /// Map entry, or object field. Null if missing or not keyed.
    [[nodiscard]] Value at(const std::string& key) const;

    /// Vector element. Null if out of range or not a vector.
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] Value at_or(const std::string& key, Value default_val) const {
        auto result = at(key);
        return result.is_null() ? std::move(default_val) : std::move(result);
    }

    template <typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* ptr = get_if<T>()) return *ptr;
        return default_val;
    }

    [[nodiscard]] int32_t as_int(int32_t default_val = 0) const {
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    /// Numeric view of int32/int64/double values, and of atoms wrapping one.
    [[nodiscard]] std::optional<double> as_number() const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
        if (auto* a = get_if<Atom>()) return a->payload->as_number();
        return std::nullopt;
    }

    /// Payload of an atom, or the value itself for anything else.
    [[nodiscard]] const Value& unwrap_atom() const {
        if (auto* a = get_if<Atom>()) return *a->payload;
        return *this;
    }

    [[nodiscard]] ValueVector as_vector(ValueVector default_val = {}) const {
        if (auto* p = get_if<ValueVector>()) return *p;
        return default_val;
    }

    [[nodiscard]] ValueMap as_map(ValueMap default_val = {}) const {
        if (auto* p = get_if<ValueMap>()) return *p;
        return default_val;
    }

    /// Number of elements, entries or fields; 0 for leaves.
    [[nodiscard]] std::size_t size() const;

    using size_type = std::size_t;
};

/// Natural equality: same alternative and equal contents. Objects are
/// compared by identity, containers element-wise.
DEEPEQ_API bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

inline bool Atom::operator==(const Atom& other) const
{
    return type == other.type && *payload == *other.payload;
}

// ============================================================
// Object - mutable record node with identity
// ============================================================

/// @brief Record with a runtime type name and ordered, named fields.
///
/// Field order is declaration order: the first set() of a name appends the
/// field, later set() calls overwrite it in place. Objects are created by an
/// ObjectGraph and referenced by address, so they can form cycles.
class DEEPEQ_API Object
{
public:
    using Field = std::pair<std::string, Value>;

    explicit Object(std::string type_name) : type_(std::move(type_name)) {}

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    [[nodiscard]] const std::string& type_name() const noexcept { return type_; }

    /// Set (or overwrite) a field; returns *this for chaining.
    Object& set(std::string_view name, Value value);

    /// Pointer to the field's value, or nullptr if the object has no such field.
    [[nodiscard]] const Value* find(std::string_view name) const;

    /// Field value, or null Value if missing (logged in verbose builds).
    [[nodiscard]] Value get(std::string_view name) const;

    [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

private:
    std::string type_;
    std::vector<Field> fields_;
};

// ============================================================
// ObjectGraph - owner of Object nodes
// ============================================================

/// @brief Arena owning the objects of one or more related graphs.
///
/// Objects keep a stable address for the whole lifetime of the graph, which
/// is what makes identity comparison and back-references safe. Values that
/// reference objects must not outlive the graph that created them.
class DEEPEQ_API ObjectGraph
{
public:
    ObjectGraph() = default;
    ObjectGraph(ObjectGraph&&) noexcept = default;
    ObjectGraph& operator=(ObjectGraph&&) noexcept = default;

    ObjectGraph(const ObjectGraph&) = delete;
    ObjectGraph& operator=(const ObjectGraph&) = delete;

    /// Create a new empty object of the given type.
    /// @throws std::invalid_argument if `type_name` is a built-in type name
    Object& make(std::string type_name);

    [[nodiscard]] std::size_t size() const noexcept { return objects_.size(); }
    [[nodiscard]] bool empty() const noexcept { return objects_.empty(); }

private:
    std::vector<std::unique_ptr<Object>> objects_;
};

// ============================================================
// Utility functions
// ============================================================

/// Convert Value to a human-readable, single-line string. Objects are
/// rendered one level deep, so cyclic graphs print finitely.
[[nodiscard]] DEEPEQ_API std::string value_to_string(const Value& val);

/// Print Value with indentation
DEEPEQ_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace deepeq
