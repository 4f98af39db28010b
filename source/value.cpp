// value.cpp - Value, Object and ObjectGraph implementations

#include <deepeq/value.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace deepeq {

namespace {

std::string format_double(double v)
{
    std::ostringstream oss;
    oss << v;
    auto s = oss.str();
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
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

std::string value_to_string_impl(const Value& val, bool expand_objects);

std::string object_to_string(const Object& obj, bool expand)
{
    if (!expand) {
        return obj.type_name() + "{...}";
    }
    std::string result = obj.type_name() + "{";
    bool first = true;
    for (const auto& [name, field] : obj.fields()) {
        if (!first) result += ", ";
        first = false;
        result += name + "=" + value_to_string_impl(field, false);
    }
    return result + "}";
}

std::string value_to_string_impl(const Value& val, bool expand_objects)
{
    return std::visit([expand_objects](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(arg);
        } else if constexpr (std::is_same_v<T, Atom>) {
            return arg.type + "(" + value_to_string_impl(*arg.payload, expand_objects) + ")";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            std::string result = "[";
            bool first = true;
            for (const auto& box : arg) {
                if (!first) result += ", ";
                first = false;
                result += value_to_string_impl(*box, expand_objects);
            }
            return result + "]";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::string result = "{";
            bool first = true;
            for (const auto& key : sorted_keys(arg)) {
                if (!first) result += ", ";
                first = false;
                result += key + ": " + value_to_string_impl(*arg[key], expand_objects);
            }
            return result + "}";
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            return object_to_string(*arg, expand_objects);
        } else {
            return "unknown";
        }
    }, val.data);
}

} // anonymous namespace

// ============================================================
// Value
// ============================================================

std::string_view Value::type_name() const noexcept
{
    return std::visit([](const auto& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return type_names::NUL;
        } else if constexpr (std::is_same_v<T, bool>) {
            return type_names::BOOL;
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return type_names::INT32;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return type_names::INT64;
        } else if constexpr (std::is_same_v<T, double>) {
            return type_names::DOUBLE;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return type_names::STRING;
        } else if constexpr (std::is_same_v<T, Atom>) {
            return arg.type;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return type_names::VECTOR;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return type_names::MAP;
        } else {
            return arg->type_name();
        }
    }, data);
}

Value Value::at(const std::string& key) const
{
    if (auto* m = get_if<ValueMap>()) {
        if (auto* found = m->find(key)) return found->get();
    }
    if (auto* obj = as_object()) {
        if (auto* found = obj->find(key)) return *found;
    }
    detail::log_key_error("Value::at", key, "not found or type mismatch");
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) return (*v)[index].get();
    }
    detail::log_index_error("Value::at", index, "out of range or type mismatch");
    return Value{};
}

std::size_t Value::size() const
{
    if (auto* m = get_if<ValueMap>()) return m->size();
    if (auto* v = get_if<ValueVector>()) return v->size();
    if (auto* obj = as_object()) return obj->size();
    return 0;
}

bool operator==(const Value& a, const Value& b)
{
    // NaN equals NaN, so a graph holding NaN still equals a copy of itself.
    // Containers and atom payloads reach this through ValueBox equality.
    if (auto* x = a.get_if<double>()) {
        auto* y = b.get_if<double>();
        return y && (*x == *y || (std::isnan(*x) && std::isnan(*y)));
    }
    return a.data == b.data;
}

// ============================================================
// Object
// ============================================================

Object& Object::set(std::string_view name, Value value)
{
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [name](const Field& f) { return f.first == name; });
    if (it != fields_.end()) {
        it->second = std::move(value);
    } else {
        fields_.emplace_back(std::string{name}, std::move(value));
    }
    return *this;
}

const Value* Object::find(std::string_view name) const
{
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [name](const Field& f) { return f.first == name; });
    return it != fields_.end() ? &it->second : nullptr;
}

Value Object::get(std::string_view name) const
{
    if (auto* found = find(name)) {
        return *found;
    }
    detail::log_key_error("Object::get", name, "is not a field of " + type_);
    return Value{};
}

// ============================================================
// ObjectGraph
// ============================================================

Object& ObjectGraph::make(std::string type_name)
{
    if (is_builtin_type_name(type_name)) {
        throw std::invalid_argument("object type name '" + type_name + "' is reserved for a built-in type");
    }
    objects_.push_back(std::make_unique<Object>(std::move(type_name)));
    return *objects_.back();
}

// ============================================================
// Utility functions
// ============================================================

std::string value_to_string(const Value& val)
{
    return value_to_string_impl(val, true);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::string indent(depth * 2, ' ');

    if (auto* m = val.get_if<ValueMap>()) {
        std::cout << indent << prefix << "{\n";
        for (const auto& key : sorted_keys(*m)) {
            print_value(*(*m)[key], key + ": ", depth + 1);
        }
        std::cout << indent << "}\n";
    } else if (auto* v = val.get_if<ValueVector>()) {
        std::cout << indent << prefix << "[\n";
        for (std::size_t i = 0; i < v->size(); ++i) {
            print_value(*(*v)[i], "[" + std::to_string(i) + "] ", depth + 1);
        }
        std::cout << indent << "]\n";
    } else {
        std::cout << indent << prefix << value_to_string(val) << "\n";
    }
}

} // namespace deepeq
