// recursive_comparison_configuration.cpp - RecursiveComparisonConfiguration

#include <deepeq/recursive_comparison_configuration.h>

#include <sstream>

namespace deepeq {

RecursiveComparisonConfiguration&
RecursiveComparisonConfiguration::register_comparator_for_type(std::string type, TypeComparator comparator)
{
    registry_.register_comparator(std::move(type), std::move(comparator));
    return *this;
}

RecursiveComparisonConfiguration&
RecursiveComparisonConfiguration::register_comparator_for_type(std::string type, ComparatorFn fn)
{
    registry_.register_comparator(std::move(type), TypeComparator{std::move(fn), false, {}});
    return *this;
}

RecursiveComparisonConfiguration&
RecursiveComparisonConfiguration::register_symmetric_comparator_for_types(std::string type1,
                                                                          std::string type2,
                                                                          TypeComparator comparator)
{
    registry_.register_bridge(std::move(type1), std::move(type2), std::move(comparator));
    return *this;
}

RecursiveComparisonConfiguration&
RecursiveComparisonConfiguration::register_comparator_for_field(std::string_view path, TypeComparator comparator)
{
    auto normalized = FieldPath::parse(path).to_string();
    if (!comparator.equals) {
        detail::log_key_error("RecursiveComparisonConfiguration::register_comparator_for_field",
                              normalized, "registered with an empty comparator, ignoring");
        return *this;
    }
    if (comparator.description.empty()) {
        comparator.description = "comparator for field " + normalized;
    }
    field_comparators_.insert_or_assign(std::move(normalized), std::move(comparator));
    return *this;
}

const TypeComparator* RecursiveComparisonConfiguration::field_comparator(std::string_view path) const
{
    auto it = field_comparators_.find(path);
    return it != field_comparators_.end() ? &it->second : nullptr;
}

RecursiveComparisonConfiguration& RecursiveComparisonConfiguration::ignore_field(std::string_view path)
{
    ignored_.insert(FieldPath::parse(path).to_string());
    return *this;
}

RecursiveComparisonConfiguration&
RecursiveComparisonConfiguration::ignore_fields(std::initializer_list<std::string_view> paths)
{
    for (auto path : paths) {
        ignore_field(path);
    }
    return *this;
}

bool RecursiveComparisonConfiguration::is_ignored(const FieldPath& path) const
{
    if (ignored_.empty() || path.empty()) {
        return false;
    }
    return ignored_.count(path.to_string()) > 0;
}

std::string RecursiveComparisonConfiguration::describe() const
{
    std::ostringstream oss;
    if (ignore_all_actual_null_fields_) {
        oss << "- all actual null fields were ignored in the comparison\n";
    }
    if (!ignored_.empty()) {
        oss << "- the following fields were ignored in the comparison:";
        bool first = true;
        for (const auto& field : ignored_) {
            oss << (first ? " " : ", ") << field;
            first = false;
        }
        oss << "\n";
    }
    if (strict_type_checking_) {
        oss << "- actual and expected objects and their fields were compared field by field recursively "
               "only if they were of the same type\n";
    }
    auto types = registry_.registered_types();
    if (!types.empty()) {
        oss << "- these types were compared with the following comparators:\n";
        for (const auto& type : types) {
            auto comparator = registry_.lookup(type);
            oss << "  - " << type << " -> "
                << (comparator ? comparator->description : std::string{"<removed>"}) << "\n";
        }
    }
    if (auto bridges = registry_.bridge_count(); bridges > 0) {
        oss << "- " << bridges << " symmetric comparator(s) bridging distinct types were registered\n";
    }
    if (!field_comparators_.empty()) {
        oss << "- these fields were compared with the following comparators:\n";
        for (const auto& [field, comparator] : field_comparators_) {
            oss << "  - " << field << " -> " << comparator.description << "\n";
        }
    }
    return oss.str();
}

} // namespace deepeq
