// difference_collector.cpp - ComparisonDifference and DifferenceCollector

#include <deepeq/difference_collector.h>

#include <algorithm>
#include <iostream>
#include <sstream>

namespace deepeq {

// ============================================================
// ComparisonDifference
// ============================================================

std::string_view to_string(ComparisonDifference::Kind kind) noexcept
{
    switch (kind) {
        case ComparisonDifference::Kind::ValueMismatch:      return "value mismatch";
        case ComparisonDifference::Kind::NullnessMismatch:   return "nullness mismatch";
        case ComparisonDifference::Kind::ShapeMismatch:      return "shape mismatch";
        case ComparisonDifference::Kind::ComparatorRejected: return "comparator rejected";
    }
    return "unknown";
}

std::string ComparisonDifference::to_string() const
{
    const auto path = path_.to_string();
    std::string result = path.empty() ? std::string{"top-level values differ"}
                                      : "field/property '" + path + "' differ";
    result += ": actual=" + value_to_string(actual()) +
              ", expected=" + value_to_string(expected());
    result += " [" + std::string{deepeq::to_string(kind_)} + "]";
    if (explanation_) {
        result += " (" + *explanation_ + ")";
    }
    return result;
}

bool ComparisonDifference::operator==(const ComparisonDifference& other) const
{
    return kind_ == other.kind_ &&
           path_ == other.path_ &&
           actual() == other.actual() &&
           expected() == other.expected() &&
           explanation_ == other.explanation_;
}

// ============================================================
// DifferenceCollector
// ============================================================

void DifferenceCollector::add(ComparisonDifference difference)
{
    differences_.push_back(std::move(difference));
}

const ComparisonDifference* DifferenceCollector::find(const FieldPath& path) const
{
    return find(path.to_string());
}

const ComparisonDifference* DifferenceCollector::find(std::string_view path) const
{
    auto it = std::find_if(differences_.begin(), differences_.end(),
                           [&](const ComparisonDifference& d) { return d.path_string() == path; });
    return it != differences_.end() ? &*it : nullptr;
}

std::vector<std::string> DifferenceCollector::paths() const
{
    std::vector<std::string> result;
    result.reserve(differences_.size());
    for (const auto& d : differences_) {
        result.push_back(d.path_string());
    }
    return result;
}

void DifferenceCollector::print(std::ostream& os) const
{
    if (differences_.empty()) {
        os << "  (no differences)\n";
        return;
    }
    for (const auto& d : differences_) {
        os << "  " << d.to_string() << "\n";
    }
}

void DifferenceCollector::print() const
{
    print(std::cout);
}

std::string DifferenceCollector::to_string() const
{
    std::ostringstream oss;
    print(oss);
    return oss.str();
}

} // namespace deepeq
