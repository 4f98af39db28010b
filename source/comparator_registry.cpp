// comparator_registry.cpp - ComparatorRegistry implementation

#include <deepeq/comparator_registry.h>

#include <mutex>

namespace deepeq {

namespace {

#if DEEPEQ_THREAD_SAFE_REGISTRY
using SharedLock = std::shared_lock<std::shared_mutex>;
using UniqueLock = std::unique_lock<std::shared_mutex>;
#else
struct NoLock {
    explicit NoLock(std::shared_mutex&) noexcept {}
};
using SharedLock = NoLock;
using UniqueLock = NoLock;
#endif

} // anonymous namespace

std::string_view to_string(ResolutionStrategy strategy) noexcept
{
    switch (strategy) {
        case ResolutionStrategy::ExactType:         return "exact type";
        case ResolutionStrategy::Bridge:            return "bridge";
        case ResolutionStrategy::SymmetricExpected: return "symmetric expected type";
    }
    return "unknown";
}

ComparatorRegistry::ComparatorRegistry(const ComparatorRegistry& other)
{
    SharedLock lock(other.mutex_);
    by_type_ = other.by_type_;
    bridges_ = other.bridges_;
}

ComparatorRegistry& ComparatorRegistry::operator=(const ComparatorRegistry& other)
{
    if (this == &other) {
        return *this;
    }
    // Copy under the source lock first so the two locks are never held together.
    decltype(by_type_) by_type;
    decltype(bridges_) bridges;
    {
        SharedLock lock(other.mutex_);
        by_type = other.by_type_;
        bridges = other.bridges_;
    }
    UniqueLock lock(mutex_);
    by_type_ = std::move(by_type);
    bridges_ = std::move(bridges);
    return *this;
}

ComparatorRegistry::BridgeKey ComparatorRegistry::make_bridge_key(std::string_view type1,
                                                                  std::string_view type2)
{
    if (type2 < type1) {
        std::swap(type1, type2);
    }
    return BridgeKey{std::string{type1}, std::string{type2}};
}

void ComparatorRegistry::register_comparator(std::string type, TypeComparator comparator)
{
    if (!comparator.equals) {
        detail::log_key_error("ComparatorRegistry::register_comparator", type,
                              "registered with an empty comparator, ignoring");
        return;
    }
    if (comparator.description.empty()) {
        comparator.description = "comparator for " + type;
    }
    UniqueLock lock(mutex_);
    by_type_.insert_or_assign(std::move(type), std::move(comparator));
}

void ComparatorRegistry::register_bridge(std::string type1, std::string type2, TypeComparator comparator)
{
    if (!comparator.equals) {
        detail::log_key_error("ComparatorRegistry::register_bridge", type1 + "|" + type2,
                              "registered with an empty comparator, ignoring");
        return;
    }
    if (type1 == type2) {
        // A bridge from a type to itself is an exact-type comparator.
        comparator.symmetric = true;
        register_comparator(std::move(type1), std::move(comparator));
        return;
    }
    comparator.symmetric = true;
    if (comparator.description.empty()) {
        comparator.description = "comparator bridging " + type1 + " and " + type2;
    }
    auto key = make_bridge_key(type1, type2);
    UniqueLock lock(mutex_);
    bridges_.insert_or_assign(std::move(key), std::move(comparator));
}

bool ComparatorRegistry::unregister(std::string_view type)
{
    UniqueLock lock(mutex_);
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return false;
    }
    by_type_.erase(it);
    return true;
}

std::optional<TypeComparator> ComparatorRegistry::lookup(std::string_view type) const
{
    SharedLock lock(mutex_);
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResolvedComparator> ComparatorRegistry::resolve(std::string_view actual_type,
                                                              std::string_view expected_type) const
{
    SharedLock lock(mutex_);

    if (auto it = by_type_.find(actual_type); it != by_type_.end()) {
        return ResolvedComparator{it->second, ResolutionStrategy::ExactType, it->first};
    }

    if (actual_type != expected_type && !bridges_.empty()) {
        auto key = make_bridge_key(actual_type, expected_type);
        if (auto it = bridges_.find(key); it != bridges_.end()) {
            return ResolvedComparator{it->second, ResolutionStrategy::Bridge,
                                      key.first + "|" + key.second};
        }
    }

    if (actual_type != expected_type) {
        if (auto it = by_type_.find(expected_type); it != by_type_.end() && it->second.symmetric) {
            return ResolvedComparator{it->second, ResolutionStrategy::SymmetricExpected, it->first};
        }
    }

    return std::nullopt;
}

bool ComparatorRegistry::contains(std::string_view type) const
{
    SharedLock lock(mutex_);
    return by_type_.find(type) != by_type_.end();
}

bool ComparatorRegistry::has_bridge(std::string_view type1, std::string_view type2) const
{
    SharedLock lock(mutex_);
    return bridges_.count(make_bridge_key(type1, type2)) > 0;
}

std::size_t ComparatorRegistry::size() const
{
    SharedLock lock(mutex_);
    return by_type_.size();
}

std::size_t ComparatorRegistry::bridge_count() const
{
    SharedLock lock(mutex_);
    return bridges_.size();
}

bool ComparatorRegistry::empty() const
{
    SharedLock lock(mutex_);
    return by_type_.empty() && bridges_.empty();
}

std::vector<std::string> ComparatorRegistry::registered_types() const
{
    SharedLock lock(mutex_);
    std::vector<std::string> types;
    types.reserve(by_type_.size());
    for (const auto& [type, comparator] : by_type_) {
        types.push_back(type);
    }
    return types;
}

void ComparatorRegistry::clear()
{
    UniqueLock lock(mutex_);
    by_type_.clear();
    bridges_.clear();
}

} // namespace deepeq
