// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file visited_pairs.h
/// @brief Ancestor tracking for cycle-safe recursion.
///
/// VisitedPairSet holds the (actual, expected) object pairs that are on the
/// active recursion path, not every pair compared so far. A pair is entered
/// when the engine descends into it and left when the engine returns, so a
/// pair found in the set is an ancestor of the current node: the graphs loop
/// back on themselves in lock-step and the comparison can stop there.

#pragma once

#include <deepeq/api.h>

#include <cstddef>
#include <functional>
#include <unordered_set>
#include <utility>

namespace deepeq {

class Object;

class DEEPEQ_API VisitedPairSet
{
public:
    using Pair = std::pair<const Object*, const Object*>;

    /// True if (actual, expected) is an ancestor pair.
    [[nodiscard]] bool contains(const Object* actual, const Object* expected) const;

    /// Mark the pair as being compared. Returns false (and leaves the set
    /// unchanged) if it already was.
    bool enter(const Object* actual, const Object* expected);

    /// Unmark the pair once its subtree is done.
    void leave(const Object* actual, const Object* expected);

    [[nodiscard]] std::size_t size() const noexcept { return active_.size(); }
    [[nodiscard]] bool empty() const noexcept { return active_.empty(); }
    void clear() noexcept { active_.clear(); }

private:
    struct PairHash {
        std::size_t operator()(const Pair& p) const noexcept {
            std::size_t hash = std::hash<const Object*>{}(p.first);
            hash ^= std::hash<const Object*>{}(p.second) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
            return hash;
        }
    };

    std::unordered_set<Pair, PairHash> active_;
};

/// Enters a pair on construction and leaves it on destruction, so the pair
/// is popped whichever way the subtree comparison returns.
class VisitGuard
{
public:
    VisitGuard(VisitedPairSet& set, const Object* actual, const Object* expected)
        : set_(set), actual_(actual), expected_(expected), entered_(set.enter(actual, expected)) {}

    ~VisitGuard() {
        if (entered_) set_.leave(actual_, expected_);
    }

    VisitGuard(const VisitGuard&) = delete;
    VisitGuard& operator=(const VisitGuard&) = delete;

    [[nodiscard]] bool entered() const noexcept { return entered_; }

private:
    VisitedPairSet& set_;
    const Object* actual_;
    const Object* expected_;
    bool entered_;
};

} // namespace deepeq
