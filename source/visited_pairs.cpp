// visited_pairs.cpp - VisitedPairSet implementation

#include <deepeq/visited_pairs.h>

namespace deepeq {

bool VisitedPairSet::contains(const Object* actual, const Object* expected) const
{
    return active_.count(Pair{actual, expected}) > 0;
}

bool VisitedPairSet::enter(const Object* actual, const Object* expected)
{
    return active_.insert(Pair{actual, expected}).second;
}

void VisitedPairSet::leave(const Object* actual, const Object* expected)
{
    active_.erase(Pair{actual, expected});
}

} // namespace deepeq
