#pragma once

#include "interval.hpp"
#include <vector>

namespace wisched {
namespace intervals {

/**
 * Ordered collection of accepted intervals.
 * Insertion order is the vertex numbering used by every solve,
 * which makes tie-breaking between equally good schedules reproducible.
 */
class IntervalStore {
public:
    IntervalStore() = default;

    // Validates and appends; throws ValidationError and leaves the
    // store unchanged if the triple is rejected
    const Interval& add(double start, double finish, double weight);

    // Non-throwing variant; appends only when result.ok()
    IntervalResult try_add(double start, double finish, double weight);

    size_t size() const { return intervals_.size(); }
    bool empty() const { return intervals_.empty(); }

    const Interval& operator[](size_t index) const { return intervals_[index]; }
    const Interval& at(size_t index) const;

    const std::vector<Interval>& intervals() const { return intervals_; }

    // Closed copy of the current contents for one solve
    std::vector<Interval> snapshot() const { return intervals_; }

private:
    std::vector<Interval> intervals_;
};

} // namespace intervals
} // namespace wisched
