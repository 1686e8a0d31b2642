#include "wisched/intervals/interval_store.hpp"
#include <stdexcept>

namespace wisched {
namespace intervals {

const Interval& IntervalStore::add(double start, double finish, double weight) {
    auto result = Interval::create(start, finish, weight);
    if (!result.ok()) {
        const size_t position = intervals_.size();
        throw ValidationError(
            result.issue->code,
            position,
            "interval " + std::to_string(position) + ": " + result.issue->message
        );
    }

    intervals_.push_back(*result.value);
    return intervals_.back();
}

IntervalResult IntervalStore::try_add(double start, double finish, double weight) {
    auto result = Interval::create(start, finish, weight);
    if (result.ok()) {
        intervals_.push_back(*result.value);
    }
    return result;
}

const Interval& IntervalStore::at(size_t index) const {
    if (index >= intervals_.size()) {
        throw std::out_of_range(
            "Interval index " + std::to_string(index) +
            " out of range (store holds " + std::to_string(intervals_.size()) + ")"
        );
    }
    return intervals_[index];
}

} // namespace intervals
} // namespace wisched
