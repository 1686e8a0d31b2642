#pragma once

#include "../errors.hpp"
#include <optional>
#include <string>

namespace wisched {
namespace intervals {

struct ValidationIssue {
    ValidationCode code;
    std::string message;
};

struct IntervalResult;

/**
 * Immutable weighted time span [start, finish).
 * Only obtainable through create(), so every instance satisfies
 * start < finish, weight > 0, and all three values finite.
 */
class Interval {
public:
    static IntervalResult create(double start, double finish, double weight);

    double start() const { return start_; }
    double finish() const { return finish_; }
    double weight() const { return weight_; }

    // Compatibility: this interval can be scheduled before other
    bool precedes(const Interval& other) const { return finish_ <= other.start_; }
    bool overlaps(const Interval& other) const {
        return !precedes(other) && !other.precedes(*this);
    }

    bool operator==(const Interval& other) const {
        return start_ == other.start_ && finish_ == other.finish_ && weight_ == other.weight_;
    }
    bool operator!=(const Interval& other) const { return !(*this == other); }

    // "start finish weight", shortest %g form
    std::string to_string() const;

private:
    Interval(double start, double finish, double weight)
        : start_(start), finish_(finish), weight_(weight) {}

    double start_;
    double finish_;
    double weight_;
};

/**
 * Outcome of validated interval construction.
 * Exactly one of value / issue is set.
 */
struct IntervalResult {
    std::optional<Interval> value;
    std::optional<ValidationIssue> issue;

    bool ok() const { return value.has_value(); }
};

} // namespace intervals
} // namespace wisched
