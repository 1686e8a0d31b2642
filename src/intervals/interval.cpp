#include "wisched/intervals/interval.hpp"
#include <cmath>
#include <cstdio>
#include <sstream>

namespace wisched {
namespace intervals {

namespace {

IntervalResult reject(ValidationCode code, double start, double finish, double weight) {
    std::ostringstream oss;
    oss << to_string(code) << " (got start=" << start
        << ", finish=" << finish << ", weight=" << weight << ")";

    IntervalResult result;
    result.issue = ValidationIssue{code, oss.str()};
    return result;
}

} // namespace

IntervalResult Interval::create(double start, double finish, double weight) {
    // Finiteness first: comparisons against NaN are always false
    if (!std::isfinite(start)) {
        return reject(ValidationCode::NON_FINITE_START, start, finish, weight);
    }
    if (!std::isfinite(finish)) {
        return reject(ValidationCode::NON_FINITE_FINISH, start, finish, weight);
    }
    if (!std::isfinite(weight)) {
        return reject(ValidationCode::NON_FINITE_WEIGHT, start, finish, weight);
    }
    if (!(start < finish)) {
        return reject(ValidationCode::NON_POSITIVE_DURATION, start, finish, weight);
    }
    if (!(weight > 0.0)) {
        return reject(ValidationCode::NON_POSITIVE_WEIGHT, start, finish, weight);
    }

    IntervalResult result;
    result.value = Interval(start, finish, weight);
    return result;
}

std::string Interval::to_string() const {
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "%g %g %g", start_, finish_, weight_);
    return buffer;
}

} // namespace intervals
} // namespace wisched
