#pragma once

#include "intervals/interval.hpp"
#include "intervals/interval_store.hpp"
#include <iosfwd>
#include <vector>

namespace wisched {

using intervals::Interval;
using intervals::IntervalStore;

// Caller-supplied interval data, not yet validated
struct Triple {
    double start;
    double finish;
    double weight;
};

/**
 * Maximum-weight set of pairwise non-overlapping intervals, in path
 * (start time) order, with total_cost equal to the sum of their weights.
 */
struct Schedule {
    std::vector<Interval> intervals;
    double total_cost = 0.0;

    size_t size() const { return intervals.size(); }
    bool empty() const { return intervals.empty(); }
};

/**
 * Solves weighted interval scheduling on a snapshot of the store.
 * Each call owns all of its graph and relaxation state, so concurrent
 * or superseded calls never interact. When log is non-null, progress
 * is written to it.
 */
Schedule solve(const IntervalStore& store, std::ostream* log = nullptr);

// Validates every triple first (throws ValidationError on the first bad one)
Schedule solve(const std::vector<Triple>& triples, std::ostream* log = nullptr);

} // namespace wisched
