#pragma once

#include "digraph.hpp"
#include "../intervals/interval.hpp"
#include <vector>

namespace wisched {
namespace dag {

using intervals::Interval;

/**
 * Forward-compatibility DAG over a closed interval snapshot.
 * Vertex v is interval v; edge u -> v iff finish(u) <= start(v).
 * Out-edges are stored in increasing target index.
 * Acyclic by construction: a cycle would imply finish(u) <= start(u).
 */
class CompatibilityGraph {
public:
    explicit CompatibilityGraph(std::vector<Interval> intervals);

    const Digraph& graph() const { return graph_; }
    const std::vector<Interval>& intervals() const { return intervals_; }
    const Interval& interval(VertexId vertex) const;

    size_t order() const { return graph_.order(); }
    size_t size() const { return graph_.size(); }

private:
    std::vector<Interval> intervals_;
    Digraph graph_;
};

} // namespace dag
} // namespace wisched
