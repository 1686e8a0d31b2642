#include "wisched/dag/compatibility_graph.hpp"
#include <stdexcept>
#include <utility>

namespace wisched {
namespace dag {

CompatibilityGraph::CompatibilityGraph(std::vector<Interval> intervals)
    : intervals_(std::move(intervals)) {
    const size_t n = intervals_.size();

    for (const auto& interval : intervals_) {
        graph_.add_vertex(interval.weight());
    }

    // O(n^2) pairs; inner loop order gives sorted out-edges
    for (VertexId u = 0; u < n; ++u) {
        for (VertexId v = 0; v < n; ++v) {
            if (u != v && intervals_[u].precedes(intervals_[v])) {
                graph_.add_edge(u, v);
            }
        }
    }
}

const Interval& CompatibilityGraph::interval(VertexId vertex) const {
    if (vertex >= intervals_.size()) {
        throw std::out_of_range("Vertex " + std::to_string(vertex) + " has no interval");
    }
    return intervals_[vertex];
}

} // namespace dag
} // namespace wisched
