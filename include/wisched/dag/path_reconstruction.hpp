#pragma once

#include "digraph.hpp"
#include "longest_path.hpp"
#include <vector>

namespace wisched {
namespace dag {

/**
 * A path through a graph, and its cost (sum of vertex weights)
 */
struct PathCost {
    std::vector<VertexId> path;
    double cost = 0.0;
};

// Follows predecessor links back from end; returned in path order
std::vector<VertexId> reconstruct_path(const LongestPaths& paths, VertexId end);

/**
 * Maximum-cost path of an acyclic graph: topological sort, relaxation,
 * endpoint selection and reconstruction. Single-vertex paths count.
 * An empty graph yields an empty path with cost 0.
 */
PathCost compute_max_cost_path(const Digraph& graph);

} // namespace dag
} // namespace wisched
