#pragma once

#include "digraph.hpp"
#include <optional>
#include <vector>

namespace wisched {
namespace dag {

/**
 * Per-vertex relaxation state owned by a single solve
 */
struct LongestPaths {
    std::vector<double> best_cost;                      // heaviest path ending at v
    std::vector<std::optional<VertexId>> predecessor;   // previous vertex on that path
};

/**
 * Vertex-weighted longest paths, visiting vertices in topological order.
 * Every vertex starts as a single-vertex path (cost = own weight), as if
 * reached from a cost-0 super-root. An edge u -> v replaces v's path only
 * when strictly heavier, so the first path to reach a maximum keeps it.
 */
LongestPaths relax_longest_paths(const Digraph& graph, const std::vector<VertexId>& topo_order);

// Vertex with maximum best_cost, smallest index on ties; nullopt if empty
std::optional<VertexId> select_best_endpoint(const LongestPaths& paths);

} // namespace dag
} // namespace wisched
