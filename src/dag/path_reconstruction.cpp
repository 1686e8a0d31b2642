#include "wisched/dag/path_reconstruction.hpp"
#include "wisched/dag/topological_sort.hpp"
#include "wisched/errors.hpp"
#include <algorithm>

namespace wisched {
namespace dag {

std::vector<VertexId> reconstruct_path(const LongestPaths& paths, VertexId end) {
    const size_t order = paths.predecessor.size();
    if (end >= order) {
        throw std::out_of_range("Path endpoint " + std::to_string(end) + " is out of range");
    }

    std::vector<VertexId> path;
    std::optional<VertexId> current = end;
    while (current) {
        // A predecessor chain longer than the vertex count means a cycle
        if (path.size() == order) {
            throw InternalInvariantViolation("Predecessor links form a cycle");
        }
        path.push_back(*current);
        current = paths.predecessor[*current];
    }

    std::reverse(path.begin(), path.end());
    return path;
}

PathCost compute_max_cost_path(const Digraph& graph) {
    PathCost result;
    if (graph.empty()) {
        return result;
    }

    auto order = kahn_topological_sort(graph);
    auto paths = relax_longest_paths(graph, order);
    VertexId finish = *select_best_endpoint(paths);

    result.path = reconstruct_path(paths, finish);
    result.cost = paths.best_cost[finish];
    return result;
}

} // namespace dag
} // namespace wisched
