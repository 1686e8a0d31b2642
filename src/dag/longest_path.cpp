#include "wisched/dag/longest_path.hpp"
#include "wisched/errors.hpp"

namespace wisched {
namespace dag {

LongestPaths relax_longest_paths(const Digraph& graph, const std::vector<VertexId>& topo_order) {
    if (topo_order.size() != graph.order()) {
        throw InternalInvariantViolation(
            "Relaxation order has " + std::to_string(topo_order.size()) +
            " vertices, graph has " + std::to_string(graph.order())
        );
    }

    LongestPaths paths;
    paths.best_cost = graph.weights();
    paths.predecessor.assign(graph.order(), std::nullopt);

    for (VertexId src : topo_order) {
        for (VertexId dest : graph.out_edges(src)) {
            double new_cost = paths.best_cost[src] + graph.weights()[dest];
            if (new_cost > paths.best_cost[dest]) {
                paths.best_cost[dest] = new_cost;
                paths.predecessor[dest] = src;
            }
        }
    }

    return paths;
}

std::optional<VertexId> select_best_endpoint(const LongestPaths& paths) {
    if (paths.best_cost.empty()) {
        return std::nullopt;
    }

    VertexId best = 0;
    for (VertexId v = 1; v < paths.best_cost.size(); ++v) {
        if (paths.best_cost[v] > paths.best_cost[best]) {
            best = v;
        }
    }
    return best;
}

} // namespace dag
} // namespace wisched
