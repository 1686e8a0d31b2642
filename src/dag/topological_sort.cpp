#include "wisched/dag/topological_sort.hpp"
#include "wisched/errors.hpp"
#include <queue>

namespace wisched {
namespace dag {

std::vector<VertexId> kahn_topological_sort(const Digraph& graph) {
    std::vector<size_t> in_degree = graph.in_degrees();

    std::queue<VertexId> queue;
    for (VertexId root : graph.roots()) {
        queue.push(root);
    }

    std::vector<VertexId> sorted;
    sorted.reserve(graph.order());

    while (!queue.empty()) {
        VertexId src = queue.front();
        queue.pop();
        sorted.push_back(src);

        for (VertexId dest : graph.out_edges(src)) {
            in_degree[dest]--;
            if (in_degree[dest] == 0) {
                queue.push(dest);
            }
        }
    }

    if (sorted.size() != graph.order()) {
        throw InternalInvariantViolation(
            "Topological order covers " + std::to_string(sorted.size()) + " of " +
            std::to_string(graph.order()) + " vertices; graph contains a cycle"
        );
    }

    return sorted;
}

} // namespace dag
} // namespace wisched
