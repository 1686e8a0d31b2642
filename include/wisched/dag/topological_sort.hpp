#pragma once

#include "digraph.hpp"
#include <vector>

namespace wisched {
namespace dag {

/**
 * Kahn's algorithm with a FIFO queue.
 * Roots are enqueued in increasing index; a vertex is enqueued when its
 * remaining in-degree reaches zero, in the order out-edges are visited.
 *
 * Throws InternalInvariantViolation if the order omits a vertex (the
 * graph has a cycle).
 */
std::vector<VertexId> kahn_topological_sort(const Digraph& graph);

} // namespace dag
} // namespace wisched
