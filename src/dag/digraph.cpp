#include "wisched/dag/digraph.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace wisched {
namespace dag {

VertexId Digraph::add_vertex(double weight) {
    if (!std::isfinite(weight)) {
        throw std::invalid_argument("Vertex weight must be finite");
    }

    adjacency_.emplace_back();
    in_degrees_.push_back(0);
    weights_.push_back(weight);
    return weights_.size() - 1;
}

void Digraph::add_edge(VertexId src, VertexId dest) {
    ensure_exists(src);
    ensure_exists(dest);

    adjacency_[src].push_back(dest);
    in_degrees_[dest]++;
    size_++;
}

double Digraph::weight(VertexId vertex) const {
    ensure_exists(vertex);
    return weights_[vertex];
}

const std::vector<VertexId>& Digraph::out_edges(VertexId vertex) const {
    ensure_exists(vertex);
    return adjacency_[vertex];
}

size_t Digraph::in_degree(VertexId vertex) const {
    ensure_exists(vertex);
    return in_degrees_[vertex];
}

std::vector<VertexId> Digraph::roots() const {
    std::vector<VertexId> result;
    for (VertexId v = 0; v < order(); ++v) {
        if (in_degrees_[v] == 0) {
            result.push_back(v);
        }
    }
    return result;
}

void Digraph::ensure_exists(VertexId vertex) const {
    if (vertex >= order()) {
        throw std::out_of_range(
            "Vertex " + std::to_string(vertex) + " is out of range (order " +
            std::to_string(order()) + ")"
        );
    }
}

std::string Digraph::to_dot() const {
    std::ostringstream oss;
    oss << "digraph DAG {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=box];\n";

    for (VertexId v = 0; v < order(); ++v) {
        oss << "  \"" << v << "\" [label=\"" << v << "\\nw=" << weights_[v] << "\"];\n";
    }

    for (VertexId v = 0; v < order(); ++v) {
        for (VertexId dest : adjacency_[v]) {
            oss << "  \"" << v << "\" -> \"" << dest << "\";\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

void Digraph::print_summary(std::ostream& os) const {
    auto root_list = roots();

    os << "Graph (" << order() << " vertices, " << size() << " edges, "
       << root_list.size() << " roots)\n";
    os << "=========================================\n";

    for (VertexId v = 0; v < order(); ++v) {
        os << v << ". weight " << weights_[v] << ", in-degree " << in_degrees_[v];
        if (!adjacency_[v].empty()) {
            os << "\n   Out: ";
            for (VertexId dest : adjacency_[v]) {
                os << dest << " ";
            }
        }
        os << "\n";
    }
}

} // namespace dag
} // namespace wisched
