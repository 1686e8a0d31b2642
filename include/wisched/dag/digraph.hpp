#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace wisched {
namespace dag {

using VertexId = size_t;

/**
 * Vertex-weighted directed graph over dense integer vertices
 * numbered 0..order()-1 in the order they were added.
 * Adjacency, in-degrees and weights are flat arrays indexed by vertex.
 */
class Digraph {
public:
    Digraph() = default;

    // Graph construction
    VertexId add_vertex(double weight);
    void add_edge(VertexId src, VertexId dest);

    // Structure
    size_t order() const { return weights_.size(); }   // vertex count
    size_t size() const { return size_; }              // edge count
    bool empty() const { return weights_.empty(); }

    double weight(VertexId vertex) const;
    const std::vector<double>& weights() const { return weights_; }
    const std::vector<VertexId>& out_edges(VertexId vertex) const;
    size_t in_degree(VertexId vertex) const;
    const std::vector<size_t>& in_degrees() const { return in_degrees_; }

    // Vertices with no incoming edge, increasing index
    std::vector<VertexId> roots() const;

    // Debugging
    std::string to_dot() const;
    void print_summary(std::ostream& os = std::cout) const;

private:
    std::vector<std::vector<VertexId>> adjacency_;
    std::vector<size_t> in_degrees_;
    std::vector<double> weights_;
    size_t size_ = 0;

    void ensure_exists(VertexId vertex) const;
};

} // namespace dag
} // namespace wisched
