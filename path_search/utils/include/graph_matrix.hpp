#ifndef PATH_SEARCH_GRAPH_MATRIX_HPP
#define PATH_SEARCH_GRAPH_MATRIX_HPP

#include <Eigen/Dense>

#include "graph.hpp"


namespace path_search {


/// @brief Dense weight matrix of a graph, indexed by vertex id
/// @param graph Source graph
/// @param no_edge Value for pairs without an edge
/// @return size() x size() matrix, entry (i, j) is the weight of edge i -> j
template <typename T>
Eigen::MatrixXd adjacency_matrix(const WeightedGraph<T>& graph, Cost no_edge = 0.0) {
    const auto n = static_cast<Eigen::Index>(graph.size());
    Eigen::MatrixXd matrix = Eigen::MatrixXd::Constant(n, n, no_edge);
    for (VertexId from = 0; from < graph.size(); ++from) {
        for (const auto& entry : graph.neighbors(from)) {
            matrix(static_cast<Eigen::Index>(from), static_cast<Eigen::Index>(entry.to)) = entry.weight;
        }
    }
    return matrix;
}


}  // namespace path_search


#endif  // PATH_SEARCH_GRAPH_MATRIX_HPP
