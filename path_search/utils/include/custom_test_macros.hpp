#ifndef PATH_SEARCH_CUSTOM_TEST_MACROS_HPP
#define PATH_SEARCH_CUSTOM_TEST_MACROS_HPP
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <gmock/gmock-matchers.h>
#include <Eigen/Dense>
#include <cmath>
#include <sstream>
#include <vector>

#include "graph.hpp"
#include "graph_matrix.hpp"
#include "path_printer.hpp"


using namespace ::testing;


// ====================
// Helper macros
// ====================

// Weight matrix of the graph must match expected, mismatches are reported by vertex payload
template <typename T>
::testing::AssertionResult AssertAdjacencyNear(
    const path_search::WeightedGraph<T>& graph,
    const Eigen::MatrixXd& expected,
    double tol,
    path_search::Cost no_edge = 0.0)
{
    const Eigen::MatrixXd actual = path_search::adjacency_matrix(graph, no_edge);

    if (actual.rows() != expected.rows() || actual.cols() != expected.cols()) {
        return ::testing::AssertionFailure()
            << "Graph has " << graph.size() << " vertices, expected matrix is "
            << expected.rows() << "x" << expected.cols();
    }

    std::ostringstream oss;
    std::size_t mismatches = 0;
    for (Eigen::Index i = 0; i < actual.rows(); ++i) {
        for (Eigen::Index j = 0; j < actual.cols(); ++j) {
            if (std::abs(actual(i, j) - expected(i, j)) <= tol) continue;

            ++mismatches;
            oss << "  " << graph.vertex(static_cast<path_search::VertexId>(i)).data()
                << " -> " << graph.vertex(static_cast<path_search::VertexId>(j)).data()
                << ": actual " << actual(i, j) << ", expected " << expected(i, j) << "\n";
        }
    }

    if (mismatches == 0) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure()
        << mismatches << " weight(s) differ (tol = " << tol << ")\n" << oss.str();
}


// Path must follow existing edges and its distance must match the summed weight
template <typename T>
::testing::AssertionResult AssertWeightedPath(
    const path_search::WeightedGraph<T>& graph,
    const path_search::Path<T>& path,
    double tol)
{
    auto weight = graph.path_weight(path.steps);
    if (!weight) {
        return ::testing::AssertionFailure()
            << "Path [" << path_search::format_path(path.steps) << "] does not follow the graph edges";
    }
    if (std::abs(*weight - path.distance) > tol) {
        return ::testing::AssertionFailure()
            << "Path [" << path_search::format_path(path.steps) << "] weighs " << *weight
            << " but reports distance " << path.distance;
    }
    return ::testing::AssertionSuccess();
}

// Exhaustive enumeration of the simple paths between two vertices, small graphs only
template <typename T>
void CollectSimplePaths(
    const path_search::WeightedGraph<T>& graph,
    path_search::VertexId current,
    path_search::VertexId goal,
    std::vector<bool>& on_path,
    std::vector<T>& steps,
    std::vector<std::vector<T>>& paths)
{
    steps.push_back(graph.vertex(current).data());
    if (current == goal) {
        paths.push_back(steps);
    } else {
        on_path[current] = true;
        for (const auto& entry : graph.neighbors(current)) {
            if (!on_path[entry.to]) {
                CollectSimplePaths(graph, entry.to, goal, on_path, steps, paths);
            }
        }
        on_path[current] = false;
    }
    steps.pop_back();
}

template <typename T>
std::vector<std::vector<T>> AllSimplePaths(const path_search::WeightedGraph<T>& graph, const T& start, const T& goal) {
    std::vector<bool> on_path(graph.size(), false);
    std::vector<T> steps;
    std::vector<std::vector<T>> paths;
    CollectSimplePaths(graph, graph.id_of(start), graph.id_of(goal), on_path, steps, paths);
    return paths;
}

#define EXPECT_ADJACENCY_NEAR(graph, expected, tol) \
    EXPECT_TRUE(AssertAdjacencyNear((graph), (expected), (tol)))

#define EXPECT_WEIGHTED_PATH(graph, path, tol) \
    EXPECT_TRUE(AssertWeightedPath((graph), (path), (tol)))


#endif // PATH_SEARCH_CUSTOM_TEST_MACROS_HPP
