#ifndef PATH_SEARCH_SEARCH_HPP
#define PATH_SEARCH_SEARCH_HPP

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "graph.hpp"


namespace path_search {


/// @brief Parent marker for vertices without predecessor
inline constexpr VertexId kNoParent = static_cast<VertexId>(-1);


struct SearchConfig {
    /// @brief Trace the traversal on std::cout
    bool debug{false};

    /// @brief Refuse to run Dijkstra on graphs holding negative weights
    bool reject_negative_weights{true};
};


template <typename T>
struct ISearch {
    virtual ~ISearch() = default;

    // Shortest path from start to goal (both included), nothing if goal is unreachable.
    // Throws std::out_of_range if start or goal is not a vertex of the graph.
    virtual std::optional<Path<T>> execute(const T& start, const T& goal) = 0;

    virtual std::string name() const = 0;
};


/// @brief Resolve a search endpoint to its vertex id
/// @param graph Graph bound to the search
/// @param data Endpoint payload
/// @param role "Start" or "Goal", used in the error message
template <typename T>
VertexId check_endpoint(const WeightedGraph<T>& graph, const T& data, const std::string& role) {
    if (!graph.contains(data)) {
        std::string err = role + " vertex is not part of the graph (" + std::to_string(graph.size()) + " vertices)";
        std::cerr << err << std::endl;
        throw std::out_of_range(err);
    }
    return graph.id_of(data);
}


/// @brief Walk the parent chain back from goal to start
/// @param graph Graph the parents refer to
/// @param parent Predecessor of each vertex, kNoParent if none
/// @param start Start vertex id
/// @param goal Goal vertex id
/// @return Payloads from start to goal
template <typename T>
std::vector<T> reconstruct_path(const WeightedGraph<T>& graph, const std::vector<VertexId>& parent, VertexId start, VertexId goal) {
    std::vector<T> steps;

    VertexId cur = goal;
    steps.push_back(graph.vertex(cur).data());
    while (cur != start) {
        cur = parent.at(cur);
        if (cur == kNoParent) {
            throw std::runtime_error("Parent chain does not lead back to the start vertex");
        }
        // A simple path never holds more vertices than the graph
        if (steps.size() == graph.size()) {
            throw std::runtime_error("Cycle detected in the parent chain");
        }
        steps.push_back(graph.vertex(cur).data());
    }

    std::reverse(steps.begin(), steps.end());
    return steps;
}


}  // namespace path_search


#endif  // PATH_SEARCH_SEARCH_HPP
