#ifndef PATH_SEARCH_BFS_HPP
#define PATH_SEARCH_BFS_HPP

#include <queue>
#include <vector>
#include <iostream>
#include <optional>
#include <string>

#include "graph.hpp"
#include "search.hpp"


namespace path_search {


// Shortest path by number of edges, weights are ignored.
// Neighbors are expanded in edge insertion order so ties go to the first discovered path.
template <typename T>
class BreadthFirstSearch : public ISearch<T> {
public:

    explicit BreadthFirstSearch(const WeightedGraph<T>& graph, const SearchConfig& config = {});

    // The graph is held by reference and must outlive the search
    BreadthFirstSearch(WeightedGraph<T>&& graph, const SearchConfig& config = {}) = delete;

    ~BreadthFirstSearch() override = default;

    std::optional<Path<T>> execute(const T& start, const T& goal) override;

    std::string name() const override { return "BFS"; }

private:
    const WeightedGraph<T>& graph_;
    SearchConfig config_;
};


template <typename T>
BreadthFirstSearch<T>::BreadthFirstSearch(const WeightedGraph<T>& graph, const SearchConfig& config) : graph_(graph), config_(config) {
    if (config_.debug) {
        std::cout << "BFS Algorithm initialization" << std::endl;
        std::cout << "Bound graph with dimension: " << graph_.size() << std::endl;
    }
}


template <typename T>
std::optional<Path<T>> BreadthFirstSearch<T>::execute(const T& start, const T& goal) {
    // Check if start and goal vertices are valid
    const VertexId start_id = check_endpoint(graph_, start, "Start");
    const VertexId goal_id = check_endpoint(graph_, goal, "Goal");

    // Initialize
    std::vector<bool> visited(graph_.size(), false);
    std::vector<VertexId> parent(graph_.size(), kNoParent);
    std::queue<VertexId> graph_queue{};

    // Add start vertex
    visited[start_id] = true;
    graph_queue.push(start_id);

    // Loop
    while (!graph_queue.empty()) {

        // Get current vertex from the queue
        const auto current = graph_queue.front();
        graph_queue.pop();

        if (config_.debug) {
            std::cout << "BFS visiting vertex " << current << std::endl;
        }

        // Check if the current vertex is the goal
        if (current == goal_id) {
            Path<T> path{};
            path.steps = reconstruct_path(graph_, parent, start_id, goal_id);
            path.distance = static_cast<Cost>(path.steps.size() - 1);

            if (config_.debug) {
                std::cout << "BFS found a path of " << path.distance << " edges" << std::endl;
            }
            return path;
        }

        for (const auto& entry : graph_.neighbors(current)) {
            // Check if vertex has been visited
            if (visited[entry.to]) continue;

            visited[entry.to] = true;

            // Update parent
            parent[entry.to] = current;

            // Add vertex to graph queue
            graph_queue.push(entry.to);
        }
    }

    // Goal unreachable
    if (config_.debug) {
        std::cout << "BFS exhausted the queue, goal unreachable" << std::endl;
    }
    return {};
}


extern template class BreadthFirstSearch<std::string>;
extern template class BreadthFirstSearch<int>;


}  // namespace path_search


#endif  // PATH_SEARCH_BFS_HPP
