#ifndef PATH_SEARCH_DIJKSTRA_HPP
#define PATH_SEARCH_DIJKSTRA_HPP

#include <queue>
#include <vector>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <functional>

#include "graph.hpp"
#include "search.hpp"


namespace path_search {


//! Heap entry, tentative distance of a vertex when it was pushed
struct QueueEntry {
    Cost cost{};
    VertexId vertex{};

    // Required for min-heap (std::greater<>), equal costs go to the first inserted vertex
    bool operator>(const QueueEntry& rhs) const {
        if (cost != rhs.cost) {
            return cost > rhs.cost;
        }
        return vertex > rhs.vertex;
    }
};


// Shortest path by summed edge weight. Weights must be non-negative.
template <typename T>
class Dijkstra : public ISearch<T> {
public:

    explicit Dijkstra(const WeightedGraph<T>& graph, const SearchConfig& config = {});

    // The graph is held by reference and must outlive the search
    Dijkstra(WeightedGraph<T>&& graph, const SearchConfig& config = {}) = delete;

    ~Dijkstra() override = default;

    std::optional<Path<T>> execute(const T& start, const T& goal) override;

    std::string name() const override { return "Dijkstra"; }

private:
    const WeightedGraph<T>& graph_;
    SearchConfig config_;
};


template <typename T>
Dijkstra<T>::Dijkstra(const WeightedGraph<T>& graph, const SearchConfig& config) : graph_(graph), config_(config) {
    if (config_.debug) {
        std::cout << "Dijkstra Algorithm initialization" << std::endl;
        std::cout << "Bound graph with dimension: " << graph_.size() << std::endl;
    }
}


template <typename T>
std::optional<Path<T>> Dijkstra<T>::execute(const T& start, const T& goal) {
    // Check if start and goal vertices are valid
    const VertexId start_id = check_endpoint(graph_, start, "Start");
    const VertexId goal_id = check_endpoint(graph_, goal, "Goal");

    if (config_.reject_negative_weights && graph_.has_negative_weight()) {
        std::string err = "Dijkstra requires non-negative edge weights";
        std::cerr << err << std::endl;
        throw std::invalid_argument(err);
    }

    // Initialize, an empty distance means the vertex has not been reached yet
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> graph_queue{};
    std::vector<std::optional<Cost>> distance(graph_.size());
    std::vector<bool> settled(graph_.size(), false);
    std::vector<VertexId> parent(graph_.size(), kNoParent);

    // Initialize distance of start vertex
    distance[start_id] = 0.0;
    graph_queue.push({0.0, start_id});

    // Loop, stops as soon as no reached vertex is left unsettled
    while (!graph_queue.empty()) {
        // Closest unsettled vertex
        const auto current_entry = graph_queue.top();
        const auto current = current_entry.vertex;
        graph_queue.pop();

        // Stale entry
        if (settled[current] || current_entry.cost > *distance[current]) {
            continue;
        }

        if (current == goal_id) {
            Path<T> path{};
            path.steps = reconstruct_path(graph_, parent, start_id, goal_id);
            path.distance = *distance[goal_id];

            if (config_.debug) {
                std::cout << "Dijkstra found a path of cost " << path.distance << std::endl;
            }
            return path;
        }

        settled[current] = true;

        for (const auto& entry : graph_.neighbors(current)) {
            const auto next = entry.to;
            if (settled[next]) continue;

            const Cost new_cost = *distance[current] + entry.weight;

            // Relax only on strict improvement
            if (distance[next] && new_cost >= *distance[next]) {
                continue;
            }

            // Update cost
            distance[next] = new_cost;

            // Update parent
            parent[next] = current;

            if (config_.debug) {
                std::cout << "Dijkstra relaxed vertex " << next << " to cost " << new_cost << std::endl;
            }

            // Push vertex to queue
            graph_queue.push({new_cost, next});
        }
    }

    // Goal unreachable
    if (config_.debug) {
        std::cout << "Dijkstra settled every reachable vertex, goal unreachable" << std::endl;
    }
    return {};
}


extern template class Dijkstra<std::string>;
extern template class Dijkstra<int>;


}  // namespace path_search


#endif  // PATH_SEARCH_DIJKSTRA_HPP
