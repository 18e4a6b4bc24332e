#ifndef PATH_SEARCH_GRAPH_HPP
#define PATH_SEARCH_GRAPH_HPP

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>


namespace path_search {


using Cost = double;


using VertexId = std::size_t;


//! Edge value used to build and export graphs, not stored by the graph
template <typename T>
struct Edge {
    T source{};
    T destination{};
    Cost weight{};

    bool operator==(const Edge& rhs) const {
        return source == rhs.source && destination == rhs.destination && weight == rhs.weight;
    }
};


//! Outgoing adjacency entry
struct Adjacency {
    VertexId to{};
    Cost weight{};
};


using AdjList = std::vector<Adjacency>;


template <typename T>
class Vertex {
public:
    explicit Vertex(T data) : data_(std::move(data)) {}

    const T& data() const { return data_; }

    const AdjList& adjacent() const { return adj_list_; }

    /// @brief Add an adjacent vertex, an existing entry for the same vertex is overwritten in place
    /// @param to Destination vertex id
    /// @param weight Edge weight
    void add_adjacent(VertexId to, Cost weight) {
        for (auto& entry : adj_list_) {
            if (entry.to == to) {
                entry.weight = weight;
                return;
            }
        }
        adj_list_.push_back({to, weight});
    }

    void clear_adjacent() { adj_list_.clear(); }

private:
    T data_;
    AdjList adj_list_{};
};


//! Path
template <typename T>
struct Path {
    std::vector<T> steps;
    Cost distance{};
};


template <typename T>
class WeightedGraph {
public:
    WeightedGraph() = default;

    /// @brief Graph dimension
    /// @return Numbers of vertices
    std::size_t size() const { return vertices_.size(); }

    bool empty() const { return vertices_.empty(); }

    std::size_t edge_count() const {
        std::size_t count = 0;
        for (const auto& vertex : vertices_) {
            count += vertex.adjacent().size();
        }
        return count;
    }

    /// @brief Insert a vertex keyed by its payload.
    /// A vertex already holding the payload keeps its id and loses its outgoing edges,
    /// edges pointing at it from other vertices stay valid.
    /// @param data Vertex payload
    /// @return Id of the vertex
    VertexId add_vertex(const T& data) {
        auto it = index_.find(data);
        if (it != index_.end()) {
            vertices_[it->second].clear_adjacent();
            return it->second;
        }

        const VertexId id = vertices_.size();
        vertices_.emplace_back(data);
        index_.emplace(data, id);
        return id;
    }

    void add_edge(const T& source, const T& destination, Cost weight) {
        // Validation before any mutation
        if (!std::isfinite(weight)) {
            std::string err = "Edge weight must be finite, got " + std::to_string(weight);
            throw std::invalid_argument(err);
        }
        auto src_it = index_.find(source);
        if (src_it == index_.end()) {
            throw std::invalid_argument("Edge source is not a vertex of the graph");
        }
        auto dst_it = index_.find(destination);
        if (dst_it == index_.end()) {
            throw std::invalid_argument("Edge destination is not a vertex of the graph");
        }

        vertices_[src_it->second].add_adjacent(dst_it->second, weight);
    }

    void add_edge(const Edge<T>& edge) {
        this->add_edge(edge.source, edge.destination, edge.weight);
    }

    bool contains(const T& data) const { return index_.count(data) > 0; }

    VertexId id_of(const T& data) const {
        auto it = index_.find(data);
        if (it == index_.end()) {
            throw std::out_of_range("Payload is not a vertex of the graph");
        }
        return it->second;
    }

    const Vertex<T>& vertex(const VertexId id) const {
        this->check_vertex(id);
        return vertices_[id];
    }

    const AdjList& neighbors(const VertexId id) const {
        return this->vertex(id).adjacent();
    }

    const std::vector<Vertex<T>>& vertices() const { return vertices_; }

    std::optional<Cost> weight(const T& source, const T& destination) const {
        auto src_it = index_.find(source);
        auto dst_it = index_.find(destination);
        if (src_it == index_.end() || dst_it == index_.end()) {
            return {};
        }
        for (const auto& entry : vertices_[src_it->second].adjacent()) {
            if (entry.to == dst_it->second) {
                return entry.weight;
            }
        }
        return {};
    }

    /// @brief Export all edges, ordered by vertex insertion then edge insertion
    std::vector<Edge<T>> edges() const {
        std::vector<Edge<T>> result;
        result.reserve(this->edge_count());
        for (const auto& vertex : vertices_) {
            for (const auto& entry : vertex.adjacent()) {
                result.push_back({vertex.data(), vertices_[entry.to].data(), entry.weight});
            }
        }
        return result;
    }

    bool has_negative_weight() const {
        for (const auto& vertex : vertices_) {
            for (const auto& entry : vertex.adjacent()) {
                if (entry.weight < 0.0) return true;
            }
        }
        return false;
    }

    /// @brief Total weight of a sequence of vertices
    /// @param steps Payloads visited in order
    /// @return Summed weight, nothing if two consecutive steps are not connected
    std::optional<Cost> path_weight(const std::vector<T>& steps) const {
        Cost total = 0.0;
        for (std::size_t i = 1; i < steps.size(); ++i) {
            auto hop = this->weight(steps[i - 1], steps[i]);
            if (!hop) {
                return {};
            }
            total += *hop;
        }
        if (steps.size() == 1 && !this->contains(steps.front())) {
            return {};
        }
        return total;
    }


protected:
    /// @brief Vertex existance validation
    /// @param id Vertex id to validate
    void check_vertex(const VertexId id) const {
        if (id >= this->size()) {
            std::string err = "Vertex: " + std::to_string(id) + " out of range [0.." + std::to_string(size()) + ")";
            throw std::out_of_range(err);
        }
    }


private:
    std::vector<Vertex<T>> vertices_{};
    std::unordered_map<T, VertexId> index_{};
};


}  // namespace path_search


#endif // PATH_SEARCH_GRAPH_HPP
