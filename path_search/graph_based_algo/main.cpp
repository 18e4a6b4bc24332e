#include <bfs.hpp>
#include <dijkstra.hpp>
#include <graph.hpp>
#include <graph_matrix.hpp>
#include <path_printer.hpp>

#include <iostream>
#include <stdexcept>
#include <string>


using namespace path_search;


WeightedGraph<std::string> example_graph() {
    // A ─1─> B ─5─> D ─1─> E
    // │      │      ^      ^
    // 4      2      3      │
    // v      v      │      │
    // C <────┘      │      │
    // ├─────────────┘      │
    // └────────6───────────┘

    WeightedGraph<std::string> graph;
    for (const std::string vertex : {"A", "B", "C", "D", "E"}) {
        graph.add_vertex(vertex);
    }

    graph.add_edge("A", "B", 1.0);
    graph.add_edge("A", "C", 4.0);
    graph.add_edge("B", "C", 2.0);
    graph.add_edge("B", "D", 5.0);
    graph.add_edge("C", "D", 3.0);
    graph.add_edge("C", "E", 6.0);
    graph.add_edge("D", "E", 1.0);

    return graph;
}



int main() {
    WeightedGraph<std::string> graph = example_graph();

    const std::string start = "A";
    const std::string goal = "E";

    std::cout << "Weight matrix (rows A..E):" << std::endl;
    std::cout << adjacency_matrix(graph) << std::endl;

    BreadthFirstSearch<std::string> bfs(graph);
    Dijkstra<std::string> dijkstra(graph);

    try {
        report_search<std::string>(bfs, start, goal);
        report_search<std::string>(dijkstra, start, goal);
    } catch (const std::exception& e) {
        std::cerr << "Search failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
