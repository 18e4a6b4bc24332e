#include "search.hpp"
#include "path_printer.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <gmock/gmock-matchers.h>
#include <optional>
#include <sstream>
#include <string>
#include <vector>


using namespace ::testing;
using namespace path_search;



// ====================
// Helper function
// ====================

// Mock for ISearch
class MockSearch : public ISearch<std::string> {
public:
    MOCK_METHOD(std::optional<Path<std::string>>, execute,
        (const std::string& start, const std::string& goal),
        (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};


WeightedGraph<std::string> chain_graph() {
    WeightedGraph<std::string> graph;
    for (const std::string vertex : {"S", "M", "G"}) {
        graph.add_vertex(vertex);
    }
    graph.add_edge("S", "M", 1.0);
    graph.add_edge("M", "G", 1.0);
    return graph;
}


// ====================
// Test reconstruct_path
// ====================

TEST(ReconstructPathTest, FollowsParentsBackToStart) {
    auto graph = chain_graph();
    std::vector<VertexId> parent{kNoParent, 0, 1};

    auto steps = reconstruct_path(graph, parent, 0, 2);
    EXPECT_THAT(steps, ElementsAre("S", "M", "G"));
}

TEST(ReconstructPathTest, StartEqualsGoal_SingleStep) {
    auto graph = chain_graph();
    std::vector<VertexId> parent(graph.size(), kNoParent);

    auto steps = reconstruct_path(graph, parent, 1, 1);
    EXPECT_THAT(steps, ElementsAre("M"));
}

TEST(ReconstructPathTest, BrokenChain_Throws) {
    auto graph = chain_graph();
    std::vector<VertexId> parent{kNoParent, kNoParent, 1};

    EXPECT_THROW(reconstruct_path(graph, parent, 0, 2), std::runtime_error);
}

TEST(ReconstructPathTest, CyclicChain_Throws) {
    auto graph = chain_graph();
    // G -> M -> G -> ... never reaches S
    std::vector<VertexId> parent{kNoParent, 2, 1};

    EXPECT_THROW(reconstruct_path(graph, parent, 0, 2), std::runtime_error);
}


// ====================
// Test check_endpoint
// ====================

TEST(CheckEndpointTest, KnownVertex_ReturnsId) {
    auto graph = chain_graph();
    EXPECT_EQ(check_endpoint(graph, std::string("G"), "Goal"), 2u);
}

TEST(CheckEndpointTest, UnknownVertex_Throws) {
    auto graph = chain_graph();
    EXPECT_THROW(check_endpoint(graph, std::string("X"), "Start"), std::out_of_range);
}


// ====================
// Test path printing
// ====================

TEST(FormatPathTest, JoinsWithArrow) {
    std::vector<std::string> steps{"A", "B", "D", "E"};
    EXPECT_EQ(format_path(steps), "A -> B -> D -> E");
}

TEST(FormatPathTest, CustomSeparatorAndIntegers) {
    std::vector<int> steps{3, 1, 4};
    EXPECT_EQ(format_path(steps, ","), "3,1,4");
}

TEST(FormatPathTest, SingleAndEmpty) {
    EXPECT_EQ(format_path(std::vector<std::string>{"A"}), "A");
    EXPECT_EQ(format_path(std::vector<std::string>{}), "");
}

TEST(ReportSearchTest, PathFound_WritesSummary) {
    MockSearch search;
    Path<std::string> path{{"A", "C", "E"}, 2.0};

    EXPECT_CALL(search, execute("A", "E")).WillOnce(Return(path));
    EXPECT_CALL(search, name()).WillRepeatedly(Return("BFS"));

    std::ostringstream out;
    auto result = report_search<std::string>(search, "A", "E", out);

    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->steps, ElementsAre("A", "C", "E"));
    EXPECT_EQ(out.str(), "BFS: A -> C -> E (distance 2)\n");
}

TEST(ReportSearchTest, NoPath_WritesNoPath) {
    MockSearch search;

    EXPECT_CALL(search, execute("A", "Z")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(search, name()).WillRepeatedly(Return("Dijkstra"));

    std::ostringstream out;
    auto result = report_search<std::string>(search, "A", "Z", out);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(out.str(), "Dijkstra: no path\n");
}

TEST(ReportSearchTest, SearchError_Propagates) {
    MockSearch search;

    EXPECT_CALL(search, execute(_, _)).WillOnce(Throw(std::out_of_range("Start vertex is not part of the graph")));

    std::ostringstream out;
    EXPECT_THROW(report_search<std::string>(search, "X", "E", out), std::out_of_range);
    EXPECT_TRUE(out.str().empty());
}
