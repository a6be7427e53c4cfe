#include <gtest/gtest.h>
#include "codegraph/query.hpp"

using namespace codegraph;

static Node function_node(const std::string &name, const std::string &file, uint32_t line) {
    return Node{name, file, line, FunctionInfo{}};
}

// A small project: app.js calls util.js and main -> helper inside app.js
class QueryEngineTest : public ::testing::Test {
protected:
    Graph g;

    void SetUp() override {
        g.add_node("util.js:format:1", function_node("format", "util.js", 1));
        g.add_node("util.js:Formatter:10", Node{"Formatter", "util.js", 10, ClassInfo{}});
        g.add_node("app.js:main:1", function_node("main", "app.js", 1));
        g.add_node("app.js:helper:8", function_node("helper", "app.js", 8));
        g.add_node("app.js:config:20", Node{"config", "app.js", 20, VariableInfo{}});

        g.add_edge("app.js:import:1", "util.js:format:1", EdgeType::Imports);
        g.add_edge("app.js:3", "util.js:format:1", EdgeType::Calls);
        g.add_edge("app.js:4", "app.js:helper:8", EdgeType::Calls);
        g.add_edge("app.js:helper:8", "util.js:format:1", EdgeType::Calls);
    }
};

TEST_F(QueryEngineTest, FindSymbolMatchesNamesIgnoringCase) {
    QueryEngine q(g);
    SearchResult result = q.find_symbol("format");

    EXPECT_EQ(result.total, 2);
    ASSERT_EQ(result.symbols.size(), 2);
    EXPECT_EQ(result.symbols[0].id, "util.js:format:1");
    EXPECT_EQ(result.symbols[1].id, "util.js:Formatter:10");
}

TEST_F(QueryEngineTest, FindSymbolByKind) {
    QueryEngine q(g);
    SearchResult result = q.find_symbol("format", NodeKind::Class);
    ASSERT_EQ(result.symbols.size(), 1);
    EXPECT_EQ(result.symbols[0].node->name, "Formatter");
}

TEST_F(QueryEngineTest, FindSymbolMatchesFilePath) {
    QueryEngine q(g);
    SearchResult result = q.find_symbol("APP.JS");
    EXPECT_EQ(result.total, 3);
    for (const auto &s : result.symbols) {
        EXPECT_EQ(s.score, 1);
    }
}

TEST(QueryEngineLimitsTest, FindSymbolCapsResultsAtFifty) {
    Graph g;
    for (uint32_t i = 1; i <= 60; ++i) {
        g.add_node("a.js:handler" + std::to_string(i) + ":" + std::to_string(i),
                   function_node("handler" + std::to_string(i), "a.js", i));
    }

    SearchResult result = QueryEngine(g).find_symbol("handler");
    EXPECT_EQ(result.total, 60);
    EXPECT_EQ(result.symbols.size(), QueryEngine::MAX_SYMBOL_RESULTS);
    EXPECT_EQ(result.symbols.front().node->name, "handler1");
}

TEST_F(QueryEngineTest, DependenciesFollowOutgoingEdges) {
    QueryEngine q(g);
    auto deps = q.dependencies("app.js:helper:8");
    ASSERT_EQ(deps.size(), 1);
    EXPECT_EQ(deps[0].to, "util.js:format:1");
    EXPECT_EQ(deps[0].type, EdgeType::Calls);
}

TEST_F(QueryEngineTest, DependentsFollowIncomingEdges) {
    QueryEngine q(g);
    auto direct = q.dependents("util.js:format:1");
    EXPECT_EQ(direct.size(), 3);

    // helper is reached at hop 1, its own caller at hop 2
    auto two_hops = q.dependents("util.js:format:1", 2);
    EXPECT_EQ(two_hops.size(), 4);
}

TEST_F(QueryEngineTest, UnknownSymbolHasNoDependencies) {
    QueryEngine q(g);
    EXPECT_TRUE(q.dependencies("nowhere.js:x:1").empty());
    EXPECT_TRUE(q.dependents("nowhere.js:x:1").empty());
}

TEST_F(QueryEngineTest, CallGraphKeepsOnlyCallEdges) {
    QueryEngine q(g);
    auto entries = q.call_graph("format");

    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].id, "util.js:format:1");
    ASSERT_FALSE(entries[0].connections.empty());
    for (const auto &conn : entries[0].connections) {
        EXPECT_EQ(conn.type, EdgeType::Calls);
    }
}

TEST_F(QueryEngineTest, CallGraphForUnknownFunctionIsEmpty) {
    QueryEngine q(g);
    EXPECT_TRUE(q.call_graph("doesNotExist").empty());
    // Classes and variables are never roots
    EXPECT_TRUE(q.call_graph("config").empty());
}

TEST(QueryEngineLimitsTest, CallGraphUsesAtMostFiveRoots) {
    Graph g;
    for (uint32_t i = 1; i <= 8; ++i) {
        g.add_node("a.js:run" + std::to_string(i) + ":" + std::to_string(i),
                   function_node("run" + std::to_string(i), "a.js", i));
    }
    EXPECT_EQ(QueryEngine(g).call_graph("run").size(), QueryEngine::MAX_CALL_GRAPH_ROOTS);
}

TEST(QueryEngineFileTest, FileSymbolsSortedByLine) {
    Graph g;
    g.add_node("m.js:c:30", function_node("c", "m.js", 30));
    g.add_node("m.js:a:3", Node{"a", "m.js", 3, VariableInfo{DeclarationKind::Const}});
    g.add_node("m.js:b:12", Node{"b", "m.js", 12, ClassInfo{}});
    g.add_node("other.js:z:1", function_node("z", "other.js", 1));

    auto symbols = QueryEngine(g).file_symbols("m.js");
    ASSERT_EQ(symbols.size(), 3);
    EXPECT_EQ(symbols[0].node->line, 3);
    EXPECT_EQ(symbols[1].node->line, 12);
    EXPECT_EQ(symbols[2].node->line, 30);
}

TEST_F(QueryEngineTest, FileSymbolsOfUnknownFileIsEmpty) {
    EXPECT_TRUE(QueryEngine(g).file_symbols("missing.js").empty());
}

TEST_F(QueryEngineTest, StatsCountKindsAndEdgeTypes) {
    GraphStats stats = QueryEngine(g).stats();

    EXPECT_EQ(stats.total_nodes, 5);
    EXPECT_EQ(stats.total_edges, 4);
    EXPECT_EQ(stats.file_count, 2);
    EXPECT_EQ(stats.node_types.at("function"), 3);
    EXPECT_EQ(stats.node_types.at("class"), 1);
    EXPECT_EQ(stats.node_types.at("variable"), 1);
    EXPECT_EQ(stats.edge_types.at("calls"), 3);
    EXPECT_EQ(stats.edge_types.at("imports"), 1);
    EXPECT_EQ(stats.edge_types.count("extends"), 0);
}
