#include <gtest/gtest.h>
#include "codegraph/cache.hpp"
#include <filesystem>
#include <fstream>

using namespace codegraph;
namespace fs = std::filesystem;

class GraphCacheTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("codegraph_cache_") + info->name());
        fs::remove_all(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    static Graph sample_graph() {
        Graph g;
        g.add_node("a.js:foo:1", Node{"foo", "a.js", 1, FunctionInfo{}});
        g.add_node("b.js:Bar:2", Node{"Bar", "b.js", 2, ClassInfo{}});
        g.add_edge("b.js:5", "a.js:foo:1", EdgeType::Calls);
        return g;
    }
};

TEST(ProjectHashTest, IsHexMd5OfPath) {
    EXPECT_EQ(project_hash(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(project_hash("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_NE(project_hash("/a"), project_hash("/a/"));
}

TEST_F(GraphCacheTest, EntryPathNamesHashedFile) {
    GraphCache cache(dir.string());
    EXPECT_EQ(fs::path(cache.entry_path("abc")).filename().string(),
              "graph_900150983cd24fb0d6963f7d28e17f72.json");
}

TEST_F(GraphCacheTest, SaveThenLoad) {
    GraphCache cache(dir.string());
    Graph g = sample_graph();

    std::string path = cache.save(g, "/projects/app");
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(g.metadata().project_path, "/projects/app");
    EXPECT_EQ(g.project_hash(), project_hash("/projects/app"));

    auto loaded = cache.load("/projects/app");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->num_nodes(), 2);
    EXPECT_EQ(loaded->num_edges(), 1);
    EXPECT_EQ(loaded->edges(), g.edges());
    EXPECT_EQ(loaded->metadata().project_path, "/projects/app");
    EXPECT_EQ(loaded->metadata().updated_at, g.metadata().updated_at);
}

TEST_F(GraphCacheTest, SaveReplacesPreviousEntry) {
    GraphCache cache(dir.string());
    Graph first = sample_graph();
    cache.save(first, "/p");

    Graph second;
    cache.save(second, "/p");

    auto loaded = cache.load("/p");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->num_nodes(), 0);
}

TEST_F(GraphCacheTest, LoadMissingReturnsNullopt) {
    GraphCache cache(dir.string());
    EXPECT_FALSE(cache.load("/never/saved").has_value());
}

TEST_F(GraphCacheTest, LoadCorruptThrows) {
    GraphCache cache(dir.string());
    fs::create_directories(dir);
    std::ofstream(cache.entry_path("/p")) << "{ not json";

    EXPECT_THROW(cache.load("/p"), CacheError);
}

TEST_F(GraphCacheTest, RemoveReportsWhetherAnythingWasDeleted) {
    GraphCache cache(dir.string());
    EXPECT_FALSE(cache.remove("/p"));

    Graph g = sample_graph();
    cache.save(g, "/p");
    EXPECT_TRUE(cache.remove("/p"));
    EXPECT_FALSE(cache.load("/p").has_value());
}

TEST_F(GraphCacheTest, RemoveAllDeletesOnlyEntries) {
    GraphCache cache(dir.string());
    EXPECT_EQ(cache.remove_all(), 0);

    Graph a = sample_graph();
    Graph b = sample_graph();
    cache.save(a, "/a");
    cache.save(b, "/b");
    std::ofstream(dir / "notes.txt") << "keep me";

    EXPECT_EQ(cache.remove_all(), 2);
    EXPECT_TRUE(fs::exists(dir / "notes.txt"));
    EXPECT_TRUE(cache.list().empty());
}

TEST_F(GraphCacheTest, ListSummarizesEntries) {
    GraphCache cache(dir.string());
    EXPECT_TRUE(cache.list().empty());

    Graph g = sample_graph();
    std::string path = cache.save(g, "/projects/app");

    auto summaries = cache.list();
    ASSERT_EQ(summaries.size(), 1);
    EXPECT_EQ(summaries[0].file, fs::path(path).filename().string());
    EXPECT_EQ(summaries[0].project_path, "/projects/app");
    EXPECT_EQ(summaries[0].created_at, g.metadata().created_at);
    EXPECT_EQ(summaries[0].updated_at, g.metadata().updated_at);
    EXPECT_EQ(summaries[0].node_count, 2);
    EXPECT_EQ(summaries[0].edge_count, 1);
}

TEST_F(GraphCacheTest, ListSkipsUnreadableEntries) {
    GraphCache cache(dir.string());
    Graph g = sample_graph();
    cache.save(g, "/good");
    std::ofstream(cache.entry_path("/bad")) << "[1, 2";

    auto summaries = cache.list();
    ASSERT_EQ(summaries.size(), 1);
    EXPECT_EQ(summaries[0].project_path, "/good");
}

TEST(CacheSummaryTest, StreamsCountsWithoutBuildingGraph) {
    fs::path file = fs::temp_directory_path() / "codegraph_summary_test.json";
    json doc = {{"edges", json::array({{{"from", "a"}, {"to", "b"}, {"type", "calls"}}})},
                {"fileIndex", json::array()},
                {"metadata",
                 {{"version", "1.0.0"},
                  {"createdAt", "2024-01-01T00:00:00.000Z"},
                  {"updatedAt", "2024-01-02T00:00:00.000Z"},
                  {"projectPath", "/x"}}},
                {"nodes", json::array({{{"id", "n1"}, {"params", json::array({"identifier"})}},
                                       {{"id", "n2"}}})}};
    std::ofstream(file) << doc.dump(2);

    CacheSummary summary = stream_cache_summary(file.string());
    EXPECT_EQ(summary.file, "codegraph_summary_test.json");
    EXPECT_EQ(summary.node_count, 2);
    EXPECT_EQ(summary.edge_count, 1);
    EXPECT_EQ(summary.project_path, "/x");
    EXPECT_EQ(summary.created_at, "2024-01-01T00:00:00.000Z");
    fs::remove(file);
}

TEST(CacheSummaryTest, MissingFileThrows) {
    EXPECT_THROW(stream_cache_summary("/nonexistent/graph_x.json"), std::runtime_error);
}
