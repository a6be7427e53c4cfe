#include <gtest/gtest.h>
#include "codegraph/resolver.hpp"
#include <algorithm>

using namespace codegraph;

namespace {

Node function_decl(const std::string &name, uint32_t line) { return Node{name, "", line, FunctionInfo{}}; }

Node class_decl(const std::string &name, uint32_t line, const std::string &extends = "") {
    ClassInfo cls;
    cls.extends = extends;
    return Node{name, "", line, cls};
}

size_t count_edges(const Graph &g, const NodeId &from, const NodeId &to, EdgeType type) {
    return std::count(g.edges().begin(), g.edges().end(), Edge{from, to, type});
}

} // namespace

// ─── Path joining ──────────────────────────────────────────────

TEST(JoinImportPathTest, SiblingAndParentDirectories) {
    EXPECT_EQ(join_import_path("src/b.js", "./a"), "src/a");
    EXPECT_EQ(join_import_path("src/lib/b.js", "../util"), "src/util");
    EXPECT_EQ(join_import_path("b.js", "./lib/"), "lib");
}

// ─── Cross-file linking ────────────────────────────────────────

TEST(ResolverTest, NamedImportAndCallAcrossFiles) {
    ProjectFacts facts;
    facts["a.js"].declarations.push_back(function_decl("foo", 1));
    facts["a.js"].exports.push_back(ExportFact{"foo", "foo", 1});
    facts["b.js"].imports.push_back(ImportFact{"./a", "foo", "foo", 1});
    facts["b.js"].calls.push_back(CallFact{"foo", 2, 0});

    Graph g;
    BuildStats stats = Resolver(g).resolve(facts);

    EXPECT_EQ(stats.node_count, 1);
    EXPECT_EQ(stats.edge_count, 2);
    EXPECT_EQ(count_edges(g, "b.js:2", "a.js:foo:1", EdgeType::Calls), 1);
    EXPECT_EQ(count_edges(g, "b.js:import:1", "a.js:foo:1", EdgeType::Imports), 1);
}

TEST(ResolverTest, ExtendsEdgeBetweenClasses) {
    ProjectFacts facts;
    facts["base.js"].declarations.push_back(class_decl("Base", 1));
    facts["derived.js"].declarations.push_back(class_decl("Derived", 3, "Base"));

    Graph g;
    Resolver(g).resolve(facts);

    ASSERT_EQ(g.num_edges(), 1);
    EXPECT_EQ(g.edges()[0], (Edge{"derived.js:Derived:3", "base.js:Base:1", EdgeType::Extends}));
}

TEST(ResolverTest, UnknownSuperclassIsIgnored) {
    ProjectFacts facts;
    facts["orphan.js"].declarations.push_back(class_decl("Orphan", 1, "Missing"));

    Graph g;
    BuildStats stats;
    EXPECT_NO_THROW(stats = Resolver(g).resolve(facts));
    EXPECT_EQ(stats.node_count, 1);
    EXPECT_EQ(g.num_edges(), 0);
}

TEST(ResolverTest, EveryEdgeTargetIsANode) {
    ProjectFacts facts;
    facts["a.js"].declarations.push_back(function_decl("foo", 1));
    facts["a.js"].declarations.push_back(class_decl("A", 4, "Nowhere"));
    facts["b.js"].imports.push_back(ImportFact{"./a", "bar", "bar", 1});
    facts["b.js"].imports.push_back(ImportFact{"./missing", "x", "x", 2});
    facts["b.js"].imports.push_back(ImportFact{"react", "default", "React", 3});
    facts["b.js"].calls.push_back(CallFact{"foo", 5, 0});
    facts["b.js"].calls.push_back(CallFact{"console.log", 6, 1});

    Graph g;
    Resolver(g).resolve(facts);

    ASSERT_EQ(g.num_edges(), 1);
    for (const auto &edge : g.edges()) {
        EXPECT_TRUE(g.has_node(edge.to)) << edge.to;
    }
}

TEST(ResolverTest, CallLinksEveryFunctionWithThatName) {
    ProjectFacts facts;
    facts["a.js"].declarations.push_back(function_decl("init", 1));
    facts["b.js"].declarations.push_back(function_decl("init", 7));
    facts["c.js"].calls.push_back(CallFact{"init", 3, 0});

    Graph g;
    Resolver(g).resolve(facts);

    EXPECT_EQ(count_edges(g, "c.js:3", "a.js:init:1", EdgeType::Calls), 1);
    EXPECT_EQ(count_edges(g, "c.js:3", "b.js:init:7", EdgeType::Calls), 1);
}

TEST(ResolverTest, CallsToClassesAndVariablesAreNotLinked) {
    ProjectFacts facts;
    facts["a.js"].declarations.push_back(class_decl("Widget", 1));
    facts["a.js"].declarations.push_back(Node{"handler", "", 5, VariableInfo{DeclarationKind::Const}});
    facts["a.js"].calls.push_back(CallFact{"Widget", 9, 0});
    facts["a.js"].calls.push_back(CallFact{"handler", 10, 0});

    Graph g;
    Resolver(g).resolve(facts);
    EXPECT_EQ(g.num_edges(), 0);
}

TEST(ResolverTest, CallsResolveRegardlessOfFileOrder) {
    // "a.js" sorts before "z.js", so the caller is linked before the callee's file is visited
    ProjectFacts facts;
    facts["a.js"].calls.push_back(CallFact{"late", 1, 0});
    facts["z.js"].declarations.push_back(function_decl("late", 2));

    Graph g;
    Resolver(g).resolve(facts);
    EXPECT_EQ(count_edges(g, "a.js:1", "z.js:late:2", EdgeType::Calls), 1);
}

TEST(ResolverTest, DefaultImportLinksEveryDeclarationOfExportingFile) {
    ProjectFacts facts;
    facts["lib.js"].declarations.push_back(class_decl("Foo", 1));
    facts["lib.js"].declarations.push_back(function_decl("helper", 5));
    facts["lib.js"].exports.push_back(ExportFact{"default", "Foo", 9});
    facts["app.js"].imports.push_back(ImportFact{"./lib", "default", "Bar", 1});

    Graph g;
    Resolver(g).resolve(facts);

    EXPECT_EQ(g.num_edges(), 2);
    EXPECT_EQ(count_edges(g, "app.js:import:1", "lib.js:Foo:1", EdgeType::Imports), 1);
    EXPECT_EQ(count_edges(g, "app.js:import:1", "lib.js:helper:5", EdgeType::Imports), 1);
}

TEST(ResolverTest, DefaultImportWithoutDefaultExportMatchesByName) {
    ProjectFacts facts;
    facts["lib.js"].declarations.push_back(function_decl("main", 1));
    facts["lib.js"].declarations.push_back(function_decl("helper", 5));
    facts["lib.js"].exports.push_back(ExportFact{"main", "main", 1});
    facts["app.js"].imports.push_back(ImportFact{"./lib", "default", "main", 1});

    Graph g;
    Resolver(g).resolve(facts);

    ASSERT_EQ(g.num_edges(), 1);
    EXPECT_EQ(count_edges(g, "app.js:import:1", "lib.js:main:1", EdgeType::Imports), 1);
}

TEST(ResolverTest, AnonymousDefaultExportLinksAllDeclarations) {
    ProjectFacts facts;
    facts["lib.js"].declarations.push_back(function_decl("a", 1));
    facts["lib.js"].declarations.push_back(function_decl("b", 2));
    facts["lib.js"].exports.push_back(ExportFact{"default", "", 3});
    facts["app.js"].imports.push_back(ImportFact{"./lib", "default", "lib", 1});

    Graph g;
    Resolver(g).resolve(facts);
    EXPECT_EQ(g.num_edges(), 2);
}

TEST(ResolverTest, ImportTriesSuffixesInOrder) {
    ProjectFacts facts;
    facts["util.ts"].declarations.push_back(function_decl("fmt", 1));
    facts["util/index.js"].declarations.push_back(function_decl("fmt", 1));
    facts["app.js"].imports.push_back(ImportFact{"./util", "fmt", "fmt", 1});

    Graph g;
    Resolver(g).resolve(facts);

    EXPECT_EQ(count_edges(g, "app.js:import:1", "util.ts:fmt:1", EdgeType::Imports), 1);
    EXPECT_EQ(count_edges(g, "app.js:import:1", "util/index.js:fmt:1", EdgeType::Imports), 0);
}

TEST(ResolverTest, DirectoryImportResolvesToIndex) {
    ProjectFacts facts;
    facts["src/components/index.ts"].declarations.push_back(class_decl("Button", 2));
    facts["src/app.ts"].imports.push_back(ImportFact{"./components", "Button", "Button", 1});

    Graph g;
    Resolver(g).resolve(facts);
    EXPECT_EQ(count_edges(g, "src/app.ts:import:1", "src/components/index.ts:Button:2",
                          EdgeType::Imports),
              1);
}

TEST(ResolverTest, PackageImportsAreSkipped) {
    ProjectFacts facts;
    facts["lodash.js"].declarations.push_back(function_decl("map", 1));
    facts["app.js"].imports.push_back(ImportFact{"lodash", "map", "map", 1});

    Graph g;
    Resolver(g).resolve(facts);
    EXPECT_EQ(g.num_edges(), 0);
}

TEST(ResolverTest, NodesTakeTheirFileFromTheFactsKey) {
    ProjectFacts facts;
    facts["src/x.js"].declarations.push_back(function_decl("x", 4));

    Graph g;
    Resolver(g).resolve(facts);

    const Node *n = g.find_node("src/x.js:x:4");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->file, "src/x.js");
    EXPECT_EQ(g.get_file_nodes("src/x.js").size(), 1);
}

TEST(ResolverTest, NameIndexMatchesExhaustiveScan) {
    ProjectFacts facts;
    facts["a.js"].declarations = {function_decl("run", 1), class_decl("Base", 3),
                                  function_decl("stop", 9)};
    facts["b.js"].declarations = {class_decl("Mid", 2, "Base"), function_decl("run", 6)};
    facts["c.js"].declarations = {class_decl("Leaf", 1, "Mid"), class_decl("Odd", 4, "run")};
    facts["c.js"].calls = {CallFact{"run", 5, 0}, CallFact{"stop", 6, 1}, CallFact{"Base", 7, 0}};
    facts["b.js"].calls = {CallFact{"run", 8, 0}};

    Graph g;
    Resolver(g).resolve(facts);

    // Every (file, fact) pair checked against every declaration in the project
    std::vector<Edge> expected;
    for (const auto &[file, file_facts] : facts) {
        for (const auto &call : file_facts.calls) {
            for (const auto &[target_file, target_facts] : facts) {
                for (const auto &decl : target_facts.declarations) {
                    if (decl.kind() == NodeKind::Function && decl.name == call.name) {
                        expected.push_back(Edge{make_call_site_id(file, call.line),
                                                make_node_id(target_file, decl.name, decl.line),
                                                EdgeType::Calls});
                    }
                }
            }
        }
        for (const auto &decl : file_facts.declarations) {
            const auto *cls = std::get_if<ClassInfo>(&decl.details);
            if (!cls || cls->extends.empty())
                continue;
            for (const auto &[target_file, target_facts] : facts) {
                for (const auto &parent : target_facts.declarations) {
                    if (parent.kind() == NodeKind::Class && parent.name == cls->extends) {
                        expected.push_back(Edge{make_node_id(file, decl.name, decl.line),
                                                make_node_id(target_file, parent.name, parent.line),
                                                EdgeType::Extends});
                    }
                }
            }
        }
    }

    ASSERT_EQ(g.num_edges(), expected.size());
    for (const auto &edge : expected) {
        EXPECT_EQ(count_edges(g, edge.from, edge.to, edge.type), 1) << edge.from << " -> " << edge.to;
    }
}
