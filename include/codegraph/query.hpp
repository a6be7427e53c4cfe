#pragma once

#include "graph.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codegraph {

struct SearchResult {
    size_t total = 0;                 // All matches
    std::vector<SymbolMatch> symbols; // Highest scoring matches, capped
};

struct CallGraphEntry {
    NodeId id;
    const Node *node = nullptr;
    std::vector<Connection> connections; // calls edges only
};

struct GraphStats {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    size_t file_count = 0;
    std::map<std::string, size_t> node_types;
    std::map<std::string, size_t> edge_types;
};

// Read-only queries over one loaded graph
class QueryEngine {
public:

    static constexpr size_t MAX_SYMBOL_RESULTS = 50;
    static constexpr size_t MAX_CALL_GRAPH_ROOTS = 5;

    explicit QueryEngine(const Graph &graph);

    // Search symbols by name or file path
    SearchResult find_symbol(const std::string &query,
                             std::optional<NodeKind> kind = std::nullopt) const;

    // What a symbol uses
    std::vector<Connection> dependencies(const NodeId &id, unsigned depth = 1) const;

    // What uses a symbol
    std::vector<Connection> dependents(const NodeId &id, unsigned depth = 1) const;

    // calls edges around up to five matching functions; empty if none match
    std::vector<CallGraphEntry> call_graph(const std::string &function_name,
                                           unsigned depth = 2) const;

    // Symbols declared in a file, by ascending line
    std::vector<SymbolMatch> file_symbols(const std::string &file) const;

    GraphStats stats() const;

private:

    const Graph &graph_;
};

} // namespace codegraph
