// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "codegraph/query.hpp"
#include <algorithm>

namespace codegraph {

QueryEngine::QueryEngine(const Graph &graph) : graph_(graph) {}

SearchResult QueryEngine::find_symbol(const std::string &query,
                                      std::optional<NodeKind> kind) const {
    SearchResult result;
    result.symbols = graph_.search_nodes(query, kind);
    result.total = result.symbols.size();
    if (result.symbols.size() > MAX_SYMBOL_RESULTS) {
        result.symbols.resize(MAX_SYMBOL_RESULTS);
    }
    return result;
}

std::vector<Connection> QueryEngine::dependencies(const NodeId &id, unsigned depth) const {
    return graph_.get_connections(id, Direction::Outgoing, depth);
}

std::vector<Connection> QueryEngine::dependents(const NodeId &id, unsigned depth) const {
    return graph_.get_connections(id, Direction::Incoming, depth);
}

std::vector<CallGraphEntry> QueryEngine::call_graph(const std::string &function_name,
                                                    unsigned depth) const {
    std::vector<CallGraphEntry> entries;

    auto functions = graph_.search_nodes(function_name, NodeKind::Function);
    if (functions.size() > MAX_CALL_GRAPH_ROOTS) {
        functions.resize(MAX_CALL_GRAPH_ROOTS);
    }

    for (const auto &fn : functions) {
        CallGraphEntry entry;
        entry.id = fn.id;
        entry.node = fn.node;
        for (auto &conn : graph_.get_connections(fn.id, Direction::Both, depth)) {
            if (conn.type == EdgeType::Calls) {
                entry.connections.push_back(std::move(conn));
            }
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<SymbolMatch> QueryEngine::file_symbols(const std::string &file) const {
    std::vector<SymbolMatch> symbols;
    for (const auto &id : graph_.get_file_nodes(file)) {
        if (const Node *node = graph_.find_node(id)) {
            symbols.push_back(SymbolMatch{id, node, 0});
        }
    }

    std::stable_sort(symbols.begin(), symbols.end(), [](const SymbolMatch &a, const SymbolMatch &b) {
        return a.node->line < b.node->line;
    });
    return symbols;
}

GraphStats QueryEngine::stats() const {
    GraphStats stats;
    stats.total_nodes = graph_.num_nodes();
    stats.total_edges = graph_.num_edges();
    stats.file_count = graph_.num_files();

    for (const auto &id : graph_.node_ids()) {
        if (const Node *node = graph_.find_node(id)) {
            stats.node_types[node_kind_to_string(node->kind())]++;
        }
    }
    for (const auto &edge : graph_.edges()) {
        stats.edge_types[edge_type_to_string(edge.type)]++;
    }
    return stats;
}

} // namespace codegraph
