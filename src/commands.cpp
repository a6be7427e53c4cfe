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

#include "codegraph/commands.hpp"
#include <iostream>

namespace codegraph {

static void print_json(const json &j) { std::cout << j.dump(2) << std::endl; }

bool load_project(Workspace &ws, const std::string &project_path) {
    LoadResult result = ws.load_cached(project_path);
    if (result.ok())
        return true;

    std::cerr << "Error loading graph for " << project_path << ": " << result.message << std::endl;
    std::cerr << "Please run 'codegraph --analyze " << project_path << "' first." << std::endl;
    return false;
}

json metadata_to_json(const GraphMetadata &metadata) {
    return {{"createdAt", metadata.created_at},
            {"updatedAt", metadata.updated_at},
            {"projectPath", metadata.project_path}};
}

json connection_to_json(const Connection &conn) {
    json j;
    j["from"] = conn.from;
    j["to"] = conn.to;
    j["type"] = edge_type_to_string(conn.type);
    // Synthetic import and call sites carry no node data
    j["fromData"] = conn.from_node ? node_to_json(conn.from, *conn.from_node) : json(nullptr);
    j["toData"] = conn.to_node ? node_to_json(conn.to, *conn.to_node) : json(nullptr);
    return j;
}

json symbol_to_json(const SymbolMatch &match, bool with_score) {
    json j = node_to_json(match.id, *match.node);
    if (with_score) {
        j["score"] = match.score;
    }
    return j;
}

static json connections_to_json(const std::vector<Connection> &connections) {
    json arr = json::array();
    for (const auto &conn : connections) {
        arr.push_back(connection_to_json(conn));
    }
    return arr;
}

int cmd_analyze(Workspace &ws, const std::string &path, bool force) {
    AnalyzeResult result = ws.analyze(path, force);

    json skipped = json::array();
    for (const auto &s : result.skipped) {
        skipped.push_back({{"file", s.path}, {"reason", s.reason}});
    }

    json stats;
    stats["nodeCount"] = result.node_count;
    stats["edgeCount"] = result.edge_count;
    stats["fileCount"] = result.file_count;
    stats["cached"] = result.persisted;
    stats["fromCache"] = result.from_cache;
    stats["metadata"] = metadata_to_json(result.metadata);
    stats["skipped"] = std::move(skipped);

    print_json({{"success", true}, {"message", result.message}, {"stats", std::move(stats)}});
    return 0;
}

int cmd_load(Workspace &ws, const std::string &path) {
    LoadResult result = ws.load_cached(path);
    if (!result.ok()) {
        print_json({{"success", false}, {"message", result.message}});
        return 1;
    }

    const Graph &graph = ws.graph();
    print_json({{"success", true},
                {"message", result.message},
                {"stats",
                 {{"nodeCount", graph.num_nodes()},
                  {"edgeCount", graph.num_edges()},
                  {"metadata", metadata_to_json(graph.metadata())}}}});
    return 0;
}

int cmd_clear_cache(Workspace &ws, const std::optional<std::string> &path) {
    ClearResult result = ws.clear_cache(path);
    print_json({{"success", result.success}, {"message", result.message}});
    return 0;
}

int cmd_list_cached(const Workspace &ws) {
    auto summaries = ws.list_cached();

    json graphs = json::array();
    for (const auto &s : summaries) {
        graphs.push_back({{"file", s.file},
                          {"projectPath", s.project_path},
                          {"createdAt", s.created_at},
                          {"updatedAt", s.updated_at},
                          {"nodeCount", s.node_count},
                          {"edgeCount", s.edge_count}});
    }

    print_json({{"count", summaries.size()}, {"cachedGraphs", std::move(graphs)}});
    return 0;
}

int cmd_find_symbol(const Workspace &ws, const std::string &query, const std::string &type) {
    std::optional<NodeKind> kind;
    if (!type.empty()) {
        kind = node_kind_from_string(type);
        if (!kind) {
            std::cerr << "Error: Unknown symbol type '" << type
                      << "' (expected function, class or variable)" << std::endl;
            return 1;
        }
    }

    SearchResult result = ws.query().find_symbol(query, kind);

    json symbols = json::array();
    for (const auto &match : result.symbols) {
        symbols.push_back(symbol_to_json(match, true));
    }

    print_json({{"query", query},
                {"type", type.empty() ? "all" : type},
                {"count", result.total},
                {"symbols", std::move(symbols)}});
    return 0;
}

int cmd_dependencies(const Workspace &ws, const std::string &symbol_id, unsigned depth) {
    auto connections = ws.query().dependencies(symbol_id, depth);
    print_json({{"symbolId", symbol_id},
                {"depth", depth},
                {"dependencies", connections_to_json(connections)}});
    return 0;
}

int cmd_dependents(const Workspace &ws, const std::string &symbol_id, unsigned depth) {
    auto connections = ws.query().dependents(symbol_id, depth);
    print_json({{"symbolId", symbol_id},
                {"depth", depth},
                {"dependents", connections_to_json(connections)}});
    return 0;
}

int cmd_call_graph(const Workspace &ws, const std::string &function_name, unsigned depth) {
    auto entries = ws.query().call_graph(function_name, depth);
    if (entries.empty()) {
        print_json({{"error", "Function not found"}, {"functionName", function_name}});
        return 1;
    }

    json call_graph = json::object();
    for (const auto &entry : entries) {
        call_graph[entry.id] = {{"function", node_to_json(entry.id, *entry.node)},
                                {"connections", connections_to_json(entry.connections)}};
    }

    print_json({{"functionName", function_name}, {"depth", depth}, {"callGraph", std::move(call_graph)}});
    return 0;
}

int cmd_file_symbols(const Workspace &ws, const std::string &filepath) {
    auto symbols = ws.query().file_symbols(filepath);

    json arr = json::array();
    for (const auto &match : symbols) {
        arr.push_back(symbol_to_json(match, false));
    }

    print_json({{"filepath", filepath}, {"symbolCount", symbols.size()}, {"symbols", std::move(arr)}});
    return 0;
}

int cmd_stats(const Workspace &ws) {
    GraphStats stats = ws.query().stats();
    print_json({{"totalNodes", stats.total_nodes},
                {"totalEdges", stats.total_edges},
                {"fileCount", stats.file_count},
                {"nodeTypes", stats.node_types},
                {"edgeTypes", stats.edge_types}});
    return 0;
}

} // namespace codegraph
