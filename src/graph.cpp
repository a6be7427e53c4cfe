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

#include "codegraph/graph.hpp"
#include "codegraph/version.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace codegraph {

static std::string to_lower(const std::string &s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string current_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms << 'Z';
    return oss.str();
}

Graph::Graph() {
    metadata_.created_at = current_timestamp();
    metadata_.updated_at = metadata_.created_at;
}

void Graph::add_node(const NodeId &id, Node node) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        node_order_.push_back(id);
    } else if (it->second.file != node.file) {
        // Overwritten from another file - drop the stale file index entry
        auto &old_ids = file_index_[it->second.file];
        old_ids.erase(std::remove(old_ids.begin(), old_ids.end(), id), old_ids.end());
        if (old_ids.empty()) {
            file_index_.erase(it->second.file);
        }
    }

    outgoing_.try_emplace(id);
    incoming_.try_emplace(id);

    auto &file_ids = file_index_[node.file];
    if (std::find(file_ids.begin(), file_ids.end(), id) == file_ids.end()) {
        file_ids.push_back(id);
    }

    nodes_[id] = std::move(node);
}

void Graph::add_edge(const NodeId &from, const NodeId &to, EdgeType type) {
    size_t idx = edges_.size();
    edges_.push_back(Edge{from, to, type});
    outgoing_[from].push_back(idx);
    incoming_[to].push_back(idx);
}

bool Graph::has_node(const NodeId &id) const { return nodes_.find(id) != nodes_.end(); }

const Node *Graph::find_node(const NodeId &id) const {
    auto it = nodes_.find(id);
    return (it != nodes_.end()) ? &it->second : nullptr;
}

std::vector<Connection> Graph::get_connections(const NodeId &id, Direction direction,
                                               unsigned depth) const {
    std::unordered_set<NodeId> visited;
    std::vector<Connection> result;
    traverse(id, direction, depth, 0, visited, result);
    return result;
}

void Graph::traverse(const NodeId &id, Direction direction, unsigned depth, unsigned current_depth,
                     std::unordered_set<NodeId> &visited, std::vector<Connection> &result) const {
    // Edges leaving this node would be hop current_depth + 1. A node reached
    // at the limit is left unvisited so a shorter path can still expand it.
    if (current_depth >= depth)
        return;
    if (!visited.insert(id).second)
        return;

    if (direction == Direction::Outgoing || direction == Direction::Both) {
        auto it = outgoing_.find(id);
        if (it != outgoing_.end()) {
            for (size_t idx : it->second) {
                const Edge &edge = edges_[idx];
                result.push_back(
                    Connection{edge.from, edge.to, edge.type, find_node(edge.from), find_node(edge.to)});
                traverse(edge.to, direction, depth, current_depth + 1, visited, result);
            }
        }
    }

    if (direction == Direction::Incoming || direction == Direction::Both) {
        auto it = incoming_.find(id);
        if (it != incoming_.end()) {
            for (size_t idx : it->second) {
                const Edge &edge = edges_[idx];
                result.push_back(
                    Connection{edge.from, edge.to, edge.type, find_node(edge.from), find_node(edge.to)});
                traverse(edge.from, direction, depth, current_depth + 1, visited, result);
            }
        }
    }
}

std::vector<SymbolMatch> Graph::search_nodes(const std::string &query,
                                             std::optional<NodeKind> kind) const {
    std::vector<SymbolMatch> results;
    const std::string lower_query = to_lower(query);

    for (const auto &id : node_order_) {
        const Node &node = nodes_.at(id);
        if (kind && node.kind() != *kind)
            continue;

        bool name_match = to_lower(node.name).find(lower_query) != std::string::npos;
        bool file_match = to_lower(node.file).find(lower_query) != std::string::npos;

        if (name_match || file_match) {
            results.push_back(SymbolMatch{id, &node, name_match ? 2 : 1});
        }
    }

    // Stable sort keeps insertion order among equal scores
    std::stable_sort(results.begin(), results.end(),
                     [](const SymbolMatch &a, const SymbolMatch &b) { return a.score > b.score; });
    return results;
}

const std::vector<NodeId> &Graph::get_file_nodes(const std::string &file) const {
    static const std::vector<NodeId> empty;
    auto it = file_index_.find(file);
    return (it != file_index_.end()) ? it->second : empty;
}

// ============ JSON ============

json node_to_json(const NodeId &id, const Node &node) {
    json j;
    j["id"] = id;
    j["kind"] = node_kind_to_string(node.kind());
    j["name"] = node.name;
    j["file"] = node.file;
    j["line"] = node.line;

    if (const auto *fn = std::get_if<FunctionInfo>(&node.details)) {
        j["params"] = fn->params;
        j["paramCount"] = fn->param_count();
        j["async"] = fn->is_async;
        j["generator"] = fn->is_generator;
    } else if (const auto *cls = std::get_if<ClassInfo>(&node.details)) {
        j["extends"] = cls->extends.empty() ? json(nullptr) : json(cls->extends);
        json methods = json::array();
        for (const auto &m : cls->methods) {
            methods.push_back({{"name", m.name}, {"kind", m.kind}, {"static", m.is_static}});
        }
        j["methods"] = std::move(methods);
        json properties = json::array();
        for (const auto &p : cls->properties) {
            properties.push_back({{"name", p.name}, {"static", p.is_static}});
        }
        j["properties"] = std::move(properties);
    } else if (const auto *var = std::get_if<VariableInfo>(&node.details)) {
        j["declaration"] = declaration_kind_to_string(var->declaration);
    }
    return j;
}

std::pair<NodeId, Node> node_from_json(const json &j) {
    Node node;
    NodeId id = j.at("id").get<std::string>();
    node.name = j.at("name").get<std::string>();
    node.file = j.at("file").get<std::string>();
    node.line = j.at("line").get<uint32_t>();

    std::string kind_str = j.at("kind").get<std::string>();
    auto kind = node_kind_from_string(kind_str);
    if (!kind) {
        throw std::runtime_error("Unknown node kind '" + kind_str + "' for node " + id);
    }

    switch (*kind) {
    case NodeKind::Function: {
        FunctionInfo fn;
        fn.params = j.value("params", std::vector<std::string>{});
        fn.is_async = j.value("async", false);
        fn.is_generator = j.value("generator", false);
        node.details = std::move(fn);
        break;
    }
    case NodeKind::Class: {
        ClassInfo cls;
        if (j.contains("extends") && j["extends"].is_string()) {
            cls.extends = j["extends"].get<std::string>();
        }
        if (j.contains("methods")) {
            for (const auto &m : j["methods"]) {
                cls.methods.push_back(ClassMethod{m.at("name").get<std::string>(),
                                                  m.value("kind", std::string("method")),
                                                  m.value("static", false)});
            }
        }
        if (j.contains("properties")) {
            for (const auto &p : j["properties"]) {
                cls.properties.push_back(
                    ClassProperty{p.at("name").get<std::string>(), p.value("static", false)});
            }
        }
        node.details = std::move(cls);
        break;
    }
    case NodeKind::Variable: {
        VariableInfo var;
        std::string decl = j.value("declaration", std::string("let"));
        auto parsed = declaration_kind_from_string(decl);
        if (!parsed) {
            throw std::runtime_error("Unknown declaration kind '" + decl + "' for node " + id);
        }
        var.declaration = *parsed;
        node.details = var;
        break;
    }
    }

    return {std::move(id), std::move(node)};
}

json Graph::to_json() const {
    json j;

    j["metadata"]["version"] = CACHE_SCHEMA_VERSION;
    j["metadata"]["createdAt"] = metadata_.created_at;
    j["metadata"]["updatedAt"] = metadata_.updated_at;
    j["metadata"]["projectPath"] = metadata_.project_path;
    j["projectHash"] = project_hash_;

    json nodes = json::array();
    for (const auto &id : node_order_) {
        nodes.push_back(node_to_json(id, nodes_.at(id)));
    }
    j["nodes"] = std::move(nodes);

    json edges = json::array();
    for (const auto &edge : edges_) {
        edges.push_back({{"from", edge.from}, {"to", edge.to}, {"type", edge_type_to_string(edge.type)}});
    }
    j["edges"] = std::move(edges);

    json file_index = json::array();
    for (const auto &[file, ids] : file_index_) {
        file_index.push_back({{"file", file}, {"nodeIds", ids}});
    }
    j["fileIndex"] = std::move(file_index);

    return j;
}

Graph Graph::from_json(const json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("Cache document is not a JSON object");
    }

    Graph g;
    try {
        // Check schema version compatibility
        if (j.contains("metadata")) {
            const auto &meta = j["metadata"];
            if (meta.contains("version")) {
                std::string file_version = meta["version"].get<std::string>();
                int major = 0, minor = 0, patch = 0;
                if (!parse_version(file_version, major, minor, patch) ||
                    !is_schema_compatible(major)) {
                    throw std::runtime_error("Cache schema version " + file_version +
                                             " is not compatible with this version of codegraph "
                                             "(requires " + CACHE_SCHEMA_VERSION + ")");
                }
            }
            g.metadata_.created_at = meta.value("createdAt", g.metadata_.created_at);
            g.metadata_.updated_at = meta.value("updatedAt", g.metadata_.updated_at);
            if (meta.contains("projectPath") && meta["projectPath"].is_string()) {
                g.metadata_.project_path = meta["projectPath"].get<std::string>();
            }
        }
        if (j.contains("projectHash") && j["projectHash"].is_string()) {
            g.project_hash_ = j["projectHash"].get<std::string>();
        }

        if (j.contains("nodes")) {
            for (const auto &entry : j["nodes"]) {
                auto [id, node] = node_from_json(entry);
                g.add_node(id, std::move(node));
            }
        }

        if (j.contains("edges")) {
            for (const auto &entry : j["edges"]) {
                std::string type_str = entry.at("type").get<std::string>();
                auto type = edge_type_from_string(type_str);
                if (!type) {
                    throw std::runtime_error("Unknown edge type '" + type_str + "'");
                }
                g.add_edge(entry.at("from").get<std::string>(), entry.at("to").get<std::string>(),
                           *type);
            }
        }

        // The persisted file index is authoritative
        if (j.contains("fileIndex")) {
            g.file_index_.clear();
            for (const auto &entry : j["fileIndex"]) {
                g.file_index_[entry.at("file").get<std::string>()] =
                    entry.at("nodeIds").get<std::vector<NodeId>>();
            }
        }
    } catch (const json::exception &e) {
        throw std::runtime_error(std::string("Malformed cache document: ") + e.what());
    }

    return g;
}

} // namespace codegraph
