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

#pragma once

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace codegraph {

using json = nlohmann::json;

struct GraphMetadata {
    std::string created_at;
    std::string updated_at;
    std::string project_path;
};

// A search hit. node points into the Graph that produced it.
struct SymbolMatch {
    NodeId id;
    const Node *node = nullptr;
    int score = 0;
};

// Current UTC time as an ISO-8601 string with milliseconds
std::string current_timestamp();

class Graph {
public:
    Graph();

    // Insert or overwrite a node (last write wins)
    void add_node(const NodeId &id, Node node);

    // Add a typed edge. Endpoints are not validated.
    void add_edge(const NodeId &from, const NodeId &to, EdgeType type);

    bool has_node(const NodeId &id) const;

    // Returns nullptr if id is not a node
    const Node *find_node(const NodeId &id) const;

    // Depth-first walk from id, at most depth hops; each node is expanded once
    std::vector<Connection> get_connections(const NodeId &id, Direction direction,
                                            unsigned depth) const;

    // Case-insensitive substring match on name (score 2) or file path (score 1)
    std::vector<SymbolMatch> search_nodes(const std::string &query,
                                          std::optional<NodeKind> kind = std::nullopt) const;

    // Node ids declared in a file, in insertion order
    const std::vector<NodeId> &get_file_nodes(const std::string &file) const;

    // Node ids in insertion order
    const std::vector<NodeId> &node_ids() const { return node_order_; }

    const std::vector<Edge> &edges() const { return edges_; }

    const std::map<std::string, std::vector<NodeId>> &file_index() const { return file_index_; }

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }
    size_t num_files() const { return file_index_.size(); }

    GraphMetadata &metadata() { return metadata_; }
    const GraphMetadata &metadata() const { return metadata_; }

    const std::string &project_hash() const { return project_hash_; }
    void set_project_hash(const std::string &hash) { project_hash_ = hash; }

    // Serialize to the cache document layout
    json to_json() const;

    // Load from a cache document; throws std::runtime_error on malformed input
    static Graph from_json(const json &j);

private:
    std::unordered_map<NodeId, Node> nodes_;
    std::vector<NodeId> node_order_;

    // Edge arena; the adjacency maps hold indices into it
    std::vector<Edge> edges_;
    std::unordered_map<NodeId, std::vector<size_t>> outgoing_;
    std::unordered_map<NodeId, std::vector<size_t>> incoming_;

    std::map<std::string, std::vector<NodeId>> file_index_;

    GraphMetadata metadata_;
    std::string project_hash_;

    void traverse(const NodeId &id, Direction direction, unsigned depth, unsigned current_depth,
                  std::unordered_set<NodeId> &visited, std::vector<Connection> &result) const;
};

// JSON form of a node: {id, kind, name, file, line, ...kind-specific fields}
json node_to_json(const NodeId &id, const Node &node);

// Inverse of node_to_json; throws std::runtime_error on malformed input
std::pair<NodeId, Node> node_from_json(const json &j);

} // namespace codegraph
