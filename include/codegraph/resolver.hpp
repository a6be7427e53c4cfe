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

#include "graph.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace codegraph {

// Facts of every extracted file, keyed by project-relative path
using ProjectFacts = std::map<std::string, FileFacts>;

struct BuildStats {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t file_count = 0;
};

// Extensions tried, in order, when resolving a relative import
constexpr const char *IMPORT_SUFFIXES[] = {".js", ".ts", ".jsx", ".tsx", "/index.js", "/index.ts"};

// Join the importer's directory with a relative specifier and normalize it
// ("src/b.js" + "../lib/a" -> "lib/a")
std::string join_import_path(const std::string &importer, const std::string &source);

// Links per-file facts into a Graph. Best effort: anything that cannot be
// matched is left unlinked.
class Resolver {
public:

    explicit Resolver(Graph &graph);

    // Populate the graph from facts; must see every file before linking
    BuildStats resolve(const ProjectFacts &facts);

private:

    Graph &graph_;

    // (kind, name) -> declaration ids, in declaration order
    std::unordered_map<std::string, std::vector<NodeId>> functions_by_name_;
    std::unordered_map<std::string, std::vector<NodeId>> classes_by_name_;

    void add_declarations(const std::string &file, const FileFacts &facts);
    void link_imports(const std::string &file, const FileFacts &facts, const ProjectFacts &project);
    void link_calls(const std::string &file, const FileFacts &facts);
    void link_extends(const std::string &file, const FileFacts &facts);

    // Resolved project path of a relative import, or empty if none matches
    std::string resolve_import(const std::string &file, const std::string &source,
                               const ProjectFacts &project) const;
};

} // namespace codegraph
