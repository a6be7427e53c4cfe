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

#include "codegraph/resolver.hpp"
#include <algorithm>
#include <filesystem>

namespace codegraph {

namespace fs = std::filesystem;

std::string join_import_path(const std::string &importer, const std::string &source) {
    fs::path joined = (fs::path(importer).parent_path() / source).lexically_normal();
    std::string result = joined.generic_string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

// Default import of a file with a matching default export. An anonymous
// default export (no local name) matches every declaration of the file.
static bool has_default_export(const std::vector<ExportFact> &exports) {
    return std::any_of(exports.begin(), exports.end(),
                       [](const ExportFact &e) { return e.exported == "default"; });
}

Resolver::Resolver(Graph &graph) : graph_(graph) {}

BuildStats Resolver::resolve(const ProjectFacts &facts) {
    functions_by_name_.clear();
    classes_by_name_.clear();

    // Phase 1: every declaration becomes a node
    for (const auto &[file, file_facts] : facts) {
        add_declarations(file, file_facts);
    }

    // Phase 2: cross-file links, now that all nodes exist
    for (const auto &[file, file_facts] : facts) {
        link_imports(file, file_facts, facts);
        link_calls(file, file_facts);
        link_extends(file, file_facts);
    }

    BuildStats stats;
    stats.node_count = graph_.num_nodes();
    stats.edge_count = graph_.num_edges();
    stats.file_count = facts.size();
    return stats;
}

void Resolver::add_declarations(const std::string &file, const FileFacts &facts) {
    for (const auto &decl : facts.declarations) {
        NodeId id = make_node_id(file, decl.name, decl.line);

        Node node = decl;
        node.file = file;
        NodeKind kind = node.kind();
        graph_.add_node(id, std::move(node));

        if (kind == NodeKind::Function) {
            functions_by_name_[decl.name].push_back(id);
        } else if (kind == NodeKind::Class) {
            classes_by_name_[decl.name].push_back(id);
        }
    }
}

std::string Resolver::resolve_import(const std::string &file, const std::string &source,
                                     const ProjectFacts &project) const {
    const std::string base = join_import_path(file, source);

    for (const char *suffix : IMPORT_SUFFIXES) {
        std::string candidate = base + suffix;
        if (candidate.rfind("./", 0) == 0) {
            candidate.erase(0, 2);
        }
        if (project.count(candidate)) {
            return candidate;
        }
    }
    return "";
}

void Resolver::link_imports(const std::string &file, const FileFacts &facts,
                            const ProjectFacts &project) {
    for (const auto &imp : facts.imports) {
        // Package imports are never resolved
        if (imp.source.empty() || imp.source[0] != '.')
            continue;

        std::string target = resolve_import(file, imp.source, project);
        if (target.empty())
            continue;

        const FileFacts &target_facts = project.at(target);
        const NodeId from_id = make_import_site_id(file, imp.line);
        // A default import links every declaration of a file that has a default export
        const bool default_import =
            imp.imported == "default" && has_default_export(target_facts.exports);

        for (const auto &decl : target_facts.declarations) {
            bool matched = default_import || decl.name == imp.local;
            if (!matched)
                continue;

            NodeId to_id = make_node_id(target, decl.name, decl.line);
            if (graph_.has_node(to_id)) {
                graph_.add_edge(from_id, to_id, EdgeType::Imports);
            }
        }
    }
}

void Resolver::link_calls(const std::string &file, const FileFacts &facts) {
    for (const auto &call : facts.calls) {
        auto it = functions_by_name_.find(call.name);
        if (it == functions_by_name_.end())
            continue;

        // Every same-named function is a possible target
        const NodeId caller_id = make_call_site_id(file, call.line);
        for (const auto &target_id : it->second) {
            if (graph_.has_node(target_id)) {
                graph_.add_edge(caller_id, target_id, EdgeType::Calls);
            }
        }
    }
}

void Resolver::link_extends(const std::string &file, const FileFacts &facts) {
    for (const auto &decl : facts.declarations) {
        const auto *cls = std::get_if<ClassInfo>(&decl.details);
        if (!cls || cls->extends.empty())
            continue;

        auto it = classes_by_name_.find(cls->extends);
        if (it == classes_by_name_.end())
            continue;

        const NodeId class_id = make_node_id(file, decl.name, decl.line);
        for (const auto &parent_id : it->second) {
            if (graph_.has_node(parent_id)) {
                graph_.add_edge(class_id, parent_id, EdgeType::Extends);
            }
        }
    }
}

} // namespace codegraph
