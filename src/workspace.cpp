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

#include "codegraph/workspace.hpp"
#include <iostream>

namespace codegraph {

Workspace::Workspace(Config config, ExtractorFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)), cache_(config_.cache_dir) {}

const Graph &Workspace::graph() const {
    if (!graph_) {
        throw std::logic_error("No graph loaded. Analyze or load a project first.");
    }
    return *graph_;
}

AnalyzeResult Workspace::analyze(const std::string &project_path, bool force) {
    AnalyzeResult result;

    if (!force) {
        LoadResult loaded = load_cached(project_path);
        if (loaded.ok()) {
            result.node_count = graph_->num_nodes();
            result.edge_count = graph_->num_edges();
            result.file_count = graph_->num_files();
            result.from_cache = true;
            result.persisted = true;
            result.metadata = graph_->metadata();
            result.message = "Project loaded from cache";
            return result;
        }
        if (loaded.status == LoadStatus::Corrupt) {
            std::cerr << "Rebuilding " << project_path << ": " << loaded.message << std::endl;
        }
    }

    IndexerConfig indexer_config = config_.indexer;
    indexer_config.root_path = project_path;
    Indexer indexer(indexer_config, factory_);
    auto graph = std::make_unique<Graph>(indexer.index());

    result.node_count = indexer.build_stats().node_count;
    result.edge_count = indexer.build_stats().edge_count;
    result.file_count = indexer.build_stats().file_count;
    result.skipped = indexer.skipped();

    try {
        cache_.save(*graph, project_path);
        result.persisted = true;
        result.message = "Project analyzed and cached successfully";
    } catch (const CacheError &e) {
        std::cerr << "Error saving graph: " << e.what() << std::endl;
        result.message = std::string("Project analyzed but not cached: ") + e.what();
    }

    result.metadata = graph->metadata();
    graph_ = std::move(graph);
    return result;
}

LoadResult Workspace::load_cached(const std::string &project_path) {
    LoadResult result;
    try {
        std::optional<Graph> loaded = cache_.load(project_path);
        if (!loaded) {
            result.status = LoadStatus::NotFound;
            result.message = "No cached graph found for this project";
            return result;
        }
        graph_ = std::make_unique<Graph>(std::move(*loaded));
        result.status = LoadStatus::Loaded;
        result.message = "Graph loaded from cache";
    } catch (const CacheError &e) {
        std::cerr << "Error loading graph: " << e.what() << std::endl;
        result.status = LoadStatus::Corrupt;
        result.message = e.what();
    }
    return result;
}

ClearResult Workspace::clear_cache(const std::optional<std::string> &project_path) {
    ClearResult result;

    if (project_path && !project_path->empty()) {
        bool deleted = cache_.remove(*project_path);
        result.success = deleted;
        result.cleared = deleted ? 1 : 0;
        result.message = deleted ? "Cache cleared for project" : "No cache found for project";
        return result;
    }

    result.cleared = cache_.remove_all();
    result.success = true;
    result.message = "Cleared " + std::to_string(result.cleared) + " cached graphs";
    return result;
}

std::vector<CacheSummary> Workspace::list_cached() const { return cache_.list(); }

} // namespace codegraph
