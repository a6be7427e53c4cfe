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

#include "cache.hpp"
#include "config.hpp"
#include "indexer.hpp"
#include "query.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codegraph {

enum class LoadStatus { Loaded, NotFound, Corrupt };

struct LoadResult {
    LoadStatus status = LoadStatus::NotFound;
    std::string message;

    bool ok() const { return status == LoadStatus::Loaded; }
};

struct AnalyzeResult {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t file_count = 0;
    bool from_cache = false;
    bool persisted = false;
    std::vector<SkippedFile> skipped;
    GraphMetadata metadata;
    std::string message;
};

struct ClearResult {
    bool success = false;
    size_t cleared = 0;
    std::string message;
};

// Holds the current graph of one session and the cache it is persisted to.
// Independent instances never share state.
class Workspace {
public:

    explicit Workspace(Config config, ExtractorFactory factory = create_extractor);

    // Load from cache unless force, otherwise build and save
    AnalyzeResult analyze(const std::string &project_path, bool force = false);

    // Replace the current graph with the cached one
    LoadResult load_cached(const std::string &project_path);

    // One project, or every entry when project_path is empty
    ClearResult clear_cache(const std::optional<std::string> &project_path = std::nullopt);

    std::vector<CacheSummary> list_cached() const;

    bool has_graph() const { return graph_ != nullptr; }

    // Throws std::logic_error if no graph is loaded
    const Graph &graph() const;

    QueryEngine query() const { return QueryEngine(graph()); }

    const Config &config() const { return config_; }

private:

    Config config_;
    ExtractorFactory factory_;
    GraphCache cache_;
    std::unique_ptr<Graph> graph_;
};

} // namespace codegraph
