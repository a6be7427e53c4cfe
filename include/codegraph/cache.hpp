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
#include "streaming.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codegraph {

// Malformed cache entry or cache directory I/O failure
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Hex MD5 of the project path string. The key does not depend on file
// contents, so an entry goes stale when sources change.
std::string project_hash(const std::string &project_path);

// Path-keyed store of serialized graphs: <dir>/graph_<hash>.json
class GraphCache {
public:

    explicit GraphCache(std::string cache_dir);

    const std::string &directory() const { return dir_; }

    // Cache entry path for a project
    std::string entry_path(const std::string &project_path) const;

    // Stamp metadata and write the graph, replacing any previous entry.
    // Returns the entry path; throws CacheError on I/O failure.
    std::string save(Graph &graph, const std::string &project_path) const;

    // nullopt if there is no entry; throws CacheError if the entry is malformed
    std::optional<Graph> load(const std::string &project_path) const;

    // False if there was nothing to delete
    bool remove(const std::string &project_path) const;

    // Remove every entry; returns the number removed
    size_t remove_all() const;

    // Summaries of all readable entries, sorted by file name
    std::vector<CacheSummary> list() const;

private:

    std::string dir_;

    void ensure_directory() const;

    bool is_entry_name(const std::string &filename) const;
};

} // namespace codegraph
