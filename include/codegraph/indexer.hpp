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
#include "parser.hpp"
#include "resolver.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace codegraph {

namespace fs = std::filesystem;

// Indexer configuration
struct IndexerConfig {
    std::string root_path = ".";
    bool verbose = false;

    // Threading config
    unsigned int num_threads = 0; // 0 = auto-detect

    // Larger files are skipped, not truncated
    std::uintmax_t max_file_size = 5 * 1024 * 1024;

    std::vector<std::string> extensions = {".js", ".jsx", ".ts", ".tsx", ".mjs"};

    // Directory names that are never descended into
    std::vector<std::string> ignore_patterns = {"node_modules", ".git",  "dist",
                                                "build",        ".next", "coverage"};
};

// A discovered file that contributed no facts
struct SkippedFile {
    std::string path;
    std::string reason;
};

class Indexer {
public:

    explicit Indexer(const IndexerConfig &config = IndexerConfig{},
                     ExtractorFactory factory = create_extractor);

    // Discover, extract and resolve the project into a fresh graph
    Graph index();

    // Discover and extract only; files that fail are recorded in skipped()
    ProjectFacts collect_facts();

    // Project-relative paths found by the last run, sorted
    const std::vector<std::string> &discovered_files() const { return discovered_files_; }

    const std::vector<SkippedFile> &skipped() const { return skipped_; }

    const BuildStats &build_stats() const { return build_stats_; }

    // Get statistics
    struct Stats {
        std::atomic<size_t> files_indexed{0};
        std::atomic<size_t> declarations_found{0};
        std::atomic<size_t> imports_found{0};
        std::atomic<size_t> calls_found{0};
    };
    const Stats &stats() const { return stats_; }

private:

    IndexerConfig config_;
    ExtractorFactory factory_;
    std::vector<std::string> discovered_files_;
    std::vector<SkippedFile> skipped_;
    BuildStats build_stats_;
    Stats stats_;

    // Thread synchronization
    std::mutex output_mutex_;
    std::mutex results_mutex_;

    // Discover all source files (project-relative, '/' separated, sorted)
    std::vector<std::string> discover_files() const;

    // Check if a project-relative path should be ignored
    bool should_ignore(const fs::path &relative) const;

    bool has_supported_extension(const fs::path &path) const;

    // Read and extract a single file; throws on failure
    FileFacts parse_file(FactExtractor &extractor, const std::string &relative) const;

    // Worker function for thread pool
    void worker_parse_files(const std::vector<std::string> &files, size_t start_idx,
                            size_t end_idx, ProjectFacts &all_facts);

    void record_skipped(const std::string &path, const std::string &reason);
};

} // namespace codegraph
