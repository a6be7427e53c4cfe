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

#include "codegraph/cache.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace codegraph {

namespace fs = std::filesystem;

constexpr const char *ENTRY_PREFIX = "graph_";
constexpr const char *ENTRY_SUFFIX = ".json";

std::string project_hash(const std::string &project_path) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw CacheError("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw CacheError("Failed to initialize MD5");
    }
    if (EVP_DigestUpdate(ctx.get(), project_path.data(), project_path.size()) != 1) {
        throw CacheError("Failed to update MD5");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1) {
        throw CacheError("Failed to finalize MD5");
    }

    // Convert to hex string
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

GraphCache::GraphCache(std::string cache_dir) : dir_(std::move(cache_dir)) {}

void GraphCache::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw CacheError("Cannot create cache directory " + dir_ + ": " + ec.message());
    }
}

bool GraphCache::is_entry_name(const std::string &filename) const {
    const std::string prefix = ENTRY_PREFIX;
    const std::string suffix = ENTRY_SUFFIX;
    return filename.size() > prefix.size() + suffix.size() &&
           filename.compare(0, prefix.size(), prefix) == 0 &&
           filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string GraphCache::entry_path(const std::string &project_path) const {
    return (fs::path(dir_) / (ENTRY_PREFIX + project_hash(project_path) + ENTRY_SUFFIX)).string();
}

std::string GraphCache::save(Graph &graph, const std::string &project_path) const {
    ensure_directory();

    const std::string filepath = entry_path(project_path);

    graph.set_project_hash(project_hash(project_path));
    graph.metadata().updated_at = current_timestamp();
    graph.metadata().project_path = project_path;

    std::ofstream file(filepath, std::ios::trunc);
    if (!file.is_open()) {
        throw CacheError("Failed to open file for writing: " + filepath);
    }
    file << graph.to_json().dump(2);
    file.close();
    if (!file) {
        throw CacheError("Failed to write cache entry: " + filepath);
    }

    std::cerr << "Graph saved to " << filepath << std::endl;
    return filepath;
}

std::optional<Graph> GraphCache::load(const std::string &project_path) const {
    const std::string filepath = entry_path(project_path);

    std::error_code ec;
    if (!fs::exists(filepath, ec)) {
        std::cerr << "No cached graph found for " << project_path << std::endl;
        return std::nullopt;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw CacheError("Failed to open file for reading: " + filepath);
    }

    try {
        json document = json::parse(file);
        Graph graph = Graph::from_json(document);
        std::cerr << "Graph loaded from " << filepath << std::endl;
        return graph;
    } catch (const json::exception &e) {
        throw CacheError("Failed to parse cache entry " + filepath + ": " + e.what());
    } catch (const std::runtime_error &e) {
        throw CacheError("Invalid cache entry " + filepath + ": " + e.what());
    }
}

bool GraphCache::remove(const std::string &project_path) const {
    const std::string filepath = entry_path(project_path);

    std::error_code ec;
    bool removed = fs::remove(filepath, ec);
    if (ec) {
        throw CacheError("Failed to delete " + filepath + ": " + ec.message());
    }
    if (removed) {
        std::cerr << "Graph deleted: " << filepath << std::endl;
    }
    return removed;
}

size_t GraphCache::remove_all() const {
    size_t removed = 0;

    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return removed;
    }

    std::vector<fs::path> entries;
    fs::directory_iterator it(dir_, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (is_entry_name(it->path().filename().string())) {
            entries.push_back(it->path());
        }
    }
    if (ec) {
        throw CacheError("Cannot read cache directory " + dir_ + ": " + ec.message());
    }

    for (const auto &entry : entries) {
        if (fs::remove(entry, ec)) {
            removed++;
        } else if (ec) {
            std::cerr << "Error deleting " << entry.string() << ": " << ec.message() << std::endl;
            ec.clear();
        }
    }
    return removed;
}

std::vector<CacheSummary> GraphCache::list() const {
    std::vector<CacheSummary> summaries;

    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return summaries;
    }

    fs::directory_iterator it(dir_, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const std::string filename = it->path().filename().string();
        if (!is_entry_name(filename))
            continue;

        try {
            summaries.push_back(stream_cache_summary(it->path().string()));
        } catch (const std::runtime_error &e) {
            std::cerr << "Error reading " << filename << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        throw CacheError("Cannot read cache directory " + dir_ + ": " + ec.message());
    }

    std::sort(summaries.begin(), summaries.end(),
              [](const CacheSummary &a, const CacheSummary &b) { return a.file < b.file; });
    return summaries;
}

} // namespace codegraph
