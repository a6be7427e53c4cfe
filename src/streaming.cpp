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

#include "codegraph/streaming.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace codegraph {

CacheSummaryHandler::CacheSummaryHandler(CacheSummary &s) : summary(s) {}

bool CacheSummaryHandler::null() { return true; }
bool CacheSummaryHandler::boolean(bool) { return true; }
bool CacheSummaryHandler::number_integer(number_integer_t) { return true; }
bool CacheSummaryHandler::number_unsigned(number_unsigned_t) { return true; }
bool CacheSummaryHandler::number_float(number_float_t, const string_t &) { return true; }
bool CacheSummaryHandler::binary(binary_t &) { return true; }

bool CacheSummaryHandler::string(string_t &val) {
    if (depth == 2 && section == "metadata") {
        if (current_key == "projectPath") {
            summary.project_path = val;
        } else if (current_key == "createdAt") {
            summary.created_at = val;
        } else if (current_key == "updatedAt") {
            summary.updated_at = val;
        }
    }
    return true;
}

bool CacheSummaryHandler::start_object(std::size_t) {
    depth++;
    // Elements of the top-level nodes/edges arrays
    if (depth == 3) {
        if (section == "nodes")
            summary.node_count++;
        else if (section == "edges")
            summary.edge_count++;
    }
    return true;
}

bool CacheSummaryHandler::end_object() {
    depth--;
    if (depth == 0)
        complete = true;
    return true;
}

bool CacheSummaryHandler::start_array(std::size_t) {
    depth++;
    return true;
}

bool CacheSummaryHandler::end_array() {
    depth--;
    return true;
}

bool CacheSummaryHandler::key(string_t &key) {
    if (depth == 1) {
        section = key;
    } else if (depth == 2 && section == "metadata") {
        current_key = key;
    }
    return true;
}

bool CacheSummaryHandler::parse_error(std::size_t, const std::string &,
                                      const nlohmann::json::exception &) {
    return false;
}

CacheSummary stream_cache_summary(const std::string &entry_file) {
    std::ifstream file(entry_file);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open cache entry: " + entry_file);
    }

    CacheSummary summary;
    summary.file = std::filesystem::path(entry_file).filename().string();
    CacheSummaryHandler handler(summary);
    if (!nlohmann::json::sax_parse(file, &handler) || !handler.complete) {
        throw std::runtime_error("Malformed cache entry: " + entry_file);
    }
    return summary;
}

} // namespace codegraph
