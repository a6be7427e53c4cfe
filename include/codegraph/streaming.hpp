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

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codegraph {

// Lightweight view of one cache entry
struct CacheSummary {
    std::string file; // Entry file name inside the cache directory
    std::string project_path;
    std::string created_at;
    std::string updated_at;
    size_t node_count = 0;
    size_t edge_count = 0;
};

// SAX handler that reads cache metadata and counts nodes/edges without
// building the document
class CacheSummaryHandler : public nlohmann::json::json_sax_t {
public:
    CacheSummary& summary;
    int depth = 0;
    std::string section;     // Current top-level key
    std::string current_key; // Current key inside metadata
    bool complete = false;
    
    explicit CacheSummaryHandler(CacheSummary& s);
    
    bool null() override;
    bool boolean(bool) override;
    bool number_integer(number_integer_t) override;
    bool number_unsigned(number_unsigned_t) override;
    bool number_float(number_float_t, const string_t&) override;
    bool string(string_t& val) override;
    bool binary(binary_t&) override;
    bool start_object(std::size_t) override;
    bool end_object() override;
    bool start_array(std::size_t) override;
    bool end_array() override;
    bool key(string_t& key) override;
    bool parse_error(std::size_t, const std::string&, const nlohmann::json::exception&) override;
};

// Stream a cache entry and summarize it; throws std::runtime_error if the
// entry cannot be opened or is not well-formed JSON
CacheSummary stream_cache_summary(const std::string& entry_file);

} // namespace codegraph
