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

#include "indexer.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace codegraph {

// Environment variables read by Config::from_environment()
constexpr const char *ENV_MAX_FILE_SIZE = "MAX_FILE_SIZE";
constexpr const char *ENV_CACHE_DIR = "DB_PATH";

constexpr const char *DEFAULT_CACHE_DIR = "./db";

struct Config {
    IndexerConfig indexer;
    std::string cache_dir = DEFAULT_CACHE_DIR;

    // Defaults overridden by MAX_FILE_SIZE (bytes) and DB_PATH
    static Config from_environment();
};

// Parse a non-negative byte count; nullopt if s is not entirely digits
std::optional<std::uintmax_t> parse_byte_size(const std::string &s);

} // namespace codegraph
