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

#include "codegraph/config.hpp"
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace codegraph {

std::optional<std::uintmax_t> parse_byte_size(const std::string &s) {
    if (s.empty())
        return std::nullopt;

    std::uintmax_t value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        std::uintmax_t digit = static_cast<std::uintmax_t>(c - '0');
        if (value > (std::numeric_limits<std::uintmax_t>::max() - digit) / 10)
            return std::nullopt; // overflow
        value = value * 10 + digit;
    }
    return value;
}

Config Config::from_environment() {
    Config config;

    if (const char *size = std::getenv(ENV_MAX_FILE_SIZE)) {
        if (auto parsed = parse_byte_size(size)) {
            config.indexer.max_file_size = *parsed;
        } else {
            std::cerr << "Warning: Ignoring invalid " << ENV_MAX_FILE_SIZE << "='" << size
                      << "', using " << config.indexer.max_file_size << " bytes" << std::endl;
        }
    }

    if (const char *dir = std::getenv(ENV_CACHE_DIR)) {
        if (*dir != '\0') {
            config.cache_dir = dir;
        }
    }

    return config;
}

} // namespace codegraph
