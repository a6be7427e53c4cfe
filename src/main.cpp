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

#include <cxxopts.hpp>
#include <iostream>

#include "codegraph/commands.hpp"
#include "codegraph/config.hpp"
#include "codegraph/version.hpp"

using namespace codegraph;

void print_banner() {
    std::cout << R"(
   ___          _       ___                 _
  / __|___   __| |___  / __|_ _ __ _ _ __| |_
 | (__/ _ \ / _` / -_)| (_ | '_/ _` | '_ \ ' \
  \___\___/ \__,_\___| \___|_| \__,_| .__/_||_|
                                    |_|
)" << "  Code Relationship Graph v"
              << VERSION_STRING << "\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "codegraph",
        "Code Relationship Graph - Build and query symbol graphs for JavaScript and TypeScript");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("analyze", "Build (or load cached) graph for a project directory",
         cxxopts::value<std::string>());
    opts("force", "Rebuild even if a cached graph exists");
    opts("load", "Load the cached graph for a project directory", cxxopts::value<std::string>());
    opts("clear-cache", "Delete the cached graph for a project, or every cached graph",
         cxxopts::value<std::string>()->implicit_value(""));
    opts("list-cached", "List cached graphs");
    opts("find", "Search symbols by name or file path", cxxopts::value<std::string>());
    opts("type", "Restrict --find to function, class or variable",
         cxxopts::value<std::string>()->default_value(""));
    opts("deps", "Show what a symbol id uses", cxxopts::value<std::string>());
    opts("dependents", "Show what uses a symbol id", cxxopts::value<std::string>());
    opts("call-graph", "Show calls around functions matching a name",
         cxxopts::value<std::string>());
    opts("depth", "Traversal depth for --deps, --dependents and --call-graph",
         cxxopts::value<unsigned int>());
    opts("file-symbols", "List symbols declared in a project-relative file",
         cxxopts::value<std::string>());
    opts("stats", "Print graph statistics");
    opts("project", "Project directory for queries",
         cxxopts::value<std::string>()->default_value("."));
    opts("db", "Cache directory (overrides DB_PATH)", cxxopts::value<std::string>());
    opts("max-file-size", "Skip files larger than this many bytes (overrides MAX_FILE_SIZE)",
         cxxopts::value<std::string>());
    opts("j,jobs", "Number of threads for analysis (0 = auto)",
         cxxopts::value<unsigned int>()->default_value("0"));
    opts("verbose", "Print progress while analyzing");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  codegraph --analyze ./app                 Build and cache the graph"
                      << std::endl;
            std::cout << "  codegraph --analyze ./app --force -j 8    Rebuild using 8 threads"
                      << std::endl;
            std::cout << "  codegraph --project ./app --find parse    Search symbols" << std::endl;
            std::cout << "  codegraph --project ./app --call-graph main --depth 3" << std::endl;
            std::cout << "  codegraph --clear-cache                   Delete every cached graph"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "codegraph v" << VERSION_STRING << std::endl;
            return 0;
        }

        Config config = Config::from_environment();
        if (result.count("db"))
            config.cache_dir = result["db"].as<std::string>();
        if (result.count("max-file-size")) {
            std::string value = result["max-file-size"].as<std::string>();
            auto bytes = parse_byte_size(value);
            if (!bytes) {
                std::cerr << "Error: Invalid --max-file-size '" << value << "'" << std::endl;
                return 1;
            }
            config.indexer.max_file_size = *bytes;
        }
        config.indexer.num_threads = result["jobs"].as<unsigned int>();
        config.indexer.verbose = result.count("verbose") > 0;

        Workspace ws(config);

        if (result.count("analyze")) {
            return cmd_analyze(ws, result["analyze"].as<std::string>(), result.count("force") > 0);
        }

        if (result.count("load")) {
            return cmd_load(ws, result["load"].as<std::string>());
        }

        if (result.count("clear-cache")) {
            std::string path = result["clear-cache"].as<std::string>();
            return cmd_clear_cache(ws, path.empty() ? std::nullopt
                                                    : std::optional<std::string>(path));
        }

        if (result.count("list-cached")) {
            return cmd_list_cached(ws);
        }

        bool wants_query = result.count("find") || result.count("deps") ||
                           result.count("dependents") || result.count("call-graph") ||
                           result.count("file-symbols") || result.count("stats");
        if (!wants_query) {
            print_banner();
            std::cout << options.help() << std::endl;
            return 0;
        }

        if (!load_project(ws, result["project"].as<std::string>())) {
            return 1;
        }

        auto depth_or = [&](unsigned int fallback) {
            return result.count("depth") ? result["depth"].as<unsigned int>() : fallback;
        };

        if (result.count("find")) {
            return cmd_find_symbol(ws, result["find"].as<std::string>(),
                                   result["type"].as<std::string>());
        }

        if (result.count("deps")) {
            return cmd_dependencies(ws, result["deps"].as<std::string>(), depth_or(1));
        }

        if (result.count("dependents")) {
            return cmd_dependents(ws, result["dependents"].as<std::string>(), depth_or(1));
        }

        if (result.count("call-graph")) {
            return cmd_call_graph(ws, result["call-graph"].as<std::string>(), depth_or(2));
        }

        if (result.count("file-symbols")) {
            return cmd_file_symbols(ws, result["file-symbols"].as<std::string>());
        }

        return cmd_stats(ws);

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
