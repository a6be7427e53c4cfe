#include "codegraph/indexer.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace codegraph {

Indexer::Indexer(const IndexerConfig &config, ExtractorFactory factory)
    : config_(config), factory_(std::move(factory)) {
    // Auto-detect thread count if not specified
    if (config_.num_threads == 0) {
        config_.num_threads = std::thread::hardware_concurrency();
        if (config_.num_threads == 0)
            config_.num_threads = 4; // Fallback
    }
}

bool Indexer::should_ignore(const fs::path &relative) const {
    for (const auto &component : relative) {
        const std::string comp = component.string();
        for (const auto &pattern : config_.ignore_patterns) {
            if (comp == pattern) {
                return true;
            }
        }
    }
    return false;
}

bool Indexer::has_supported_extension(const fs::path &path) const {
    const std::string ext = path.extension().string();
    return std::find(config_.extensions.begin(), config_.extensions.end(), ext) !=
           config_.extensions.end();
}

std::vector<std::string> Indexer::discover_files() const {
    std::vector<std::string> files;

    fs::path root(config_.root_path);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        std::cerr << "Error: Path is not a directory: " << config_.root_path << std::endl;
        return files;
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        fs::directory_iterator it(current_dir, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const auto &entry = *it;
            const fs::path relative = entry.path().lexically_relative(root);
            if (should_ignore(relative))
                continue;

            std::error_code type_ec;
            if (entry.is_directory(type_ec)) {
                dirs_to_visit.push_back(entry.path());
            } else if (entry.is_regular_file(type_ec) && has_supported_extension(entry.path())) {
                files.push_back(relative.generic_string());
            }
        }
        if (ec) {
            std::cerr << "Warning: Cannot read directory " << current_dir.string() << ": "
                      << ec.message() << std::endl;
            ec.clear();
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

FileFacts Indexer::parse_file(FactExtractor &extractor, const std::string &relative) const {
    const fs::path full_path = fs::path(config_.root_path) / relative;

    std::error_code ec;
    std::uintmax_t size = fs::file_size(full_path, ec);
    if (ec) {
        throw std::runtime_error("cannot stat file: " + ec.message());
    }
    if (size > config_.max_file_size) {
        throw std::length_error("exceeds maximum file size (" + std::to_string(size) + " > " +
                                std::to_string(config_.max_file_size) + " bytes)");
    }

    std::ifstream file(full_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return extractor.extract(relative, buffer.str());
}

void Indexer::record_skipped(const std::string &path, const std::string &reason) {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cerr << "Skipping " << path << ": " << reason << std::endl;
    }
    std::lock_guard<std::mutex> lock(results_mutex_);
    skipped_.push_back(SkippedFile{path, reason});
}

void Indexer::worker_parse_files(const std::vector<std::string> &files, size_t start_idx,
                                 size_t end_idx, ProjectFacts &all_facts) {
    // tree-sitter parsers are not thread-safe - one extractor per worker
    std::unique_ptr<FactExtractor> extractor;
    try {
        extractor = factory_();
    } catch (const std::exception &e) {
        for (size_t i = start_idx; i < end_idx; ++i) {
            record_skipped(files[i], std::string("extractor unavailable: ") + e.what());
        }
        return;
    }

    // Thread-local storage to minimize lock contention
    std::vector<std::pair<std::string, FileFacts>> local_facts;
    local_facts.reserve(end_idx - start_idx);

    for (size_t i = start_idx; i < end_idx; ++i) {
        const auto &relative = files[i];

        try {
            FileFacts facts = parse_file(*extractor, relative);

            stats_.files_indexed++;
            stats_.declarations_found += facts.declarations.size();
            stats_.imports_found += facts.imports.size();
            stats_.calls_found += facts.calls.size();

            local_facts.emplace_back(relative, std::move(facts));
        } catch (const std::exception &e) {
            record_skipped(relative, e.what());
            continue;
        }

        if (config_.verbose) {
            std::lock_guard<std::mutex> lock(output_mutex_);
            std::cerr << "Parsed: " << relative << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    for (auto &[path, facts] : local_facts) {
        all_facts.emplace(std::move(path), std::move(facts));
    }
}

ProjectFacts Indexer::collect_facts() {
    discovered_files_ = discover_files();
    skipped_.clear();
    stats_.files_indexed = 0;
    stats_.declarations_found = 0;
    stats_.imports_found = 0;
    stats_.calls_found = 0;

    ProjectFacts all_facts;
    if (discovered_files_.empty()) {
        return all_facts;
    }

    if (config_.verbose) {
        std::cerr << "Found " << discovered_files_.size() << " source files to index." << std::endl;
        std::cerr << "Using " << config_.num_threads << " threads." << std::endl;
    }

    // Create worker threads
    std::vector<std::thread> threads;
    size_t files_per_thread =
        (discovered_files_.size() + config_.num_threads - 1) / config_.num_threads;

    for (unsigned int t = 0; t < config_.num_threads; ++t) {
        size_t start_idx = t * files_per_thread;
        size_t end_idx = std::min(start_idx + files_per_thread, discovered_files_.size());

        if (start_idx >= discovered_files_.size())
            break;

        threads.emplace_back(&Indexer::worker_parse_files, this, std::cref(discovered_files_),
                             start_idx, end_idx, std::ref(all_facts));
    }

    // Wait for all threads
    for (auto &t : threads) {
        t.join();
    }

    std::sort(skipped_.begin(), skipped_.end(),
              [](const SkippedFile &a, const SkippedFile &b) { return a.path < b.path; });
    return all_facts;
}

Graph Indexer::index() {
    ProjectFacts facts = collect_facts();

    // Resolution sees every file's facts before any cross-file edge is made
    Graph graph;
    graph.metadata().project_path = config_.root_path;
    Resolver resolver(graph);
    build_stats_ = resolver.resolve(facts);
    build_stats_.file_count = discovered_files_.size();

    if (config_.verbose) {
        std::cerr << "\nIndexing complete." << std::endl;
        std::cerr << "  Files indexed: " << stats_.files_indexed.load() << std::endl;
        std::cerr << "  Files skipped: " << skipped_.size() << std::endl;
        std::cerr << "  Declarations found: " << stats_.declarations_found.load() << std::endl;
        std::cerr << "  Imports found: " << stats_.imports_found.load() << std::endl;
        std::cerr << "  Calls found: " << stats_.calls_found.load() << std::endl;
        std::cerr << "  Nodes: " << build_stats_.node_count << ", edges: "
                  << build_stats_.edge_count << std::endl;
    }

    return graph;
}

} // namespace codegraph
