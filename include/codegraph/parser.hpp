#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declarations for tree-sitter language functions
extern "C" {
const TSLanguage *tree_sitter_javascript();
const TSLanguage *tree_sitter_typescript();
const TSLanguage *tree_sitter_tsx();
}

namespace codegraph {

// Grammar used for a source file
enum class Grammar { Unknown, JavaScript, TypeScript, Tsx };

// Get grammar from file extension
inline Grammar grammar_from_extension(const std::string &ext) {
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs")
        return Grammar::JavaScript;
    if (ext == ".ts")
        return Grammar::TypeScript;
    if (ext == ".tsx")
        return Grammar::Tsx;
    return Grammar::Unknown;
}

// Produces the facts of a single file. Implementations may throw on failure;
// the indexer treats a throw as "no facts for this file".
class FactExtractor {
public:
    virtual ~FactExtractor() = default;

    virtual FileFacts extract(const std::string &path, const std::string &source) = 0;
};

// Creates one extractor per worker thread
using ExtractorFactory = std::function<std::unique_ptr<FactExtractor>()>;

// Fact extractor for JavaScript and TypeScript backed by tree-sitter
class TreeSitterExtractor : public FactExtractor {
public:

    TreeSitterExtractor();
    ~TreeSitterExtractor() override;

    // Non-copyable
    TreeSitterExtractor(const TreeSitterExtractor &) = delete;
    TreeSitterExtractor &operator=(const TreeSitterExtractor &) = delete;

    // Grammar is chosen from the extension of path
    FileFacts extract(const std::string &path, const std::string &source) override;

private:

    TSParser *parser_ = nullptr;
};

// Default factory
std::unique_ptr<FactExtractor> create_extractor();

} // namespace codegraph
