#pragma once

#include "workspace.hpp"
#include <optional>
#include <string>

namespace codegraph {

// Command handlers - print indented JSON to stdout, return the exit code
int cmd_analyze(Workspace &ws, const std::string &path, bool force);
int cmd_load(Workspace &ws, const std::string &path);
int cmd_clear_cache(Workspace &ws, const std::optional<std::string> &path);
int cmd_list_cached(const Workspace &ws);
int cmd_find_symbol(const Workspace &ws, const std::string &query, const std::string &type);
int cmd_dependencies(const Workspace &ws, const std::string &symbol_id, unsigned depth);
int cmd_dependents(const Workspace &ws, const std::string &symbol_id, unsigned depth);
int cmd_call_graph(const Workspace &ws, const std::string &function_name, unsigned depth);
int cmd_file_symbols(const Workspace &ws, const std::string &filepath);
int cmd_stats(const Workspace &ws);

// Helper functions
bool load_project(Workspace &ws, const std::string &project_path);
json metadata_to_json(const GraphMetadata &metadata);
json connection_to_json(const Connection &conn);
json symbol_to_json(const SymbolMatch &match, bool with_score);

} // namespace codegraph
