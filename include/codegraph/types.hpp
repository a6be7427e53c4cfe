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

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codegraph {

// ============================================================================
// Identifiers
// ============================================================================

// Node ids are strings so they survive the cache round-trip unchanged:
//   declaration  "file:name:line"
//   import site  "file:import:line"
//   call site    "file:line"
using NodeId = std::string;

inline NodeId make_node_id(const std::string &file, const std::string &name, uint32_t line) {
    return file + ":" + name + ":" + std::to_string(line);
}

inline NodeId make_import_site_id(const std::string &file, uint32_t line) {
    return make_node_id(file, "import", line);
}

inline NodeId make_call_site_id(const std::string &file, uint32_t line) {
    return file + ":" + std::to_string(line);
}

// ============================================================================
// Enumerations
// ============================================================================

// Order matches the alternatives of NodeDetails
enum class NodeKind { Function, Class, Variable };

enum class EdgeType { Imports, Calls, Extends };

enum class Direction { Outgoing, Incoming, Both };

// Declaration form of a variable
enum class DeclarationKind { Const, Let, Var };

inline const char *node_kind_to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::Function:
        return "function";
    case NodeKind::Class:
        return "class";
    case NodeKind::Variable:
        return "variable";
    default:
        return "unknown";
    }
}

inline std::optional<NodeKind> node_kind_from_string(const std::string &s) {
    if (s == "function")
        return NodeKind::Function;
    if (s == "class")
        return NodeKind::Class;
    if (s == "variable")
        return NodeKind::Variable;
    return std::nullopt;
}

inline const char *edge_type_to_string(EdgeType type) {
    switch (type) {
    case EdgeType::Imports:
        return "imports";
    case EdgeType::Calls:
        return "calls";
    case EdgeType::Extends:
        return "extends";
    default:
        return "unknown";
    }
}

inline std::optional<EdgeType> edge_type_from_string(const std::string &s) {
    if (s == "imports")
        return EdgeType::Imports;
    if (s == "calls")
        return EdgeType::Calls;
    if (s == "extends")
        return EdgeType::Extends;
    return std::nullopt;
}

inline const char *declaration_kind_to_string(DeclarationKind kind) {
    switch (kind) {
    case DeclarationKind::Const:
        return "const";
    case DeclarationKind::Let:
        return "let";
    case DeclarationKind::Var:
        return "var";
    default:
        return "unknown";
    }
}

inline std::optional<DeclarationKind> declaration_kind_from_string(const std::string &s) {
    if (s == "const")
        return DeclarationKind::Const;
    if (s == "let")
        return DeclarationKind::Let;
    if (s == "var")
        return DeclarationKind::Var;
    return std::nullopt;
}

// ============================================================================
// Nodes
// ============================================================================

struct FunctionInfo {
    std::vector<std::string> params; // Syntax kind of each parameter
    bool is_async = false;
    bool is_generator = false;

    size_t param_count() const { return params.size(); }
};

struct ClassMethod {
    std::string name;
    std::string kind; // constructor | method | get | set
    bool is_static = false;
};

struct ClassProperty {
    std::string name;
    bool is_static = false;
};

struct ClassInfo {
    std::string extends; // Superclass name, empty if none
    std::vector<ClassMethod> methods;
    std::vector<ClassProperty> properties;
};

struct VariableInfo {
    DeclarationKind declaration = DeclarationKind::Let;
};

using NodeDetails = std::variant<FunctionInfo, ClassInfo, VariableInfo>;

// A declared symbol
struct Node {
    std::string name;
    std::string file; // Relative to the project root
    uint32_t line = 0;
    NodeDetails details;

    NodeKind kind() const { return static_cast<NodeKind>(details.index()); }
};

inline bool operator==(const ClassMethod &a, const ClassMethod &b) {
    return a.name == b.name && a.kind == b.kind && a.is_static == b.is_static;
}

inline bool operator==(const ClassProperty &a, const ClassProperty &b) {
    return a.name == b.name && a.is_static == b.is_static;
}

inline bool operator==(const FunctionInfo &a, const FunctionInfo &b) {
    return a.params == b.params && a.is_async == b.is_async && a.is_generator == b.is_generator;
}

inline bool operator==(const ClassInfo &a, const ClassInfo &b) {
    return a.extends == b.extends && a.methods == b.methods && a.properties == b.properties;
}

inline bool operator==(const VariableInfo &a, const VariableInfo &b) {
    return a.declaration == b.declaration;
}

inline bool operator==(const Node &a, const Node &b) {
    return a.name == b.name && a.file == b.file && a.line == b.line && a.details == b.details;
}

// ============================================================================
// Edges
// ============================================================================

struct Edge {
    NodeId from;
    NodeId to;
    EdgeType type;
};

inline bool operator==(const Edge &a, const Edge &b) {
    return a.from == b.from && a.to == b.to && a.type == b.type;
}

// One edge reached by a traversal. Endpoint pointers are null for synthetic
// import and call sites, and stay valid while the owning Graph is alive.
struct Connection {
    NodeId from;
    NodeId to;
    EdgeType type;
    const Node *from_node = nullptr;
    const Node *to_node = nullptr;
};

// ============================================================================
// Facts (per-file output of a FactExtractor)
// ============================================================================

struct ImportFact {
    std::string source;   // Module specifier as written
    std::string imported; // Imported name, "default" or "*"
    std::string local;    // Local binding
    uint32_t line = 0;
};

struct ExportFact {
    std::string exported; // Exported name or "default"
    std::string local;    // Local name, empty for anonymous default exports
    uint32_t line = 0;
};

struct CallFact {
    std::string name; // "callee" or "object.property"
    uint32_t line = 0;
    uint32_t argument_count = 0;
};

struct FileFacts {
    std::vector<Node> declarations;
    std::vector<ImportFact> imports;
    std::vector<ExportFact> exports;
    std::vector<CallFact> calls;
};

} // namespace codegraph
