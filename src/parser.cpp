#include "codegraph/parser.hpp"
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace codegraph {

namespace {

using TreePtr = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

TSNode field(TSNode node, const char *name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(strlen(name)));
}

uint32_t line_of(TSNode node) { return ts_node_start_point(node).row + 1; }

// True if node has an anonymous child token spelled exactly like token
bool has_token(TSNode node, const char *token) {
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_is_named(child) && strcmp(ts_node_type(child), token) == 0) {
            return true;
        }
    }
    return false;
}

bool is_type(TSNode node, const char *type) { return strcmp(ts_node_type(node), type) == 0; }

// Walks one syntax tree and records the facts the resolver consumes
class FactCollector {
public:

    FactCollector(const std::string &path, const std::string &source)
        : path_(path), source_(source) {}

    void collect(TSNode root);

    FileFacts take() { return std::move(facts_); }

private:

    const std::string &path_;
    const std::string &source_;
    FileFacts facts_;

    std::string node_text(TSNode node) const;

    void visit_nodes(TSNode node, const std::function<void(TSNode)> &visitor) const;

    void on_import(TSNode node);
    void on_function(TSNode node);
    void on_class(TSNode node);
    void on_variables(TSNode node, DeclarationKind kind);
    void on_export(TSNode node);
    void on_call(TSNode node);

    std::string superclass_name(TSNode heritage) const;
};

std::string FactCollector::node_text(TSNode node) const {
    if (ts_node_is_null(node))
        return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

void FactCollector::visit_nodes(TSNode node, const std::function<void(TSNode)> &visitor) const {
    // Use iterative approach with explicit stack to avoid recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        visitor(current);

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

void FactCollector::collect(TSNode root) {
    visit_nodes(root, [&](TSNode node) {
        const char *type = ts_node_type(node);

        if (strcmp(type, "import_statement") == 0) {
            on_import(node);
        } else if (strcmp(type, "function_declaration") == 0 ||
                   strcmp(type, "generator_function_declaration") == 0) {
            on_function(node);
        } else if (strcmp(type, "class_declaration") == 0 ||
                   strcmp(type, "abstract_class_declaration") == 0) {
            on_class(node);
        } else if (strcmp(type, "lexical_declaration") == 0) {
            TSNode kind_token = ts_node_child(node, 0);
            on_variables(node, is_type(kind_token, "const") ? DeclarationKind::Const
                                                            : DeclarationKind::Let);
        } else if (strcmp(type, "variable_declaration") == 0) {
            on_variables(node, DeclarationKind::Var);
        } else if (strcmp(type, "export_statement") == 0) {
            on_export(node);
        } else if (strcmp(type, "call_expression") == 0) {
            on_call(node);
        }
    });
}

void FactCollector::on_import(TSNode node) {
    TSNode source_node = field(node, "source");
    if (ts_node_is_null(source_node))
        return;

    // Strip the quotes of the string literal
    std::string source = node_text(source_node);
    if (source.size() >= 2) {
        source = source.substr(1, source.size() - 2);
    }
    uint32_t line = line_of(node);

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode clause = ts_node_named_child(node, i);
        if (!is_type(clause, "import_clause"))
            continue;

        uint32_t clause_count = ts_node_named_child_count(clause);
        for (uint32_t k = 0; k < clause_count; ++k) {
            TSNode spec = ts_node_named_child(clause, k);

            if (is_type(spec, "identifier")) {
                facts_.imports.push_back(ImportFact{source, "default", node_text(spec), line});
            } else if (is_type(spec, "namespace_import")) {
                uint32_t ns_count = ts_node_named_child_count(spec);
                for (uint32_t n = 0; n < ns_count; ++n) {
                    TSNode ident = ts_node_named_child(spec, n);
                    if (is_type(ident, "identifier")) {
                        facts_.imports.push_back(ImportFact{source, "*", node_text(ident), line});
                    }
                }
            } else if (is_type(spec, "named_imports")) {
                uint32_t named_count = ts_node_named_child_count(spec);
                for (uint32_t n = 0; n < named_count; ++n) {
                    TSNode item = ts_node_named_child(spec, n);
                    if (!is_type(item, "import_specifier"))
                        continue;
                    std::string imported = node_text(field(item, "name"));
                    TSNode alias = field(item, "alias");
                    std::string local = ts_node_is_null(alias) ? imported : node_text(alias);
                    facts_.imports.push_back(ImportFact{source, imported, local, line});
                }
            }
        }
    }
}

void FactCollector::on_function(TSNode node) {
    TSNode name_node = field(node, "name");
    if (ts_node_is_null(name_node))
        return;

    FunctionInfo fn;
    TSNode params = field(node, "parameters");
    if (!ts_node_is_null(params)) {
        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode param = ts_node_named_child(params, i);
            if (!is_type(param, "comment")) {
                fn.params.push_back(ts_node_type(param));
            }
        }
    }
    fn.is_async = has_token(node, "async");
    fn.is_generator = is_type(node, "generator_function_declaration") || has_token(node, "*");

    facts_.declarations.push_back(Node{node_text(name_node), path_, line_of(node), std::move(fn)});
}

std::string FactCollector::superclass_name(TSNode heritage) const {
    uint32_t count = ts_node_named_child_count(heritage);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(heritage, i);

        // TypeScript wraps the superclass in an extends_clause
        if (is_type(child, "extends_clause")) {
            TSNode value = field(child, "value");
            if (ts_node_is_null(value) && ts_node_named_child_count(child) > 0) {
                value = ts_node_named_child(child, 0);
            }
            return (!ts_node_is_null(value) && is_type(value, "identifier")) ? node_text(value)
                                                                             : "";
        }
        if (is_type(child, "implements_clause") || is_type(child, "comment"))
            continue;

        // Only plain identifiers name a class; member expressions are not resolved
        return is_type(child, "identifier") ? node_text(child) : "";
    }
    return "";
}

void FactCollector::on_class(TSNode node) {
    TSNode name_node = field(node, "name");
    if (ts_node_is_null(name_node))
        return;

    ClassInfo cls;

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (is_type(child, "class_heritage")) {
            cls.extends = superclass_name(child);
        }
    }

    TSNode body = field(node, "body");
    if (!ts_node_is_null(body)) {
        uint32_t member_count = ts_node_named_child_count(body);
        for (uint32_t i = 0; i < member_count; ++i) {
            TSNode member = ts_node_named_child(body, i);

            if (is_type(member, "method_definition")) {
                ClassMethod method;
                method.name = node_text(field(member, "name"));
                if (has_token(member, "get")) {
                    method.kind = "get";
                } else if (has_token(member, "set")) {
                    method.kind = "set";
                } else if (method.name == "constructor") {
                    method.kind = "constructor";
                } else {
                    method.kind = "method";
                }
                method.is_static = has_token(member, "static");
                cls.methods.push_back(std::move(method));
            } else if (is_type(member, "field_definition")) {
                cls.properties.push_back(
                    ClassProperty{node_text(field(member, "property")), has_token(member, "static")});
            } else if (is_type(member, "public_field_definition")) {
                cls.properties.push_back(
                    ClassProperty{node_text(field(member, "name")), has_token(member, "static")});
            }
        }
    }

    facts_.declarations.push_back(Node{node_text(name_node), path_, line_of(node), std::move(cls)});
}

void FactCollector::on_variables(TSNode node, DeclarationKind kind) {
    uint32_t line = line_of(node);
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode declarator = ts_node_named_child(node, i);
        if (!is_type(declarator, "variable_declarator"))
            continue;

        // Destructuring patterns are not recorded
        TSNode name_node = field(declarator, "name");
        if (ts_node_is_null(name_node) || !is_type(name_node, "identifier"))
            continue;

        facts_.declarations.push_back(Node{node_text(name_node), path_, line, VariableInfo{kind}});
    }
}

void FactCollector::on_export(TSNode node) {
    uint32_t line = line_of(node);
    TSNode declaration = field(node, "declaration");

    if (has_token(node, "default")) {
        std::string local;
        if (!ts_node_is_null(declaration)) {
            local = node_text(field(declaration, "name"));
        } else {
            TSNode value = field(node, "value");
            if (!ts_node_is_null(value) && is_type(value, "identifier")) {
                local = node_text(value);
            }
        }
        facts_.exports.push_back(ExportFact{"default", local, line});
        return;
    }

    // export const x = ... / export function f() - declarations are visited on their own
    if (!ts_node_is_null(declaration))
        return;

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode clause = ts_node_named_child(node, i);
        if (!is_type(clause, "export_clause"))
            continue;

        uint32_t spec_count = ts_node_named_child_count(clause);
        for (uint32_t k = 0; k < spec_count; ++k) {
            TSNode spec = ts_node_named_child(clause, k);
            if (!is_type(spec, "export_specifier"))
                continue;
            std::string local = node_text(field(spec, "name"));
            TSNode alias = field(spec, "alias");
            std::string exported = ts_node_is_null(alias) ? local : node_text(alias);
            facts_.exports.push_back(ExportFact{exported, local, line});
        }
    }
}

void FactCollector::on_call(TSNode node) {
    TSNode callee = field(node, "function");
    if (ts_node_is_null(callee))
        return;

    std::string name;
    if (is_type(callee, "identifier")) {
        name = node_text(callee);
    } else if (is_type(callee, "member_expression")) {
        // obj.method() - only when the object is a plain identifier
        TSNode object = field(callee, "object");
        TSNode property = field(callee, "property");
        if (!ts_node_is_null(object) && !ts_node_is_null(property) &&
            is_type(object, "identifier")) {
            name = node_text(object) + "." + node_text(property);
        }
    }
    if (name.empty())
        return;

    uint32_t argument_count = 0;
    TSNode args = field(node, "arguments");
    if (!ts_node_is_null(args)) {
        uint32_t count = ts_node_named_child_count(args);
        for (uint32_t i = 0; i < count; ++i) {
            if (!is_type(ts_node_named_child(args, i), "comment"))
                ++argument_count;
        }
    }

    facts_.calls.push_back(CallFact{name, line_of(node), argument_count});
}

} // namespace

TreeSitterExtractor::TreeSitterExtractor() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }
}

TreeSitterExtractor::~TreeSitterExtractor() {
    if (parser_) ts_parser_delete(parser_);
}

FileFacts TreeSitterExtractor::extract(const std::string &path, const std::string &source) {
    const TSLanguage *ts_lang = nullptr;
    switch (grammar_from_extension(std::filesystem::path(path).extension().string())) {
        case Grammar::JavaScript:
            ts_lang = tree_sitter_javascript();
            break;
        case Grammar::TypeScript:
            ts_lang = tree_sitter_typescript();
            break;
        case Grammar::Tsx:
            ts_lang = tree_sitter_tsx();
            break;
        default:
            throw std::runtime_error("Unsupported file type: " + path);
    }

    if (!ts_parser_set_language(parser_, ts_lang)) {
        throw std::runtime_error("Failed to set parser language for " + path);
    }

    TreePtr tree(ts_parser_parse_string(parser_, nullptr, source.c_str(),
                                        static_cast<uint32_t>(source.size())),
                 &ts_tree_delete);
    if (!tree) {
        throw std::runtime_error("Failed to parse " + path);
    }

    // Syntax errors are recovered by tree-sitter; facts from the valid parts are kept
    FactCollector collector(path, source);
    collector.collect(ts_tree_root_node(tree.get()));
    return collector.take();
}

std::unique_ptr<FactExtractor> create_extractor() {
    return std::make_unique<TreeSitterExtractor>();
}

} // namespace codegraph
