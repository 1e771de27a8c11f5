#include "core/SymbolExtractor.hpp"
#include "core/SourceFile.hpp"
#include <spdlog/spdlog.h>
#include <set>
#include <system_error>
#include <unordered_map>

namespace apiscope {

namespace {

int start_line_of(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

int end_line_of(TSNode node) {
    return static_cast<int>(ts_node_end_point(node).row) + 1;
}

std::string_view node_type(TSNode node) {
    return ts_node_type(node);
}

// Widen a declaration node to the statement a reader would copy:
// `const x = ...;` for a declarator, `export ...` for an exported declaration.
TSNode widen_declaration(TSNode node) {
    TSNode parent = ts_node_parent(node);
    if (!ts_node_is_null(parent)) {
        auto type = node_type(parent);
        if (type == "lexical_declaration" || type == "variable_declaration") {
            node = parent;
            parent = ts_node_parent(node);
        }
    }
    if (!ts_node_is_null(parent) && node_type(parent) == "export_statement") {
        node = parent;
    }
    return node;
}

Declaration make_declaration(std::string name, TSNode node) {
    TSNode widened = widen_declaration(node);
    return Declaration{std::move(name), start_line_of(widened), end_line_of(widened)};
}

std::string strip_quotes(std::string text) {
    if (text.size() >= 2) {
        char first = text.front();
        if ((first == '"' || first == '\'' || first == '`') && text.back() == first) {
            return text.substr(1, text.size() - 2);
        }
    }
    return text;
}

struct ImportBinding {
    std::string imported_name;
    std::string local_name;
};

// Bindings introduced by an ES import statement.
std::vector<ImportBinding> import_bindings(TSNode statement, std::string_view source) {
    std::vector<ImportBinding> bindings;

    uint32_t count = ts_node_named_child_count(statement);
    for (uint32_t i = 0; i < count; i++) {
        TSNode clause = ts_node_named_child(statement, i);
        if (node_type(clause) != "import_clause") {
            continue;
        }

        uint32_t parts = ts_node_named_child_count(clause);
        for (uint32_t j = 0; j < parts; j++) {
            TSNode part = ts_node_named_child(clause, j);
            auto type = node_type(part);

            if (type == "identifier") {
                std::string name = TreeSitterParser::node_text(part, source);
                bindings.push_back({name, name});
            } else if (type == "namespace_import") {
                std::string local;
                uint32_t n = ts_node_named_child_count(part);
                if (n > 0) {
                    local = TreeSitterParser::node_text(ts_node_named_child(part, n - 1), source);
                }
                bindings.push_back({std::string(ImportRecord::kNamespaceImport), local});
            } else if (type == "named_imports") {
                uint32_t specs = ts_node_named_child_count(part);
                for (uint32_t k = 0; k < specs; k++) {
                    TSNode spec = ts_node_named_child(part, k);
                    if (node_type(spec) != "import_specifier") {
                        continue;
                    }
                    TSNode name_node = ts_node_child_by_field_name(spec, "name", 4);
                    TSNode alias_node = ts_node_child_by_field_name(spec, "alias", 5);
                    if (ts_node_is_null(name_node)) {
                        continue;
                    }
                    std::string name = strip_quotes(TreeSitterParser::node_text(name_node, source));
                    std::string local = ts_node_is_null(alias_node)
                        ? name : TreeSitterParser::node_text(alias_node, source);
                    bindings.push_back({name, local});
                }
            }
        }
    }

    if (bindings.empty()) {
        // Side-effect import: import './polyfills';
        bindings.push_back({std::string(ImportRecord::kNamespaceImport), ""});
    }

    return bindings;
}

// Bindings introduced by `const { a, b: c } = require(...)`.
std::vector<ImportBinding> pattern_bindings(TSNode pattern, std::string_view source) {
    std::vector<ImportBinding> bindings;

    uint32_t count = ts_node_named_child_count(pattern);
    for (uint32_t i = 0; i < count; i++) {
        TSNode entry = ts_node_named_child(pattern, i);
        auto type = node_type(entry);

        if (type == "shorthand_property_identifier_pattern") {
            std::string name = TreeSitterParser::node_text(entry, source);
            bindings.push_back({name, name});
        } else if (type == "pair_pattern") {
            TSNode key = ts_node_child_by_field_name(entry, "key", 3);
            TSNode value = ts_node_child_by_field_name(entry, "value", 5);
            if (ts_node_is_null(key) || ts_node_is_null(value) ||
                node_type(value) != "identifier") {
                continue;
            }
            bindings.push_back({
                strip_quotes(TreeSitterParser::node_text(key, source)),
                TreeSitterParser::node_text(value, source)
            });
        }
    }

    return bindings;
}

}  // namespace

SymbolExtractor::SymbolExtractor()
    : parsers_(), queries_(), symbol_query_overrides_(), query_engine_() {
    spdlog::debug("SymbolExtractor created");
}

TreeSitterParser& SymbolExtractor::get_parser_for_dialect(Dialect dialect) {
    auto it = parsers_.find(dialect);
    if (it != parsers_.end()) {
        return it->second;
    }

    auto [new_it, inserted] = parsers_.emplace(
        std::piecewise_construct,
        std::forward_as_tuple(dialect),
        std::forward_as_tuple(dialect)
    );

    return new_it->second;
}

void SymbolExtractor::override_symbol_query(Dialect dialect, std::string query_string) {
    symbol_query_overrides_[dialect] = std::move(query_string);
    queries_.erase({QueryType::SYMBOLS, dialect});
}

const Query& SymbolExtractor::get_query(QueryType type, Dialect dialect) {
    auto key = std::make_pair(type, dialect);
    auto it = queries_.find(key);
    if (it != queries_.end()) {
        return *it->second;
    }

    std::optional<std::string_view> query_str;
    auto override_it = symbol_query_overrides_.find(dialect);
    if (type == QueryType::SYMBOLS && override_it != symbol_query_overrides_.end()) {
        query_str = override_it->second;
    } else {
        query_str = QueryEngine::get_predefined_query(type, dialect);
    }

    if (!query_str) {
        throw ParseError("No query available for dialect " +
                         std::string(DialectUtils::to_string(dialect)));
    }

    auto query = query_engine_.compile_query(*query_str, dialect);
    if (!query) {
        throw ParseError("Query does not match the " +
                         std::string(DialectUtils::to_string(dialect)) + " grammar");
    }

    auto [new_it, inserted] = queries_.emplace(key, std::move(query));
    return *new_it->second;
}

FileInventory SymbolExtractor::extract(const std::filesystem::path& filepath,
                                       const std::filesystem::path& base_directory) {
    auto source = read_source(filepath);
    if (!source) {
        throw ParseError("Failed to read file: " + filepath.string());
    }

    Dialect dialect = DialectUtils::select(filepath);
    if (dialect == Dialect::UNKNOWN) {
        spdlog::debug("Unsupported extension for {}, using plain script", filepath.string());
        dialect = Dialect::JAVASCRIPT;
    }

    std::filesystem::path base = base_directory.empty() ? filepath.parent_path() : base_directory;
    return extract_source(*source, filepath, dialect, base);
}

FileInventory SymbolExtractor::extract_source(std::string_view source,
                                              const std::filesystem::path& filepath,
                                              Dialect dialect,
                                              const std::filesystem::path& base_directory) {
    try {
        return extract_with_dialect(source, filepath, dialect, base_directory);
    } catch (const ParseError& e) {
        if (!DialectUtils::is_typed(dialect)) {
            throw;
        }
        spdlog::warn("{}: {} extraction failed ({}), retrying as plain script",
                     filepath.string(), DialectUtils::to_string(dialect), e.what());
    }

    FileInventory inventory = extract_with_dialect(source, filepath, Dialect::JAVASCRIPT, base_directory);
    inventory.dialect = dialect;
    inventory.used_fallback = true;
    return inventory;
}

FileInventory SymbolExtractor::extract_with_dialect(std::string_view source,
                                                    const std::filesystem::path& filepath,
                                                    Dialect dialect,
                                                    const std::filesystem::path& base_directory) {
    TreeSitterParser& parser = get_parser_for_dialect(dialect);
    auto tree = parser.parse_string(source);
    if (!tree) {
        throw ParseError("Failed to parse " + filepath.string());
    }

    const Query& query = get_query(QueryType::SYMBOLS, dialect);
    auto groups = query_engine_.execute_grouped(*tree, query, source);

    FileInventory inventory;
    inventory.filename = filepath.string();
    inventory.dialect = dialect;

    std::vector<std::pair<int, int>> import_spans;

    auto add_imports = [&](const std::vector<ImportBinding>& found, const std::string& module,
                           TSNode statement) {
        Origin origin = ModuleResolver::resolve(module, base_directory);
        std::error_code ec;
        bool exists = origin.has_path() && std::filesystem::exists(origin.path, ec);
        int first = start_line_of(statement);
        int last = end_line_of(statement);

        for (const auto& binding : found) {
            ImportRecord record;
            record.imported_name = binding.imported_name;
            record.local_name = binding.local_name;
            record.from_module = module;
            record.origin = origin;
            record.line = first;
            record.path_exists = exists;
            inventory.imports.push_back(std::move(record));
            import_spans.emplace_back(first, last);
        }
    };

    for (const auto& group : groups) {
        const QueryMatch* class_name = group.find("class-name");
        const QueryMatch* func_name = group.find("func-name");
        const QueryMatch* require_source = group.find("require-source");
        const QueryMatch* var_name = group.find("var-name");
        const QueryMatch* called_func = group.find("called-func");
        const QueryMatch* method_name = group.find("method-name");
        const QueryMatch* import_source = group.find("import-source");

        if (class_name) {
            if (const auto* decl = group.find("class")) {
                inventory.classes.push_back(make_declaration(class_name->text, decl->node));
            }
        } else if (func_name) {
            if (const auto* decl = group.find("function")) {
                inventory.functions.push_back(make_declaration(func_name->text, decl->node));
            }
        } else if (require_source) {
            const auto* callee = group.find("require-func");
            const auto* statement = group.find("require");
            if (!callee || callee->text != "require" || !statement) {
                continue;
            }
            std::vector<ImportBinding> found;
            if (const auto* binding = group.find("require-name")) {
                found.push_back({binding->text, binding->text});
            } else if (const auto* pattern = group.find("require-pattern")) {
                found = pattern_bindings(pattern->node, source);
            }
            add_imports(found, strip_quotes(require_source->text), statement->node);
        } else if (var_name) {
            if (const auto* decl = group.find("variable")) {
                inventory.variables.push_back(make_declaration(var_name->text, decl->node));
            }
        } else if (called_func) {
            if (const auto* call = group.find("func-call")) {
                inventory.function_calls.push_back(
                    {called_func->text, call->start_line, call->end_line, CallKind::FUNCTION_CALL});
            }
        } else if (method_name) {
            if (const auto* call = group.find("method-call")) {
                inventory.function_calls.push_back(
                    {method_name->text, call->start_line, call->end_line, CallKind::METHOD_CALL});
            }
        } else if (import_source) {
            if (const auto* statement = group.find("import")) {
                add_imports(import_bindings(statement->node, source),
                            strip_quotes(import_source->text), statement->node);
            }
        }
    }

    if (!inventory.imports.empty()) {
        record_usages(*tree, source, dialect, inventory, import_spans);
    }

    spdlog::debug("Extracted {} ({}): {} classes, {} functions, {} variables, {} calls, {} imports",
                  filepath.string(), DialectUtils::to_string(dialect),
                  inventory.classes.size(), inventory.functions.size(),
                  inventory.variables.size(), inventory.function_calls.size(),
                  inventory.imports.size());

    return inventory;
}

void SymbolExtractor::record_usages(const Tree& tree, std::string_view source, Dialect dialect,
                                    FileInventory& inventory,
                                    const std::vector<std::pair<int, int>>& import_spans) {
    std::unordered_map<std::string, std::set<int>> usages;
    for (const auto& imp : inventory.imports) {
        if (!imp.local_name.empty()) {
            usages.emplace(imp.local_name, std::set<int>{});
        }
    }

    const Query& query = get_query(QueryType::IDENTIFIERS, dialect);
    for (const auto& match : query_engine_.execute(tree, query, source)) {
        auto it = usages.find(match.text);
        if (it != usages.end()) {
            it->second.insert(match.start_line);
        }
    }

    for (size_t i = 0; i < inventory.imports.size(); i++) {
        auto& imp = inventory.imports[i];
        auto it = usages.find(imp.local_name);
        if (it == usages.end()) {
            continue;
        }
        auto [first, last] = import_spans[i];
        for (int line : it->second) {
            if (line < first || line > last) {
                imp.usage_lines.push_back(line);
            }
        }
    }
}

} // namespace apiscope
