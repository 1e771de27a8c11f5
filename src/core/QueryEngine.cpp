#include "core/QueryEngine.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

// Tree-sitter C API
extern "C" {
    #include <tree_sitter/api.h>
}

namespace apiscope {

namespace {

// Shared between the plain and typed grammars. Class names differ
// (identifier vs type_identifier) and are prepended per dialect.
constexpr std::string_view kCommonSymbolPatterns = R"(
(function_declaration
    name: (identifier) @func-name) @function

(generator_function_declaration
    name: (identifier) @func-name) @function

(variable_declarator
    name: (identifier) @var-name) @variable

(call_expression
    function: (identifier) @called-func) @func-call

(call_expression
    function: (member_expression
        property: (property_identifier) @method-name)) @method-call

(import_statement
    source: (string) @import-source) @import

(variable_declarator
    name: (identifier) @require-name
    value: (call_expression
        function: (identifier) @require-func
        arguments: (arguments . (string) @require-source))) @require

(variable_declarator
    name: (object_pattern) @require-pattern
    value: (call_expression
        function: (identifier) @require-func
        arguments: (arguments . (string) @require-source))) @require
)";

constexpr std::string_view kJavaScriptSymbols = R"(
(class_declaration
    name: (identifier) @class-name) @class
)";

constexpr std::string_view kTypeScriptSymbols = R"(
(class_declaration
    name: (type_identifier) @class-name) @class

(abstract_class_declaration
    name: (type_identifier) @class-name) @class
)";

constexpr std::string_view kRouteCalls = R"(
(call_expression
    function: (member_expression
        object: (_) @object
        property: (property_identifier) @verb)
    arguments: (arguments) @arguments) @call
)";

std::string symbols_query(Dialect dialect) {
    std::string query(DialectUtils::is_typed(dialect) ? kTypeScriptSymbols : kJavaScriptSymbols);
    query += kCommonSymbolPatterns;
    return query;
}

}  // namespace

// ============================================================================
// QueryMatchGroup implementation
// ============================================================================

const QueryMatch* QueryMatchGroup::find(std::string_view capture_name) const {
    for (const auto& capture : captures) {
        if (capture.capture_name == capture_name) {
            return &capture;
        }
    }
    return nullptr;
}

// ============================================================================
// Query implementation
// ============================================================================

Query::Query(TSQuery* query) : query_(query) {
    if (!query_) {
        throw std::invalid_argument("Cannot create Query with nullptr");
    }
}

Query::~Query() {
    if (query_) {
        ts_query_delete(query_);
    }
}

Query::Query(Query&& other) noexcept : query_(other.query_) {
    other.query_ = nullptr;
}

Query& Query::operator=(Query&& other) noexcept {
    if (this != &other) {
        if (query_) {
            ts_query_delete(query_);
        }
        query_ = other.query_;
        other.query_ = nullptr;
    }
    return *this;
}

uint32_t Query::pattern_count() const {
    return ts_query_pattern_count(query_);
}

uint32_t Query::capture_count() const {
    return ts_query_capture_count(query_);
}

std::string Query::capture_name(uint32_t index) const {
    uint32_t length;
    const char* name = ts_query_capture_name_for_id(query_, index, &length);
    return std::string(name, length);
}

// ============================================================================
// QueryEngine implementation
// ============================================================================

std::unique_ptr<Query> QueryEngine::compile_query(std::string_view query_string, Dialect dialect) {
    const TSLanguage* language = DialectUtils::get_ts_language(dialect);
    if (!language) {
        spdlog::error("Unsupported dialect for query compilation: {}",
                      DialectUtils::to_string(dialect));
        return nullptr;
    }

    uint32_t error_offset;
    TSQueryError error_type;

    TSQuery* raw_query = ts_query_new(
        language,
        query_string.data(),
        static_cast<uint32_t>(query_string.size()),
        &error_offset,
        &error_type
    );

    if (!raw_query) {
        spdlog::warn("Failed to compile query for {} at offset {}: error type {}",
                     DialectUtils::to_string(dialect), error_offset, static_cast<int>(error_type));
        return nullptr;
    }

    return std::make_unique<Query>(raw_query);
}

QueryMatch QueryEngine::make_match(const Query& query, const TSQueryCapture& capture,
                                   std::string_view source) const {
    QueryMatch result;
    result.node = capture.node;
    result.capture_name = query.capture_name(capture.index);

    TSPoint start_point = ts_node_start_point(capture.node);
    TSPoint end_point = ts_node_end_point(capture.node);
    result.start_line = static_cast<int>(start_point.row) + 1;
    result.end_line = static_cast<int>(end_point.row) + 1;
    result.column = start_point.column;
    result.text = TreeSitterParser::node_text(capture.node, source);

    return result;
}

std::vector<QueryMatch> QueryEngine::execute(
    const Tree& tree,
    const Query& query,
    std::string_view source
) {
    std::vector<QueryMatch> results;
    for (auto& group : execute_grouped(tree, query, source)) {
        for (auto& capture : group.captures) {
            results.push_back(std::move(capture));
        }
    }
    return results;
}

std::vector<QueryMatchGroup> QueryEngine::execute_grouped(
    const Tree& tree,
    const Query& query,
    std::string_view source
) {
    std::vector<QueryMatchGroup> results;

    TSQueryCursor* cursor = ts_query_cursor_new();
    if (!cursor) {
        throw std::runtime_error("Failed to create query cursor");
    }

    ts_query_cursor_exec(cursor, query.get(), tree.root_node());

    TSQueryMatch match;
    while (ts_query_cursor_next_match(cursor, &match)) {
        QueryMatchGroup group;
        group.pattern_index = match.pattern_index;
        group.captures.reserve(match.capture_count);
        for (uint32_t i = 0; i < match.capture_count; i++) {
            group.captures.push_back(make_match(query, match.captures[i], source));
        }
        results.push_back(std::move(group));
    }

    ts_query_cursor_delete(cursor);

    spdlog::trace("Query executed with {} matches", results.size());

    return results;
}

std::optional<std::string_view> QueryEngine::get_predefined_query(QueryType type, Dialect dialect) {
    // Built once per dialect; the views stay valid for the process lifetime.
    static const std::string js_symbols = symbols_query(Dialect::JAVASCRIPT);
    static const std::string ts_symbols = symbols_query(Dialect::TYPESCRIPT);

    if (dialect == Dialect::UNKNOWN) {
        return std::nullopt;
    }

    bool typed = DialectUtils::is_typed(dialect);

    switch (type) {
        case QueryType::SYMBOLS:
            return typed ? std::string_view(ts_symbols) : std::string_view(js_symbols);
        case QueryType::IDENTIFIERS:
            if (typed) {
                return "[(identifier) (shorthand_property_identifier) (type_identifier)] @ident";
            }
            return "[(identifier) (shorthand_property_identifier)] @ident";
        case QueryType::ROUTE_CALLS:
            return kRouteCalls;
        case QueryType::CLASSES:
            if (typed) {
                return "[(class_declaration) (abstract_class_declaration)] @class";
            }
            return "(class_declaration) @class";
        default:
            return std::nullopt;
    }
}

} // namespace apiscope
