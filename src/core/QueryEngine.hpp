#pragma once

#include "core/TreeSitterParser.hpp"
#include "core/Dialect.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

// Need full tree-sitter API for TSNode in QueryMatch
extern "C" {
    #include <tree_sitter/api.h>
}

namespace apiscope {

/**
 * @brief Represents a single query capture
 *
 * Lines are 1-based and inclusive.
 */
struct QueryMatch {
    std::string capture_name;  // Name of the capture without '@'
    TSNode node;               // The captured node
    int start_line;
    int end_line;
    uint32_t column;           // Column number (0-based)
    std::string text;          // Text content of the captured node
};

/**
 * @brief All captures produced by one pattern match
 */
struct QueryMatchGroup {
    uint32_t pattern_index;
    std::vector<QueryMatch> captures;

    /**
     * @brief First capture with the given name, or nullptr
     */
    const QueryMatch* find(std::string_view capture_name) const;
};

/**
 * @brief RAII wrapper for TSQuery from tree-sitter
 *
 * Manages the lifetime of a compiled tree-sitter query.
 */
class Query {
public:
    explicit Query(TSQuery* query);
    ~Query();

    // Delete copy operations
    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;

    // Move operations
    Query(Query&& other) noexcept;
    Query& operator=(Query&& other) noexcept;

    TSQuery* get() const { return query_; }

    uint32_t pattern_count() const;

    uint32_t capture_count() const;

    /**
     * @brief Get the name of a capture by index
     */
    std::string capture_name(uint32_t index) const;

private:
    TSQuery* query_;
};

/**
 * @brief Types of predefined queries
 */
enum class QueryType {
    SYMBOLS,       // Declarations, call sites, import/require statements
    IDENTIFIERS,   // Every identifier occurrence (import usage scan)
    ROUTE_CALLS,   // Member calls shaped like `object.verb(...)`
    CLASSES        // Class declarations, for decorator inspection
};

/**
 * @brief Engine for executing tree-sitter queries on syntax trees
 *
 * Compiles S-expression queries against a dialect's grammar and runs them
 * over parsed trees.
 */
class QueryEngine {
public:
    /**
     * @brief Compile a tree-sitter query from S-expression syntax
     * @param query_string S-expression query string
     * @param dialect Grammar the query is checked against
     * @return Unique pointer to compiled query, or nullptr on error
     */
    std::unique_ptr<Query> compile_query(std::string_view query_string, Dialect dialect);

    /**
     * @brief Execute a query and flatten every capture
     */
    std::vector<QueryMatch> execute(
        const Tree& tree,
        const Query& query,
        std::string_view source
    );

    /**
     * @brief Execute a query keeping captures grouped per pattern match
     */
    std::vector<QueryMatchGroup> execute_grouped(
        const Tree& tree,
        const Query& query,
        std::string_view source
    );

    /**
     * @brief Get predefined query string for a query type and dialect
     * @return Query string if available, empty optional otherwise
     */
    static std::optional<std::string_view> get_predefined_query(QueryType type, Dialect dialect);

private:
    QueryMatch make_match(const Query& query, const TSQueryCapture& capture,
                          std::string_view source) const;
};

} // namespace apiscope
