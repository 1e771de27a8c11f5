#pragma once

#include "core/TreeSitterParser.hpp"
#include "core/QueryEngine.hpp"
#include "core/FileInventory.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apiscope {

/**
 * @brief No dialect attempt could produce a structural inventory
 */
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Builds a FileInventory for one source file
 *
 * Parses the file with the dialect picked by DialectUtils::select and runs
 * the predefined SYMBOLS query. If that fails on a typed file, the whole
 * extraction is retried with the plain-script grammar on the same text.
 *
 * Parsers and compiled queries are cached per dialect, so an instance must
 * not be shared between threads.
 */
class SymbolExtractor {
public:
    SymbolExtractor();

    /**
     * @brief Extract the inventory of a file on disk
     * @param filepath Absolute path of the file
     * @param base_directory Directory imports resolve against (default: the file's directory)
     * @throws ParseError if the file cannot be read or no dialect attempt succeeds
     */
    FileInventory extract(const std::filesystem::path& filepath,
                          const std::filesystem::path& base_directory = {});

    /**
     * @brief Extract the inventory of in-memory source
     */
    FileInventory extract_source(std::string_view source,
                                 const std::filesystem::path& filepath,
                                 Dialect dialect,
                                 const std::filesystem::path& base_directory);

    /**
     * @brief Replace the SYMBOLS query used for one dialect
     */
    void override_symbol_query(Dialect dialect, std::string query_string);

private:
    std::map<Dialect, TreeSitterParser> parsers_;
    std::map<std::pair<QueryType, Dialect>, std::unique_ptr<Query>> queries_;
    std::map<Dialect, std::string> symbol_query_overrides_;
    QueryEngine query_engine_;

    TreeSitterParser& get_parser_for_dialect(Dialect dialect);

    /**
     * @brief Compile (once) and return a predefined query
     * @throws ParseError if the query does not compile for the dialect
     */
    const Query& get_query(QueryType type, Dialect dialect);

    FileInventory extract_with_dialect(std::string_view source,
                                       const std::filesystem::path& filepath,
                                       Dialect dialect,
                                       const std::filesystem::path& base_directory);

    void record_usages(const Tree& tree, std::string_view source, Dialect dialect,
                       FileInventory& inventory,
                       const std::vector<std::pair<int, int>>& import_spans);
};

} // namespace apiscope
