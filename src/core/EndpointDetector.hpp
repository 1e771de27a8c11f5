#pragma once

#include "core/TreeSitterParser.hpp"
#include "core/QueryEngine.hpp"
#include "core/Dialect.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Strategy level that produced an endpoint
 */
enum class DetectionTier {
    DECORATOR,      // @Controller / @Get composition on typed classes
    CALL_PATTERN,   // router.get('/path', ...) found in the syntax tree
    TEXT_PATTERN    // Regular expressions over raw text
};

std::string_view to_string(DetectionTier tier);

/**
 * @brief One HTTP route declaration
 */
struct EndpointRecord {
    std::string method;                 // Upper case: GET, POST, ..., ALL
    std::optional<std::string> route;   // nullopt when not a plain literal
    std::string file_path;
    int start_line = 1;
    int end_line = 1;
    DetectionTier tier = DetectionTier::CALL_PATTERN;
    std::vector<std::string> handler_refs;  // Bare identifier arguments of the registration

    using Key = std::tuple<std::string, std::optional<std::string>, int>;

    /**
     * @brief Identity used for deduplication across tiers
     */
    Key key() const { return {method, route, start_line}; }

    json to_json() const;
};

/**
 * @brief Source prepared for the tiers
 *
 * `structural` is false when the file could not be parsed without syntax
 * errors, even after the optional-catch repair. `tree` is null in that case.
 */
struct ParsedSource {
    std::string text;
    Dialect dialect = Dialect::JAVASCRIPT;
    std::unique_ptr<Tree> tree;
    bool structural = false;
    bool repaired = false;
};

/**
 * @brief Finds HTTP route declarations with a tiered strategy
 *
 * Tiers run in order and their results are unioned by EndpointRecord::key():
 *  1. decorator composition (typed dialects, structural parse only)
 *  2. structural call-pattern match (structural parse only)
 *  3. text patterns: route calls when the structural parse failed, and
 *     decorator markers when no controller class was found structurally
 *
 * Each tier returns nullopt when it does not apply to the input.
 */
class EndpointDetector {
public:
    EndpointDetector();

    /**
     * @brief Detect endpoints in a file; never throws
     */
    std::vector<EndpointRecord> detect(const std::filesystem::path& filepath);

    std::vector<EndpointRecord> detect_source(std::string_view source,
                                              const std::filesystem::path& filepath,
                                              Dialect dialect);

    /**
     * @brief Parse with the dialect grammar, repairing `catch {` once if needed
     */
    ParsedSource parse(std::string_view source, Dialect dialect);

    std::optional<std::vector<EndpointRecord>> decorator_tier(
        const ParsedSource& parsed, const std::string& file_path);

    std::optional<std::vector<EndpointRecord>> call_pattern_tier(
        const ParsedSource& parsed, const std::string& file_path);

    static std::optional<std::vector<EndpointRecord>> text_pattern_tier(
        const ParsedSource& parsed, const std::string& file_path);

    std::optional<std::vector<EndpointRecord>> decorator_text_tier(
        const ParsedSource& parsed, const std::string& file_path);

    /**
     * @brief Append records whose key is not yet present in `into`
     */
    static void merge_unique(std::vector<EndpointRecord>& into,
                             std::vector<EndpointRecord> more);

    /**
     * @brief Rewrite every `catch {` to bind a throwaway parameter
     * @param replaced Receives the number of rewritten clauses
     */
    static std::string repair_optional_catch(std::string_view source, size_t& replaced);

    /**
     * @brief Cheap text test for files worth scanning
     *
     * True for a route-object verb call or an API-flavoured decorator.
     */
    static bool may_define_endpoints(std::string_view text);

private:
    std::map<Dialect, TreeSitterParser> parsers_;
    std::map<std::pair<QueryType, Dialect>, std::unique_ptr<Query>> queries_;
    QueryEngine query_engine_;

    TreeSitterParser& get_parser_for_dialect(Dialect dialect);
    const Query* get_query(QueryType type, Dialect dialect);

    std::vector<TSNode> controller_classes(const ParsedSource& parsed);
};

} // namespace apiscope
