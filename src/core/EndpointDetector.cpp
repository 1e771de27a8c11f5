#include "core/EndpointDetector.hpp"
#include "core/RouteHeuristics.hpp"
#include "core/SourceFile.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <iterator>
#include <regex>
#include <set>

namespace apiscope {

namespace {

std::string_view node_type(TSNode node) {
    return ts_node_type(node);
}

int start_line_of(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

int end_line_of(TSNode node) {
    return static_cast<int>(ts_node_end_point(node).row) + 1;
}

const std::regex& optional_catch_pattern() {
    static const std::regex pattern(R"(catch(\s*)\{)");
    return pattern;
}

const std::regex& route_call_pattern() {
    static const std::regex pattern(
        R"(([A-Za-z_$][\w$]*)\s*\.\s*(get|post|put|delete|patch|options|head|all)\s*\(\s*(?:'([^'\n]*)'|"([^"\n]*)"|`([^`]*)`)?)",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& api_decorator_pattern() {
    static const std::regex pattern(
        R"(@\s*(route|get|post|put|delete|patch|options|head|all|api|endpoint|router|controller|module|middleware|rest)\b)",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

struct Decorator {
    std::string name;
    std::optional<std::string> argument;
    int line = 1;
};

// First string or template literal among the named children of `arguments`.
// A template literal with interpolation stops the search with no value.
std::optional<std::string> first_literal_argument(TSNode arguments, std::string_view source) {
    uint32_t count = ts_node_named_child_count(arguments);
    for (uint32_t i = 0; i < count; i++) {
        TSNode arg = ts_node_named_child(arguments, i);
        auto type = node_type(arg);
        if (type == "string" || type == "template_string") {
            return RouteHeuristics::clean_literal(TreeSitterParser::node_text(arg, source));
        }
    }
    return std::nullopt;
}

// `@Controller({ path: 'users' })`
std::optional<std::string> object_path_argument(TSNode arguments, std::string_view source) {
    uint32_t count = ts_node_named_child_count(arguments);
    for (uint32_t i = 0; i < count; i++) {
        TSNode arg = ts_node_named_child(arguments, i);
        if (node_type(arg) != "object") {
            continue;
        }
        uint32_t pairs = ts_node_named_child_count(arg);
        for (uint32_t j = 0; j < pairs; j++) {
            TSNode pair = ts_node_named_child(arg, j);
            if (node_type(pair) != "pair") {
                continue;
            }
            TSNode key = ts_node_child_by_field_name(pair, "key", 3);
            TSNode value = ts_node_child_by_field_name(pair, "value", 5);
            if (ts_node_is_null(key) || ts_node_is_null(value)) {
                continue;
            }
            auto key_text = RouteHeuristics::clean_literal(TreeSitterParser::node_text(key, source));
            auto value_type = node_type(value);
            if (key_text && *key_text == "path" &&
                (value_type == "string" || value_type == "template_string")) {
                return RouteHeuristics::clean_literal(TreeSitterParser::node_text(value, source));
            }
        }
    }
    return std::nullopt;
}

std::optional<Decorator> parse_decorator(TSNode decorator, std::string_view source) {
    if (ts_node_named_child_count(decorator) == 0) {
        return std::nullopt;
    }
    TSNode expr = ts_node_named_child(decorator, 0);
    auto type = node_type(expr);

    Decorator result;
    result.line = start_line_of(decorator);

    if (type == "call_expression") {
        TSNode function = ts_node_child_by_field_name(expr, "function", 8);
        TSNode arguments = ts_node_child_by_field_name(expr, "arguments", 9);
        if (ts_node_is_null(function)) {
            return std::nullopt;
        }
        result.name = TreeSitterParser::node_text(function, source);
        if (!ts_node_is_null(arguments)) {
            result.argument = first_literal_argument(arguments, source);
            if (!result.argument) {
                result.argument = object_path_argument(arguments, source);
            }
        }
    } else if (type == "identifier" || type == "member_expression") {
        result.name = TreeSitterParser::node_text(expr, source);
    } else {
        return std::nullopt;
    }

    // @Nest.Get() and @Get() name the same marker
    auto dot = result.name.rfind('.');
    if (dot != std::string::npos) {
        result.name = result.name.substr(dot + 1);
    }
    return result;
}

void collect_child_decorators(TSNode node, std::vector<TSNode>& out) {
    if (ts_node_is_null(node)) {
        return;
    }
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_named_child(node, i);
        if (node_type(child) == "decorator") {
            out.push_back(child);
        }
    }
}

// Decorators written on a class, including those placed before `export`.
std::vector<TSNode> class_decorators(TSNode class_node) {
    std::vector<TSNode> decorators;
    collect_child_decorators(class_node, decorators);
    TSNode parent = ts_node_parent(class_node);
    if (!ts_node_is_null(parent) && node_type(parent) == "export_statement") {
        collect_child_decorators(parent, decorators);
    }
    return decorators;
}

std::optional<std::string> controller_prefix(TSNode class_node, std::string_view source) {
    for (TSNode decorator : class_decorators(class_node)) {
        auto parsed = parse_decorator(decorator, source);
        if (parsed && RouteHeuristics::to_lower(parsed->name) == "controller") {
            return parsed->argument.value_or("/");
        }
    }
    return std::nullopt;
}

std::optional<std::string> clean_path_literal(const std::string& raw) {
    auto cleaned = RouteHeuristics::clean_literal(raw);
    if (!cleaned || cleaned->empty()) {
        return std::nullopt;
    }
    return cleaned;
}

int find_matching_brace(std::string_view source, size_t open) {
    int depth = 0;
    for (size_t i = open; i < source.size(); i++) {
        if (source[i] == '{') {
            depth++;
        } else if (source[i] == '}') {
            depth--;
            if (depth == 0) {
                return static_cast<int>(i);
            }
        }
    }
    return -1;
}

}  // namespace

std::string_view to_string(DetectionTier tier) {
    switch (tier) {
        case DetectionTier::DECORATOR:
            return "decorator";
        case DetectionTier::CALL_PATTERN:
            return "call_pattern";
        case DetectionTier::TEXT_PATTERN:
        default:
            return "text_pattern";
    }
}

json EndpointRecord::to_json() const {
    return {
        {"type", "function"},
        {"method", method},
        {"route", route ? json(*route) : json(nullptr)},
        {"file_path", file_path},
        {"start_line", start_line},
        {"end_line", end_line},
        {"tier", std::string(apiscope::to_string(tier))},
        {"handlers", handler_refs}
    };
}

// ============================================================================
// EndpointDetector implementation
// ============================================================================

EndpointDetector::EndpointDetector()
    : parsers_(), queries_(), query_engine_() {
}

TreeSitterParser& EndpointDetector::get_parser_for_dialect(Dialect dialect) {
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

const Query* EndpointDetector::get_query(QueryType type, Dialect dialect) {
    auto key = std::make_pair(type, dialect);
    auto it = queries_.find(key);
    if (it != queries_.end()) {
        return it->second.get();
    }

    auto query_str = QueryEngine::get_predefined_query(type, dialect);
    if (!query_str) {
        return nullptr;
    }

    auto query = query_engine_.compile_query(*query_str, dialect);
    auto [new_it, inserted] = queries_.emplace(key, std::move(query));
    return new_it->second.get();
}

std::string EndpointDetector::repair_optional_catch(std::string_view source, size_t& replaced) {
    const std::string text(source);
    replaced = std::distance(
        std::sregex_iterator(text.begin(), text.end(), optional_catch_pattern()),
        std::sregex_iterator());
    if (replaced == 0) {
        return text;
    }
    return std::regex_replace(text, optional_catch_pattern(), "catch (__apiscope_err)$1{");
}

ParsedSource EndpointDetector::parse(std::string_view source, Dialect dialect) {
    ParsedSource parsed;
    parsed.text = std::string(source);
    parsed.dialect = dialect;

    TreeSitterParser& parser = get_parser_for_dialect(dialect);
    if (auto tree = parser.parse_clean(source)) {
        parsed.tree = std::move(tree);
        parsed.structural = true;
        return parsed;
    }

    size_t replaced = 0;
    std::string repaired = repair_optional_catch(source, replaced);
    if (replaced > 0) {
        if (auto retry = parser.parse_clean(repaired)) {
            spdlog::debug("Parsed after rewriting {} optional catch clause(s)", replaced);
            parsed.text = std::move(repaired);
            parsed.tree = std::move(retry);
            parsed.structural = true;
            parsed.repaired = true;
        }
    }

    return parsed;
}

std::vector<TSNode> EndpointDetector::controller_classes(const ParsedSource& parsed) {
    std::vector<TSNode> classes;
    if (!parsed.structural || !DialectUtils::is_typed(parsed.dialect)) {
        return classes;
    }

    const Query* query = get_query(QueryType::CLASSES, parsed.dialect);
    if (!query) {
        return classes;
    }

    for (const auto& match : query_engine_.execute(*parsed.tree, *query, parsed.text)) {
        if (controller_prefix(match.node, parsed.text)) {
            classes.push_back(match.node);
        }
    }
    return classes;
}

std::optional<std::vector<EndpointRecord>> EndpointDetector::decorator_tier(
    const ParsedSource& parsed, const std::string& file_path) {
    auto classes = controller_classes(parsed);
    if (classes.empty()) {
        return std::nullopt;
    }

    std::vector<EndpointRecord> endpoints;
    for (TSNode class_node : classes) {
        auto prefix = controller_prefix(class_node, parsed.text);
        TSNode body = ts_node_child_by_field_name(class_node, "body", 4);
        if (ts_node_is_null(body)) {
            continue;
        }

        // Member decorators are siblings preceding the member in class_body.
        std::vector<TSNode> pending;
        uint32_t count = ts_node_named_child_count(body);
        for (uint32_t i = 0; i < count; i++) {
            TSNode member = ts_node_named_child(body, i);
            auto type = node_type(member);

            if (type == "decorator") {
                pending.push_back(member);
                continue;
            }
            if (type == "comment") {
                continue;
            }
            if (type != "method_definition" && type != "public_field_definition") {
                pending.clear();
                continue;
            }

            std::vector<TSNode> decorators = std::move(pending);
            pending.clear();
            collect_child_decorators(member, decorators);

            for (TSNode decorator : decorators) {
                auto marker = parse_decorator(decorator, parsed.text);
                if (!marker || !RouteHeuristics::is_http_method(marker->name)) {
                    continue;
                }

                EndpointRecord record;
                record.method = RouteHeuristics::to_upper(marker->name);
                record.route = RouteHeuristics::combine_paths(prefix, marker->argument);
                record.file_path = file_path;
                record.start_line = decorators.empty()
                    ? start_line_of(member) : std::min(start_line_of(decorators.front()), start_line_of(member));
                record.end_line = end_line_of(member);
                record.tier = DetectionTier::DECORATOR;
                endpoints.push_back(std::move(record));
                break;
            }
        }
    }

    return endpoints;
}

std::optional<std::vector<EndpointRecord>> EndpointDetector::call_pattern_tier(
    const ParsedSource& parsed, const std::string& file_path) {
    if (!parsed.structural) {
        return std::nullopt;
    }

    const Query* query = get_query(QueryType::ROUTE_CALLS, parsed.dialect);
    if (!query) {
        return std::nullopt;
    }

    std::vector<EndpointRecord> endpoints;
    for (const auto& group : query_engine_.execute_grouped(*parsed.tree, *query, parsed.text)) {
        const auto* verb = group.find("verb");
        const auto* object = group.find("object");
        const auto* arguments = group.find("arguments");
        const auto* call = group.find("call");
        if (!verb || !object || !arguments || !call) {
            continue;
        }
        if (!RouteHeuristics::is_http_method(verb->text) ||
            !RouteHeuristics::looks_like_route_object(object->text)) {
            continue;
        }

        EndpointRecord record;
        record.method = RouteHeuristics::to_upper(verb->text);
        record.route = first_literal_argument(arguments->node, parsed.text);
        record.file_path = file_path;
        record.start_line = call->start_line;
        record.end_line = call->end_line;
        record.tier = DetectionTier::CALL_PATTERN;

        uint32_t count = ts_node_named_child_count(arguments->node);
        for (uint32_t i = 0; i < count; i++) {
            TSNode arg = ts_node_named_child(arguments->node, i);
            if (node_type(arg) == "identifier") {
                record.handler_refs.push_back(TreeSitterParser::node_text(arg, parsed.text));
            }
        }

        endpoints.push_back(std::move(record));
    }

    return endpoints;
}

std::optional<std::vector<EndpointRecord>> EndpointDetector::text_pattern_tier(
    const ParsedSource& parsed, const std::string& file_path) {
    if (parsed.structural) {
        return std::nullopt;
    }

    const std::string& source = parsed.text;
    std::vector<EndpointRecord> endpoints;

    for (auto it = std::sregex_iterator(source.begin(), source.end(), route_call_pattern());
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        if (!RouteHeuristics::looks_like_route_object(match.str(1))) {
            continue;
        }

        EndpointRecord record;
        record.method = RouteHeuristics::to_upper(match.str(2));
        if (match[3].matched) {
            record.route = match.str(3);
        } else if (match[4].matched) {
            record.route = match.str(4);
        } else if (match[5].matched) {
            record.route = RouteHeuristics::clean_literal("`" + match.str(5) + "`");
        }
        record.file_path = file_path;
        record.start_line = line_of_offset(source, static_cast<size_t>(match.position(0)));
        record.end_line = line_of_offset(source, static_cast<size_t>(match.position(0) + match.length(0)));
        record.tier = DetectionTier::TEXT_PATTERN;
        endpoints.push_back(std::move(record));
    }

    return endpoints;
}

std::optional<std::vector<EndpointRecord>> EndpointDetector::decorator_text_tier(
    const ParsedSource& parsed, const std::string& file_path) {
    if (!DialectUtils::is_typed(parsed.dialect) || !controller_classes(parsed).empty()) {
        return std::nullopt;
    }

    static const std::regex controller_re(
        R"re(@Controller\s*\(\s*((?:`[^`]*`|"[^"]*"|'[^']*'|[^)]*))?\s*\))re");
    static const std::regex class_re(R"(class\s+[A-Za-z_]\w*\s*[^{]*\{)");
    static const std::regex method_re(
        R"re(@(Get|Post|Put|Delete|Patch|Options|Head|All)\s*\(\s*((?:`[^`]*`|"[^"]*"|'[^']*'|[^)]*))?\s*\))re",
        std::regex::ECMAScript | std::regex::icase);

    const std::string& source = parsed.text;
    std::vector<EndpointRecord> endpoints;

    for (auto it = std::sregex_iterator(source.begin(), source.end(), controller_re);
         it != std::sregex_iterator(); ++it) {
        auto prefix = clean_path_literal((*it)[1].matched ? (*it).str(1) : "");

        std::smatch class_match;
        auto search_from = source.begin() + (it->position(0) + it->length(0));
        if (!std::regex_search(search_from, source.end(), class_match, class_re)) {
            continue;
        }

        size_t class_start = static_cast<size_t>(class_match.position(0)) +
                             static_cast<size_t>(search_from - source.begin());
        size_t brace_start = source.find('{', class_start);
        if (brace_start == std::string::npos) {
            continue;
        }
        int brace_end = find_matching_brace(source, brace_start);
        if (brace_end < 0) {
            continue;
        }

        std::string body = source.substr(brace_start, static_cast<size_t>(brace_end) - brace_start);
        int base_line = line_of_offset(source, brace_start);

        for (auto m = std::sregex_iterator(body.begin(), body.end(), method_re);
             m != std::sregex_iterator(); ++m) {
            EndpointRecord record;
            record.method = RouteHeuristics::to_upper(m->str(1));
            record.route = RouteHeuristics::combine_paths(
                prefix, clean_path_literal((*m)[2].matched ? m->str(2) : ""));
            record.file_path = file_path;
            record.start_line = base_line + line_of_offset(body, static_cast<size_t>(m->position(0))) - 1;
            record.end_line = record.start_line;
            record.tier = DetectionTier::TEXT_PATTERN;
            endpoints.push_back(std::move(record));
        }
    }

    return endpoints;
}

void EndpointDetector::merge_unique(std::vector<EndpointRecord>& into,
                                    std::vector<EndpointRecord> more) {
    std::set<EndpointRecord::Key> seen;
    for (const auto& record : into) {
        seen.insert(record.key());
    }
    for (auto& record : more) {
        if (seen.insert(record.key()).second) {
            into.push_back(std::move(record));
        }
    }
}

std::vector<EndpointRecord> EndpointDetector::detect_source(std::string_view source,
                                                            const std::filesystem::path& filepath,
                                                            Dialect dialect) {
    const std::string file_path = filepath.string();
    ParsedSource parsed = parse(source, dialect);
    if (!parsed.structural) {
        spdlog::warn("{}: structural parse failed, falling back to text patterns", file_path);
    }

    std::vector<EndpointRecord> endpoints;
    const std::vector<std::function<std::optional<std::vector<EndpointRecord>>()>> tiers = {
        [&] { return decorator_tier(parsed, file_path); },
        [&] { return call_pattern_tier(parsed, file_path); },
        [&] { return text_pattern_tier(parsed, file_path); },
        [&] { return decorator_text_tier(parsed, file_path); },
    };

    for (const auto& tier : tiers) {
        if (auto found = tier()) {
            merge_unique(endpoints, std::move(*found));
        }
    }

    spdlog::debug("{}: {} endpoint(s)", file_path, endpoints.size());
    return endpoints;
}

std::vector<EndpointRecord> EndpointDetector::detect(const std::filesystem::path& filepath) {
    auto source = read_source(filepath);
    if (!source) {
        spdlog::warn("Cannot read {}", filepath.string());
        return {};
    }

    Dialect dialect = DialectUtils::select(filepath);
    if (dialect == Dialect::UNKNOWN) {
        dialect = Dialect::JAVASCRIPT;
    }

    try {
        return detect_source(*source, filepath, dialect);
    } catch (const std::exception& e) {
        // Grammar setup failures land here; text patterns need no parser.
        spdlog::warn("{}: endpoint detection failed ({}), using text patterns", filepath.string(), e.what());
        ParsedSource parsed;
        parsed.text = *source;
        parsed.dialect = dialect;
        return text_pattern_tier(parsed, filepath.string()).value_or(std::vector<EndpointRecord>{});
    }
}

bool EndpointDetector::may_define_endpoints(std::string_view text) {
    const std::string source(text);

    for (auto it = std::sregex_iterator(source.begin(), source.end(), route_call_pattern());
         it != std::sregex_iterator(); ++it) {
        if (RouteHeuristics::looks_like_route_object(it->str(1))) {
            return true;
        }
    }

    return std::regex_search(source, api_decorator_pattern());
}

} // namespace apiscope
