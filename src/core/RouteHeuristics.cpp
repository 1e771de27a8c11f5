#include "core/RouteHeuristics.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace apiscope {

namespace {

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

const std::vector<std::string_view>& RouteHeuristics::http_methods() {
    static const std::vector<std::string_view> methods = {
        "get", "post", "put", "delete", "patch", "options", "head", "all"
    };
    return methods;
}

bool RouteHeuristics::is_http_method(std::string_view name) {
    std::string lower = to_lower(name);
    const auto& methods = http_methods();
    return std::find(methods.begin(), methods.end(), lower) != methods.end();
}

bool RouteHeuristics::looks_like_route_object(std::string_view name) {
    static const std::vector<std::string_view> keywords = {
        "app", "router", "route", "api", "controller", "server"
    };
    static const std::vector<std::string_view> suffixes = {
        "router", "routes", "route", "app", "server", "controller", "api"
    };

    std::string lower = to_lower(name);
    if (lower.empty()) {
        return false;
    }

    if (std::find(keywords.begin(), keywords.end(), lower) != keywords.end()) {
        return true;
    }

    for (auto suffix : suffixes) {
        if (ends_with(lower, suffix)) {
            return true;
        }
    }

    return starts_with(lower, "app") || starts_with(lower, "api");
}

std::string RouteHeuristics::combine_paths(const std::optional<std::string>& prefix,
                                           const std::optional<std::string>& path) {
    std::string prefix_part = prefix && !prefix->empty() ? *prefix : "/";
    std::string path_part = path && !path->empty() ? *path : "/";

    if (prefix_part.front() != '/') {
        prefix_part.insert(prefix_part.begin(), '/');
    }
    if (path_part.front() != '/') {
        path_part.insert(path_part.begin(), '/');
    }
    while (!prefix_part.empty() && prefix_part.back() == '/') {
        prefix_part.pop_back();
    }

    static const std::regex repeated_slashes("/{2,}");
    return std::regex_replace(prefix_part + path_part, repeated_slashes, "/");
}

std::optional<std::string> RouteHeuristics::clean_literal(std::string_view literal) {
    while (!literal.empty() && std::isspace(static_cast<unsigned char>(literal.front()))) {
        literal.remove_prefix(1);
    }
    while (!literal.empty() && std::isspace(static_cast<unsigned char>(literal.back()))) {
        literal.remove_suffix(1);
    }

    if (literal.size() >= 2) {
        char quote = literal.front();
        if ((quote == '"' || quote == '\'' || quote == '`') && literal.back() == quote) {
            std::string_view inner = literal.substr(1, literal.size() - 2);
            if (quote == '`' && inner.find("${") != std::string_view::npos) {
                return std::nullopt;
            }
            return std::string(inner);
        }
    }
    return std::string(literal);
}

std::string RouteHeuristics::to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

std::string RouteHeuristics::to_upper(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper;
}

}  // namespace apiscope
