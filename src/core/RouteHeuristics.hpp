#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apiscope {

/**
 * @brief Shared classification rules for route declarations
 *
 * Every detection tier calls these same predicates so an object name is
 * classified identically whichever tier sees it.
 */
class RouteHeuristics {
public:
    /**
     * @brief HTTP verbs recognized as route registration methods, lower case
     */
    static const std::vector<std::string_view>& http_methods();

    /**
     * @brief Case-insensitive membership in http_methods()
     */
    static bool is_http_method(std::string_view name);

    /**
     * @brief Decide whether an object expression looks like a router
     *
     * True when the lower-cased name equals a route keyword (app, router,
     * route, api, controller, server), ends with a route suffix (router,
     * routes, route, app, server, controller, api) or starts with "app" or
     * "api".
     */
    static bool looks_like_route_object(std::string_view name);

    /**
     * @brief Join a controller prefix and a handler path
     *
     * Missing parts count as "/". The result has exactly one leading slash
     * and no runs of slashes. A trailing slash on the handler path is kept.
     */
    static std::string combine_paths(const std::optional<std::string>& prefix,
                                     const std::optional<std::string>& path);

    /**
     * @brief Strip matching quotes or backticks from a literal
     *
     * Template literals containing `${` interpolation yield nullopt.
     */
    static std::optional<std::string> clean_literal(std::string_view literal);

    static std::string to_lower(std::string_view text);
    static std::string to_upper(std::string_view text);
};

}  // namespace apiscope
