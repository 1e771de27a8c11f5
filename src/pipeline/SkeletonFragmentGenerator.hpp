#pragma once

#include "pipeline/FragmentGenerator.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace apiscope {

/**
 * @brief Deterministic offline generator
 *
 * Describes each endpoint from its method and route alone: summary,
 * operationId, path parameters, a JSON body for POST/PUT/PATCH and a single
 * success response. `x-context-blocks` carries the bundle size and
 * `x-source` the registration location. An `ALL` registration expands to
 * every concrete verb.
 */
class SkeletonFragmentGenerator : public FragmentGenerator {
public:
    json generate(const EndpointRecord& endpoint,
                  const ContextBundle& bundle,
                  const std::string& route) const override;

    /**
     * @brief Names of the `{param}` segments in order of appearance
     */
    static std::vector<std::string> path_parameters(std::string_view route);

    /**
     * @brief `get` + `/users/{id}/posts` -> `getUsersByIdPosts`
     */
    static std::string operation_id(std::string_view method, std::string_view route);

private:
    static json operation(std::string_view method, const EndpointRecord& endpoint,
                          const ContextBundle& bundle, const std::string& route);
};

} // namespace apiscope
