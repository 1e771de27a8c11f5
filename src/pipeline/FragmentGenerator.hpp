#pragma once

#include "core/DependencySlicer.hpp"
#include "core/EndpointDetector.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Turns one endpoint's source context into a document fragment
 *
 * A fragment has the shape `{"paths": {route: {method: operation}}}`.
 * Implementations are called concurrently from pool workers and must not
 * share mutable state between calls.
 */
class FragmentGenerator {
public:
    virtual ~FragmentGenerator() = default;

    /**
     * @param endpoint The endpoint being described
     * @param bundle Handler lines and context blocks
     * @param route Normalized route (`{param}` convention)
     * @throws std::exception on failure; the caller skips the endpoint
     */
    virtual json generate(const EndpointRecord& endpoint,
                          const ContextBundle& bundle,
                          const std::string& route) const = 0;
};

} // namespace apiscope
