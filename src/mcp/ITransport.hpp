#pragma once

#include <nlohmann/json.hpp>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Message channel of the MCP server
 *
 * Implementations carry one JSON-RPC message per read or write.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next message
     * @return Message, or null JSON once the channel is exhausted
     * @throws json::parse_error if the received text is not JSON
     */
    virtual json read_message() = 0;

    virtual void write_message(const json& message) = 0;

    virtual bool is_open() const = 0;
};

} // namespace apiscope
