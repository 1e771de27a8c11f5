#pragma once

#include "mcp/ITransport.hpp"
#include <queue>
#include <string>
#include <nlohmann/json.hpp>

namespace apiscope {

/**
 * @brief Mock transport for testing MCP server
 *
 * Requests are queued as raw text and parsed on read, so malformed input
 * reaches the server the same way it would from a real stream.
 */
class MockTransport : public ITransport {
public:
    MockTransport() = default;

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Add a request to the input queue; null JSON marks end of input
     */
    void push_request(const json& request);

    /**
     * @brief Add unparsed text to the input queue
     */
    void push_raw(const std::string& text);

    /**
     * @brief Get and remove response from output queue
     * @return JSON-RPC response, or null JSON when none is left
     */
    json pop_response();

    bool has_responses() const;

    size_t response_count() const { return responses_.size(); }

    /**
     * @brief Close the transport (causes read_message to return empty)
     */
    void close();

private:
    std::queue<std::string> requests_;
    std::queue<json> responses_;
    bool open_ = true;
};

} // namespace apiscope
