#pragma once

#include "mcp/ITransport.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Executes one tool call
 *
 * Returns a JSON result; an object with an "error" key is reported to the
 * client as a failed call.
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief JSON-RPC 2.0 server speaking the MCP tool protocol
 *
 * Methods: initialize, ping, tools/list, tools/call. Messages without an id
 * are notifications and never get a response.
 */
class MCPServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    // JSON-RPC error codes
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kInternalError = -32603;

    /**
     * @throws std::invalid_argument if transport is null
     */
    MCPServer(std::unique_ptr<ITransport> transport,
              std::string name = "apiscope",
              std::string version = "1.0.0");

    /**
     * @throws std::invalid_argument on an empty name or null handler
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Serve until stop() is called or the transport is exhausted
     */
    void run();

    void stop();

    /**
     * @brief Dispatch one message
     * @return Response, or null JSON for notifications
     */
    json handle_request(const json& request);

    bool initialized() const { return initialized_; }

private:
    json handle_tools_list() const;
    json handle_tools_call(const json& params);
    json handle_initialize(const json& params);

    static json make_result(const json& id, json result);
    static json make_error(const json& id, int code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    std::string name_;
    std::string version_;
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
    std::atomic<bool> running_{false};
    bool initialized_{false};
};

} // namespace apiscope
