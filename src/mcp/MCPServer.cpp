#include "mcp/MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace apiscope {

namespace {

// Malformed tools/call parameters
class InvalidParams : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, std::string name, std::string version)
    : transport_(std::move(transport)), name_(std::move(name)), version_(std::move(version)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::debug("Registered tool: {}", info.name);
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("{} serving {} tools", name_, tools_.size());

    while (running_ && transport_->is_open()) {
        json response;
        try {
            json request = transport_->read_message();
            if (request.is_null()) {
                spdlog::info("Input closed, stopping server");
                break;
            }
            response = handle_request(request);
        } catch (const json::parse_error& e) {
            spdlog::warn("Discarding malformed message: {}", e.what());
            response = make_error(json(), kParseError, "Parse error");
        }

        if (!response.is_null()) {
            transport_->write_message(response);
        }
    }

    running_ = false;
    spdlog::info("{} stopped", name_);
}

void MCPServer::stop() {
    running_ = false;
}

json MCPServer::handle_request(const json& request) {
    if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return make_error(json(), kInvalidRequest, "Invalid Request: missing or invalid jsonrpc field");
    }

    const bool is_notification = !request.contains("id");
    json id = request.value("id", json());

    if (!request.contains("method") || !request["method"].is_string()) {
        return make_error(id, kInvalidRequest, "Invalid Request: missing method field");
    }

    const std::string method = request["method"].get<std::string>();
    json params = request.value("params", json::object());

    spdlog::debug("Handling {} (id={})", method, id.dump());

    if (is_notification) {
        if (method == "notifications/initialized") {
            spdlog::info("Client initialized");
        } else {
            spdlog::debug("Ignoring notification {}", method);
        }
        return json();
    }

    try {
        if (method == "initialize") {
            json result = handle_initialize(params);
            initialized_ = true;
            return make_result(id, std::move(result));
        }
        if (method == "ping") {
            return make_result(id, json::object());
        }
        if (method == "tools/list") {
            return make_result(id, handle_tools_list());
        }
        if (method == "tools/call") {
            return make_result(id, handle_tools_call(params));
        }
        return make_error(id, kMethodNotFound, "Method not found: " + method);
    } catch (const InvalidParams& e) {
        return make_error(id, kInvalidParams, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling {}: {}", method, e.what());
        return make_error(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handle_tools_list() const {
    json tools_array = json::array();

    for (const auto& [name, info] : tools_) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw InvalidParams("Missing required parameter: name");
    }

    const std::string tool_name = params["name"].get<std::string>();
    json arguments = params.value("arguments", json::object());

    auto handler_it = handlers_.find(tool_name);
    if (handler_it == handlers_.end()) {
        throw InvalidParams("Unknown tool: " + tool_name);
    }

    json result = handler_it->second(arguments);
    bool failed = result.is_object() && result.contains("error");
    if (failed) {
        spdlog::warn("Tool {} failed: {}", tool_name, result["error"].dump());
    }

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.dump()}
            }
        })},
        {"isError", failed}
    };
}

json MCPServer::handle_initialize(const json& params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        spdlog::info("Client: {} version {}",
                     params["clientInfo"].value("name", "unknown"),
                     params["clientInfo"].value("version", "unknown"));
    }

    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", name_},
            {"version", version_}
        }}
    };
}

json MCPServer::make_result(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

json MCPServer::make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace apiscope
