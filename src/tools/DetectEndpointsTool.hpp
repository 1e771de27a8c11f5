#pragma once

#include "core/EndpointDetector.hpp"
#include "mcp/MCPServer.hpp"
#include "pipeline/PipelineConfig.hpp"

namespace apiscope {

/**
 * @brief MCP tool listing the HTTP endpoints of a file or directory tree
 *
 * Directories are walked with the configured ignore list and every file is
 * prefiltered before detection. Routes are normalized to `{param}` unless
 * `normalize` is false.
 */
class DetectEndpointsTool {
public:
    explicit DetectEndpointsTool(PipelineConfig config = {});

    static ToolInfo get_info();

    json execute(const json& args);

private:
    PipelineConfig config_;
    EndpointDetector detector_;
};

} // namespace apiscope
