#pragma once

#include "mcp/MCPServer.hpp"
#include "pipeline/PipelineConfig.hpp"

namespace apiscope {

/**
 * @brief MCP tool returning the ContextBundle of one endpoint
 *
 * Inventories the whole project (so cross-file imports can be followed),
 * detects the endpoints of `filepath` and slices the first one matching
 * `method`, and `route` / `start_line` when given.
 */
class SliceEndpointTool {
public:
    explicit SliceEndpointTool(PipelineConfig config = {});

    static ToolInfo get_info();

    json execute(const json& args);

private:
    PipelineConfig config_;
};

} // namespace apiscope
