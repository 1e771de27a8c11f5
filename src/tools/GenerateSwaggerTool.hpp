#pragma once

#include "mcp/MCPServer.hpp"
#include "pipeline/FragmentGenerator.hpp"
#include "pipeline/PipelineConfig.hpp"
#include <memory>

namespace apiscope {

/**
 * @brief MCP tool running the whole pipeline over a project tree
 */
class GenerateSwaggerTool {
public:
    /**
     * @throws std::invalid_argument if generator is null
     */
    GenerateSwaggerTool(PipelineConfig config, std::shared_ptr<const FragmentGenerator> generator);

    static ToolInfo get_info();

    json execute(const json& args);

private:
    PipelineConfig config_;
    std::shared_ptr<const FragmentGenerator> generator_;
};

} // namespace apiscope
