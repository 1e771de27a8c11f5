#pragma once

#include "core/SymbolExtractor.hpp"
#include "mcp/MCPServer.hpp"

namespace apiscope {

/**
 * @brief MCP tool returning the FileInventory of one source file
 */
class ExtractSymbolsTool {
public:
    static ToolInfo get_info();

    /**
     * @param args {"filepath": string, "base_directory"?: string}
     */
    json execute(const json& args);

private:
    SymbolExtractor extractor_;
};

} // namespace apiscope
