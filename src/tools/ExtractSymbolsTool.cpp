#include "tools/ExtractSymbolsTool.hpp"
#include <spdlog/spdlog.h>

namespace apiscope {

ToolInfo ExtractSymbolsTool::get_info() {
    return {
        "extract_symbols",
        "Extract classes, functions, variables, call sites and imports (with resolved origins "
        "and usage lines) from a JavaScript or TypeScript file",
        {
            {"type", "object"},
            {"properties", {
                {"filepath", {
                    {"type", "string"},
                    {"description", "Path to the .js/.cjs/.mjs/.ts/.cts/.mts/.tsx file"}
                }},
                {"base_directory", {
                    {"type", "string"},
                    {"description", "Directory relative imports resolve against (default: the file's directory)"}
                }}
            }},
            {"required", json::array({"filepath"})}
        }
    };
}

json ExtractSymbolsTool::execute(const json& args) {
    if (!args.contains("filepath") || !args["filepath"].is_string()) {
        return {
            {"error", "Missing required parameter: filepath"}
        };
    }

    std::filesystem::path filepath = args["filepath"].get<std::string>();
    std::filesystem::path base = args.value("base_directory", std::string());

    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath, ec)) {
        return {
            {"error", "File not found: " + filepath.string()}
        };
    }

    try {
        auto absolute = std::filesystem::canonical(filepath);
        return extractor_.extract(absolute, base).to_json();
    } catch (const std::exception& e) {
        spdlog::error("extract_symbols failed for {}: {}", filepath.string(), e.what());
        return {
            {"error", e.what()},
            {"filepath", filepath.string()}
        };
    }
}

} // namespace apiscope
