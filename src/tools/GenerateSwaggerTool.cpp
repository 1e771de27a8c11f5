#include "tools/GenerateSwaggerTool.hpp"
#include "pipeline/SwaggerPipeline.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace apiscope {

GenerateSwaggerTool::GenerateSwaggerTool(PipelineConfig config,
                                         std::shared_ptr<const FragmentGenerator> generator)
    : config_(std::move(config)), generator_(std::move(generator)) {
    if (!generator_) {
        throw std::invalid_argument("Generator cannot be null");
    }
}

ToolInfo GenerateSwaggerTool::get_info() {
    return {
        "generate_swagger",
        "Generate an OpenAPI 3.0 document for every endpoint found under a project root",
        {
            {"type", "object"},
            {"properties", {
                {"root", {
                    {"type", "string"},
                    {"description", "Project root directory"}
                }},
                {"api_host", {
                    {"type", "string"},
                    {"description", "Server URL written to servers[0].url"}
                }},
                {"title", {
                    {"type", "string"},
                    {"description", "Document title (default: directory name)"}
                }}
            }},
            {"required", json::array({"root"})}
        }
    };
}

json GenerateSwaggerTool::execute(const json& args) {
    if (!args.contains("root") || !args["root"].is_string()) {
        return {
            {"error", "Missing required parameter: root"}
        };
    }

    PipelineConfig config = config_;
    config.api_host = args.value("api_host", config.api_host);
    config.title = args.value("title", config.title);

    try {
        SwaggerPipeline pipeline(std::move(config), generator_);
        json document = pipeline.run(args["root"].get<std::string>());
        return {
            {"swagger", document},
            {"stats", pipeline.stats().to_json()}
        };
    } catch (const std::exception& e) {
        spdlog::error("generate_swagger failed: {}", e.what());
        return {
            {"error", e.what()}
        };
    }
}

} // namespace apiscope
