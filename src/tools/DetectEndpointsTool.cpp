#include "tools/DetectEndpointsTool.hpp"
#include "core/SourceFile.hpp"
#include "core/SourceWalker.hpp"
#include "core/SwaggerMerger.hpp"
#include <spdlog/spdlog.h>

namespace apiscope {

DetectEndpointsTool::DetectEndpointsTool(PipelineConfig config)
    : config_(std::move(config)), detector_() {
}

ToolInfo DetectEndpointsTool::get_info() {
    ToolInfo info;
    info.name = "detect_endpoints";
    info.description = "Find HTTP route declarations (Express-style calls and controller decorators) "
                       "in a file or recursively in a directory";

    info.input_schema = {
        {"type", "object"},
        {"properties", {
            {"filepath", {
                {"type", "string"},
                {"description", "Source file or directory to scan"}
            }},
            {"normalize", {
                {"type", "boolean"},
                {"default", true},
                {"description", "Rewrite :param segments as {param}"}
            }}
        }},
        {"required", json::array({"filepath"})}
    };

    return info;
}

json DetectEndpointsTool::execute(const json& args) {
    if (!args.contains("filepath") || !args["filepath"].is_string()) {
        json error_result;
        error_result["error"] = "Missing required parameter: filepath";
        return error_result;
    }

    std::filesystem::path target = args["filepath"].get<std::string>();
    bool normalize = args.value("normalize", true);

    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        json error_result;
        error_result["error"] = "Path does not exist: " + target.string();
        return error_result;
    }

    const bool single_file = std::filesystem::is_regular_file(target, ec);
    auto files = SourceWalker(config_.ignored_dirs).walk(target);

    json endpoints = json::array();
    for (const auto& file : files) {
        if (!single_file) {
            auto source = read_source(file);
            if (!source || !EndpointDetector::may_define_endpoints(*source)) {
                continue;
            }
        }

        for (auto& endpoint : detector_.detect(file)) {
            if (normalize && endpoint.route) {
                endpoint.route = SwaggerMerger::normalize_route(*endpoint.route);
            }
            endpoints.push_back(endpoint.to_json());
        }
    }

    spdlog::debug("detect_endpoints: {} endpoints in {} files", endpoints.size(), files.size());

    return {
        {"endpoints", endpoints},
        {"count", endpoints.size()},
        {"files_scanned", files.size()}
    };
}

} // namespace apiscope
