#include "tools/SliceEndpointTool.hpp"
#include "core/DependencySlicer.hpp"
#include "core/RouteHeuristics.hpp"
#include "core/SwaggerMerger.hpp"
#include "pipeline/SkeletonFragmentGenerator.hpp"
#include "pipeline/SwaggerPipeline.hpp"
#include <spdlog/spdlog.h>

namespace apiscope {

SliceEndpointTool::SliceEndpointTool(PipelineConfig config)
    : config_(std::move(config)) {
}

ToolInfo SliceEndpointTool::get_info() {
    return {
        "slice_endpoint",
        "Collect the handler source of an endpoint together with the in-file functions it calls "
        "and the imported declarations it uses",
        {
            {"type", "object"},
            {"properties", {
                {"root", {
                    {"type", "string"},
                    {"description", "Project root used to inventory imported files"}
                }},
                {"filepath", {
                    {"type", "string"},
                    {"description", "File declaring the endpoint"}
                }},
                {"method", {
                    {"type", "string"},
                    {"description", "HTTP method, e.g. GET"}
                }},
                {"route", {
                    {"type", "string"},
                    {"description", "Route in :param or {param} form"}
                }},
                {"start_line", {
                    {"type", "integer"},
                    {"description", "Registration line when several endpoints share method and route"}
                }}
            }},
            {"required", json::array({"root", "filepath", "method"})}
        }
    };
}

json SliceEndpointTool::execute(const json& args) {
    for (const char* key : {"root", "filepath", "method"}) {
        if (!args.contains(key) || !args[key].is_string()) {
            return {
                {"error", std::string("Missing required parameter: ") + key}
            };
        }
    }

    std::filesystem::path root = args["root"].get<std::string>();
    std::filesystem::path filepath = args["filepath"].get<std::string>();
    std::string method = RouteHeuristics::to_upper(args["method"].get<std::string>());
    std::optional<std::string> route;
    if (args.contains("route") && args["route"].is_string()) {
        route = SwaggerMerger::normalize_route(args["route"].get<std::string>());
    }
    std::optional<int> start_line;
    if (args.contains("start_line") && args["start_line"].is_number_integer()) {
        start_line = args["start_line"].get<int>();
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || !std::filesystem::is_regular_file(filepath, ec)) {
        return {
            {"error", "root must be a directory and filepath a file"}
        };
    }

    try {
        const auto project_root = std::filesystem::canonical(root);
        const auto source_file = std::filesystem::canonical(filepath);

        SwaggerPipeline pipeline(config_, std::make_shared<SkeletonFragmentGenerator>());
        auto endpoints = pipeline.detect_endpoints({source_file});

        const EndpointRecord* match = nullptr;
        for (const auto& endpoint : endpoints) {
            if (endpoint.method == method &&
                (!route || endpoint.route == route) &&
                (!start_line || endpoint.start_line == *start_line)) {
                match = &endpoint;
                break;
            }
        }
        if (!match) {
            return {
                {"error", "No matching endpoint"},
                {"candidates", endpoints.size()}
            };
        }

        InventoryCache cache(project_root);
        InventorySnapshot snapshot = pipeline.build_snapshot(pipeline.walk(project_root), cache);
        ContextBundle bundle = DependencySlicer(snapshot).slice(*match);

        return {
            {"endpoint", match->to_json()},
            {"bundle", bundle.to_json()}
        };
    } catch (const std::exception& e) {
        spdlog::error("slice_endpoint failed: {}", e.what());
        return {
            {"error", e.what()}
        };
    }
}

} // namespace apiscope
