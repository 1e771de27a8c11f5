#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "pipeline/PipelineConfig.hpp"
#include "pipeline/SkeletonFragmentGenerator.hpp"
#include "pipeline/SwaggerPipeline.hpp"
#include "tools/DetectEndpointsTool.hpp"
#include "tools/ExtractSymbolsTool.hpp"
#include "tools/GenerateSwaggerTool.hpp"
#include "tools/SliceEndpointTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>

namespace {
    constexpr const char* kVersion = "1.0.0";

    apiscope::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    bool configure_logging(const std::string& log_level) {
        // stdout carries the document or the JSON-RPC stream
        spdlog::set_default_logger(spdlog::stderr_color_mt("apiscope"));

        auto level = spdlog::level::from_str(log_level);
        if (level == spdlog::level::off && log_level != "off") {
            std::cerr << "Invalid log level: " << log_level << std::endl;
            return false;
        }
        spdlog::set_level(level);
        return true;
    }

    int run_generate(const std::filesystem::path& root, apiscope::PipelineConfig config) {
        auto generator = std::make_shared<apiscope::SkeletonFragmentGenerator>();
        apiscope::SwaggerPipeline pipeline(std::move(config), generator);
        nlohmann::json document = pipeline.run(root);

        const auto& output = pipeline.config().output;
        if (output.empty()) {
            std::cout << document.dump(2) << std::endl;
            return 0;
        }

        std::ofstream out(output);
        if (!out) {
            spdlog::error("Cannot write {}", output);
            return 1;
        }
        out << document.dump(2) << '\n';
        spdlog::info("Wrote {}", output);
        return 0;
    }

    int run_serve(const apiscope::PipelineConfig& config) {
        setup_signal_handlers();

        auto transport = std::make_unique<apiscope::StdioTransport>();
        auto server = std::make_unique<apiscope::MCPServer>(std::move(transport), "apiscope", kVersion);
        global_server = server.get();

        auto extract_tool = std::make_shared<apiscope::ExtractSymbolsTool>();
        server->register_tool(
            apiscope::ExtractSymbolsTool::get_info(),
            [extract_tool](const nlohmann::json& args) {
                return extract_tool->execute(args);
            }
        );

        auto detect_tool = std::make_shared<apiscope::DetectEndpointsTool>(config);
        server->register_tool(
            apiscope::DetectEndpointsTool::get_info(),
            [detect_tool](const nlohmann::json& args) {
                return detect_tool->execute(args);
            }
        );

        auto slice_tool = std::make_shared<apiscope::SliceEndpointTool>(config);
        server->register_tool(
            apiscope::SliceEndpointTool::get_info(),
            [slice_tool](const nlohmann::json& args) {
                return slice_tool->execute(args);
            }
        );

        auto generate_tool = std::make_shared<apiscope::GenerateSwaggerTool>(
            config, std::make_shared<apiscope::SkeletonFragmentGenerator>());
        server->register_tool(
            apiscope::GenerateSwaggerTool::get_info(),
            [generate_tool](const nlohmann::json& args) {
                return generate_tool->execute(args);
            }
        );

        server->run();

        global_server = nullptr;
        return 0;
    }
}

int main(int argc, char** argv) {
    CLI::App app{"apiscope - HTTP endpoint discovery and OpenAPI generation for JavaScript/TypeScript"};
    app.require_subcommand(0, 1);

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    std::string config_path;
    app.add_option("-c,--config", config_path, "JSON config file (default: $APISCOPE_CONFIG_PATH)");

    auto* generate = app.add_subcommand("generate", "Generate an OpenAPI document for a project");
    std::string root;
    std::string output;
    std::string host;
    size_t workers = 0;
    generate->add_option("root", root, "Project root directory")->required()->check(CLI::ExistingDirectory);
    generate->add_option("-o,--output", output, "Output file (default: stdout)");
    generate->add_option("--host", host, "Server URL for servers[0].url");
    generate->add_option("--workers", workers, "Worker threads (1-5)")->check(CLI::Range(1, 5));

    auto* serve = app.add_subcommand("serve", "Run the MCP server on stdin/stdout");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "apiscope version " << kVersion << std::endl;
        return 0;
    }

    if (!configure_logging(log_level)) {
        return 1;
    }

    try {
        std::optional<std::filesystem::path> explicit_config;
        if (!config_path.empty()) {
            explicit_config = config_path;
        }
        apiscope::PipelineConfig config = apiscope::PipelineConfig::load(explicit_config);

        if (!output.empty()) {
            config.output = output;
        }
        if (!host.empty()) {
            config.api_host = host;
        }
        if (workers > 0) {
            config.max_workers = workers;
        }

        if (*generate) {
            return run_generate(root, std::move(config));
        }
        if (*serve) {
            return run_serve(config);
        }

        std::cout << app.help() << std::endl;
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
