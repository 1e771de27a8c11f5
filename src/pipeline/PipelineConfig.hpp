#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Settings of one generation run
 *
 * Values come from defaults, then a JSON file, then command line overrides.
 */
struct PipelineConfig {
    static constexpr size_t kMaxWorkers = 5;
    static constexpr const char* kConfigPathEnv = "APISCOPE_CONFIG_PATH";

    std::string api_host = "https://api.example.com";
    std::set<std::string> ignored_dirs = {
        "node_modules", ".git", "dist", "build", "coverage", ".next", "vendor"
    };
    size_t max_workers = kMaxWorkers;

    std::string title;             // Empty: name of the scanned directory
    std::string version = "1.0.0";
    std::string description = "API description generated from source analysis.";
    std::string commit_reference;  // Empty: read from <root>/.git
    std::string repository_url;    // Empty: origin remote from <root>/.git/config
    std::string output;            // Empty: standard output

    /**
     * @brief Overlay the keys present in `j`; absent keys keep their value
     * @throws std::invalid_argument on a value of the wrong type
     */
    void apply_json(const json& j);

    json to_json() const;

    /**
     * @brief Defaults overlaid with a JSON config file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static PipelineConfig load_file(const std::filesystem::path& path);

    /**
     * @brief Load from `explicit_path`, else from $APISCOPE_CONFIG_PATH, else defaults
     */
    static PipelineConfig load(const std::optional<std::filesystem::path>& explicit_path);

    /**
     * @brief Pool size for `jobs` pending endpoints: min(max_workers, 5, jobs)
     */
    size_t worker_count(size_t jobs) const;

    /**
     * @brief Commit hash checked out in `root`, following a symbolic HEAD
     * @return Empty string when `root` is not a git checkout
     */
    static std::string read_commit_reference(const std::filesystem::path& root);

    /**
     * @brief URL of the `origin` remote in `<root>/.git/config`, or empty
     */
    static std::string read_repository_url(const std::filesystem::path& root);
};

} // namespace apiscope
