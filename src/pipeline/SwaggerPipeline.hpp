#pragma once

#include "core/EndpointDetector.hpp"
#include "core/InventoryCache.hpp"
#include "core/SourceWalker.hpp"
#include "pipeline/FragmentGenerator.hpp"
#include "pipeline/PipelineConfig.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <vector>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Counters of the last run
 */
struct PipelineStats {
    size_t files_walked = 0;
    size_t inventories_cached = 0;
    size_t endpoints = 0;
    size_t fragments_merged = 0;
    size_t failed_jobs = 0;

    json to_json() const;
};

/**
 * @brief Walk, inventory, detect, slice, generate and merge
 *
 * Inventories are written to the cache on the calling thread before any
 * worker starts. Workers share the read-only snapshot and the generator;
 * fragments are merged on the calling thread in completion order.
 */
class SwaggerPipeline {
public:
    /**
     * @throws std::invalid_argument if generator is null
     */
    SwaggerPipeline(PipelineConfig config, std::shared_ptr<const FragmentGenerator> generator);

    /**
     * @brief Produce the document for a project tree
     * @throws std::invalid_argument if root is not a directory
     */
    json run(const std::filesystem::path& root);

    /**
     * @brief Source files under root, skipping ignored and cache directories
     */
    std::vector<std::filesystem::path> walk(const std::filesystem::path& root) const;

    /**
     * @brief Extract and cache every file, then load the snapshot
     *
     * A file that fails extraction is logged and left out.
     */
    InventorySnapshot build_snapshot(const std::vector<std::filesystem::path>& files,
                                     InventoryCache& cache);

    /**
     * @brief Endpoints of all files passing the prefilter, routes normalized
     */
    std::vector<EndpointRecord> detect_endpoints(const std::vector<std::filesystem::path>& files);

    const PipelineStats& stats() const { return stats_; }
    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    std::shared_ptr<const FragmentGenerator> generator_;
    PipelineStats stats_;

    void generate_fragments(const std::vector<EndpointRecord>& jobs,
                            const InventorySnapshot& snapshot,
                            json& document);
};

} // namespace apiscope
