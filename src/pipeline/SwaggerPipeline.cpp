#include "pipeline/SwaggerPipeline.hpp"
#include "core/DependencySlicer.hpp"
#include "core/SourceFile.hpp"
#include "core/SwaggerMerger.hpp"
#include "core/SymbolExtractor.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>

namespace apiscope {

json PipelineStats::to_json() const {
    return {
        {"files_walked", files_walked},
        {"inventories_cached", inventories_cached},
        {"endpoints", endpoints},
        {"fragments_merged", fragments_merged},
        {"failed_jobs", failed_jobs}
    };
}

SwaggerPipeline::SwaggerPipeline(PipelineConfig config,
                                 std::shared_ptr<const FragmentGenerator> generator)
    : config_(std::move(config)), generator_(std::move(generator)) {
    if (!generator_) {
        throw std::invalid_argument("SwaggerPipeline requires a fragment generator");
    }
}

std::vector<std::filesystem::path> SwaggerPipeline::walk(const std::filesystem::path& root) const {
    auto ignored = config_.ignored_dirs;
    ignored.insert(std::string(InventoryCache::kDirectoryName));
    return SourceWalker(std::move(ignored)).walk(root);
}

InventorySnapshot SwaggerPipeline::build_snapshot(const std::vector<std::filesystem::path>& files,
                                                  InventoryCache& cache) {
    SymbolExtractor extractor;

    for (const auto& file : files) {
        try {
            if (cache.write(extractor.extract(file))) {
                stats_.inventories_cached++;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Skipping inventory of {}: {}", file.string(), e.what());
        }
    }

    return InventorySnapshot::load(cache.directory());
}

std::vector<EndpointRecord> SwaggerPipeline::detect_endpoints(
    const std::vector<std::filesystem::path>& files) {
    EndpointDetector detector;
    std::vector<EndpointRecord> endpoints;

    for (const auto& file : files) {
        auto source = read_source(file);
        if (!source || !EndpointDetector::may_define_endpoints(*source)) {
            continue;
        }

        for (auto& endpoint : detector.detect(file)) {
            if (endpoint.route) {
                endpoint.route = SwaggerMerger::normalize_route(*endpoint.route);
            }
            endpoints.push_back(std::move(endpoint));
        }
    }

    return endpoints;
}

void SwaggerPipeline::generate_fragments(const std::vector<EndpointRecord>& jobs,
                                         const InventorySnapshot& snapshot,
                                         json& document) {
    struct Completion {
        size_t index;
        std::optional<json> fragment;
    };

    const DependencySlicer slicer(snapshot);
    const FragmentGenerator& generator = *generator_;

    std::mutex mutex;
    std::condition_variable cv;
    std::queue<Completion> completed;
    std::atomic<size_t> next_job{0};

    auto worker = [&]() {
        while (true) {
            size_t index = next_job.fetch_add(1);
            if (index >= jobs.size()) {
                return;
            }

            const EndpointRecord& job = jobs[index];
            std::optional<json> fragment;
            try {
                ContextBundle bundle = slicer.slice(job);
                fragment = generator.generate(job, bundle, job.route.value_or(""));
            } catch (const std::exception& e) {
                spdlog::warn("Fragment for {} {} in {} failed: {}", job.method,
                             job.route.value_or("<dynamic>"), job.file_path, e.what());
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                completed.push({index, std::move(fragment)});
            }
            cv.notify_one();
        }
    };

    size_t worker_count = config_.worker_count(jobs.size());
    spdlog::info("Generating {} fragments with {} workers", jobs.size(), worker_count);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; i++) {
        workers.emplace_back(worker);
    }

    size_t received = 0;
    while (received < jobs.size()) {
        std::queue<Completion> batch;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return !completed.empty(); });
            std::swap(batch, completed);
        }

        while (!batch.empty()) {
            Completion done = std::move(batch.front());
            batch.pop();
            received++;

            if (!done.fragment) {
                stats_.failed_jobs++;
                continue;
            }
            SwaggerMerger::merge(document, *done.fragment);
            stats_.fragments_merged++;
            spdlog::debug("Merged fragment {} ({}/{})", done.index, received, jobs.size());
        }
    }

    for (auto& thread : workers) {
        thread.join();
    }
}

json SwaggerPipeline::run(const std::filesystem::path& root) {
    if (!std::filesystem::is_directory(root)) {
        throw std::invalid_argument("Not a directory: " + root.string());
    }

    stats_ = PipelineStats{};
    const auto project_root = std::filesystem::canonical(root);

    DocumentInfo info;
    info.title = config_.title.empty() ? project_root.filename().string() : config_.title;
    info.version = config_.version;
    info.description = config_.description;
    info.commit_reference = config_.commit_reference.empty()
        ? PipelineConfig::read_commit_reference(project_root) : config_.commit_reference;
    info.repository_url = config_.repository_url.empty()
        ? PipelineConfig::read_repository_url(project_root) : config_.repository_url;
    info.host = config_.api_host;
    json document = SwaggerMerger::make_document(info);

    auto files = walk(project_root);
    stats_.files_walked = files.size();
    spdlog::info("Found {} source files under {}", files.size(), project_root.string());

    InventoryCache cache(project_root);
    InventorySnapshot snapshot = build_snapshot(files, cache);

    auto jobs = detect_endpoints(files);
    stats_.endpoints = jobs.size();
    spdlog::info("Detected {} endpoints", jobs.size());

    if (jobs.empty()) {
        return document;
    }

    generate_fragments(jobs, snapshot, document);
    SwaggerMerger::post_process(document);

    spdlog::info("Merged {} fragments ({} failed)", stats_.fragments_merged, stats_.failed_jobs);
    return document;
}

} // namespace apiscope
