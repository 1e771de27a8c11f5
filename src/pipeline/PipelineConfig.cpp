#include "pipeline/PipelineConfig.hpp"
#include "core/SourceFile.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace apiscope {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

template <typename T>
void overlay(const json& j, const char* key, T& field) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return;
    }
    try {
        field = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid config value for '") + key + "': " + e.what());
    }
}

}  // namespace

void PipelineConfig::apply_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Config must be a JSON object");
    }

    overlay(j, "api_host", api_host);
    overlay(j, "ignored_dirs", ignored_dirs);
    overlay(j, "max_workers", max_workers);
    overlay(j, "title", title);
    overlay(j, "version", version);
    overlay(j, "description", description);
    overlay(j, "commit_reference", commit_reference);
    overlay(j, "repository_url", repository_url);
    overlay(j, "output", output);
}

json PipelineConfig::to_json() const {
    return {
        {"api_host", api_host},
        {"ignored_dirs", ignored_dirs},
        {"max_workers", max_workers},
        {"title", title},
        {"version", version},
        {"description", description},
        {"commit_reference", commit_reference},
        {"repository_url", repository_url},
        {"output", output}
    };
}

PipelineConfig PipelineConfig::load_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }

    PipelineConfig config;
    config.apply_json(j);
    spdlog::debug("Loaded config from {}", path.string());
    return config;
}

PipelineConfig PipelineConfig::load(const std::optional<std::filesystem::path>& explicit_path) {
    if (explicit_path) {
        return load_file(*explicit_path);
    }
    if (const char* env_path = std::getenv(kConfigPathEnv)) {
        if (*env_path != '\0') {
            return load_file(env_path);
        }
    }
    return PipelineConfig{};
}

size_t PipelineConfig::worker_count(size_t jobs) const {
    size_t limit = std::min(std::max<size_t>(max_workers, 1), kMaxWorkers);
    return std::min(limit, jobs);
}

std::string PipelineConfig::read_commit_reference(const std::filesystem::path& root) {
    const auto git_dir = root / ".git";
    auto head = read_source(git_dir / "HEAD");
    if (!head) {
        return "";
    }

    std::string value = trim(*head);
    const std::string ref_prefix = "ref:";
    if (value.rfind(ref_prefix, 0) != 0) {
        return value;  // Detached HEAD holds the hash
    }

    std::string ref = trim(value.substr(ref_prefix.size()));
    if (auto loose = read_source(git_dir / ref)) {
        return trim(*loose);
    }

    // Packed refs: "<hash> <ref>" per line
    if (auto packed = read_source(git_dir / "packed-refs")) {
        std::istringstream lines(*packed);
        std::string line;
        while (std::getline(lines, line)) {
            auto space = line.find(' ');
            if (space != std::string::npos && trim(line.substr(space + 1)) == ref) {
                return line.substr(0, space);
            }
        }
    }

    spdlog::debug("Cannot resolve {} in {}", ref, git_dir.string());
    return "";
}

std::string PipelineConfig::read_repository_url(const std::filesystem::path& root) {
    auto config = read_source(root / ".git" / "config");
    if (!config) {
        return "";
    }

    std::istringstream lines(*config);
    std::string line;
    bool in_origin = false;
    while (std::getline(lines, line)) {
        std::string entry = trim(line);
        if (!entry.empty() && entry.front() == '[') {
            in_origin = entry == "[remote \"origin\"]";
            continue;
        }
        if (!in_origin) {
            continue;
        }
        auto eq = entry.find('=');
        if (eq != std::string::npos && trim(entry.substr(0, eq)) == "url") {
            return trim(entry.substr(eq + 1));
        }
    }
    return "";
}

} // namespace apiscope
