#include "core/SourceWalker.hpp"
#include "core/Dialect.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace apiscope {

SourceWalker::SourceWalker(std::set<std::string> ignored_dirs)
    : ignored_dirs_(std::move(ignored_dirs)) {
}

bool SourceWalker::is_ignored(const std::filesystem::path& path,
                              const std::filesystem::path& root) const {
    std::error_code ec;
    auto relative = std::filesystem::relative(path, root, ec);
    const auto& checked = (ec || relative.empty()) ? path : relative;

    for (const auto& part : checked) {
        if (ignored_dirs_.count(part.string()) > 0) {
            return true;
        }
    }
    return false;
}

std::vector<std::filesystem::path> SourceWalker::walk(const std::filesystem::path& root) const {
    std::set<std::filesystem::path> unique_paths;

    if (!std::filesystem::exists(root)) {
        spdlog::warn("Path does not exist: {}", root.string());
        return {};
    }

    if (std::filesystem::is_regular_file(root)) {
        if (DialectUtils::is_supported(root)) {
            unique_paths.insert(std::filesystem::canonical(root));
        } else {
            spdlog::debug("File {} is not a supported source file", root.string());
        }
        return {unique_paths.begin(), unique_paths.end()};
    }

    if (!std::filesystem::is_directory(root)) {
        spdlog::warn("Path is neither file nor directory: {}", root.string());
        return {};
    }

    try {
        auto options = std::filesystem::directory_options::skip_permission_denied;
        for (auto it = std::filesystem::recursive_directory_iterator(root, options);
             it != std::filesystem::recursive_directory_iterator(); ++it) {
            const auto& entry = *it;

            if (entry.is_directory() && ignored_dirs_.count(entry.path().filename().string()) > 0) {
                it.disable_recursion_pending();
                continue;
            }
            if (!entry.is_regular_file() || !DialectUtils::is_supported(entry.path())) {
                continue;
            }
            if (is_ignored(entry.path(), root)) {
                continue;
            }

            try {
                unique_paths.insert(std::filesystem::canonical(entry.path()));
            } catch (const std::filesystem::filesystem_error& e) {
                spdlog::warn("Cannot canonicalize path {}: {}", entry.path().string(), e.what());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Error scanning directory {}: {}", root.string(), e.what());
    }

    std::vector<std::filesystem::path> results(unique_paths.begin(), unique_paths.end());
    spdlog::debug("Walked {}: {} source files", root.string(), results.size());
    return results;
}

} // namespace apiscope
