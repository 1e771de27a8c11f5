#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace apiscope {

/**
 * @brief Collects the source files of a project tree
 *
 * Files are kept when their extension belongs to
 * DialectUtils::source_extensions(). A file is dropped when any segment of
 * its path relative to the root equals an ignored directory name.
 */
class SourceWalker {
public:
    explicit SourceWalker(std::set<std::string> ignored_dirs = {});

    /**
     * @brief Walk a directory, or accept a single file
     *
     * @param root File or directory to scan
     * @return Canonical paths of matching files (sorted, no duplicates)
     */
    std::vector<std::filesystem::path> walk(const std::filesystem::path& root) const;

    /**
     * @brief Check the path segments below `root` against the ignore list
     */
    bool is_ignored(const std::filesystem::path& path, const std::filesystem::path& root) const;

    const std::set<std::string>& ignored_dirs() const { return ignored_dirs_; }

private:
    std::set<std::string> ignored_dirs_;
};

} // namespace apiscope
