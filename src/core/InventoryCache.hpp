#pragma once

#include "core/FileInventory.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace apiscope {

/**
 * @brief Transient on-disk store of per-file inventories
 *
 * One JSON document per source file under `<root>/.apiscope_inventory`.
 * The directory is created by the constructor and removed by the destructor,
 * whatever the outcome of the run. Writes happen on a single thread before
 * any reader starts.
 */
class InventoryCache {
public:
    static constexpr std::string_view kDirectoryName = ".apiscope_inventory";
    static constexpr std::string_view kSeparatorSentinel = "_q_";

    /**
     * @throws std::filesystem::filesystem_error if the directory cannot be created
     */
    explicit InventoryCache(const std::filesystem::path& root);
    ~InventoryCache();

    InventoryCache(const InventoryCache&) = delete;
    InventoryCache& operator=(const InventoryCache&) = delete;

    /**
     * @brief Cache file name for a source path
     *
     * Every `/` and `\` becomes kSeparatorSentinel and the extension becomes
     * `.json`: `/src/app.ts` -> `_q_src_q_app.json`.
     */
    static std::string encode_name(const std::filesystem::path& source_path);

    std::filesystem::path path_for(const std::filesystem::path& source_path) const;

    /**
     * @brief Persist an inventory under the name of its `filename`
     * @return false if the file could not be written
     */
    bool write(const FileInventory& inventory);

    /**
     * @brief Load one inventory back from disk
     * @return nullopt if absent or unreadable
     */
    std::optional<FileInventory> read(const std::filesystem::path& source_path) const;

    /**
     * @brief Delete the cache directory; safe to call more than once
     */
    void remove_all() noexcept;

    const std::filesystem::path& directory() const { return directory_; }

    size_t written() const { return written_; }

private:
    std::filesystem::path directory_;
    size_t written_ = 0;
};

/**
 * @brief Immutable view of every cached inventory
 *
 * Built once after the walk, then shared by const reference with workers.
 * Lookups need no synchronization.
 */
class InventorySnapshot {
public:
    InventorySnapshot() = default;

    /**
     * @brief Read every JSON document in a cache directory
     *
     * Unreadable documents are skipped with a warning.
     */
    static InventorySnapshot load(const std::filesystem::path& cache_directory);

    /**
     * @brief Inventory of a source file, or nullptr when it was not cached
     */
    const FileInventory* find(const std::filesystem::path& source_path) const;

    void add(FileInventory inventory);

    size_t size() const { return inventories_.size(); }

private:
    std::map<std::string, FileInventory> inventories_;  // by source path
};

} // namespace apiscope
