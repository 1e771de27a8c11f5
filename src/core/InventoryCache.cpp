#include "core/InventoryCache.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace apiscope {

InventoryCache::InventoryCache(const std::filesystem::path& root)
    : directory_(root / std::string(kDirectoryName)) {
    std::filesystem::create_directories(directory_);
    spdlog::debug("Inventory cache at {}", directory_.string());
}

InventoryCache::~InventoryCache() {
    remove_all();
}

std::string InventoryCache::encode_name(const std::filesystem::path& source_path) {
    std::string text = source_path.string();

    // Strip the extension of the last component only
    auto slash = text.find_last_of("/\\");
    auto dot = text.find_last_of('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash + 1)) {
        text.erase(dot);
    }

    std::string encoded;
    encoded.reserve(text.size() + 16);
    for (char c : text) {
        if (c == '/' || c == '\\') {
            encoded += kSeparatorSentinel;
        } else {
            encoded += c;
        }
    }
    return encoded + ".json";
}

std::filesystem::path InventoryCache::path_for(const std::filesystem::path& source_path) const {
    return directory_ / encode_name(source_path);
}

bool InventoryCache::write(const FileInventory& inventory) {
    auto target = path_for(inventory.filename);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::warn("Cannot write inventory {}", target.string());
        return false;
    }
    out << inventory.to_json().dump(4);
    if (!out) {
        spdlog::warn("Failed writing inventory {}", target.string());
        return false;
    }
    written_++;
    return true;
}

std::optional<FileInventory> InventoryCache::read(const std::filesystem::path& source_path) const {
    std::ifstream in(path_for(source_path), std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    try {
        return FileInventory::from_json(json::parse(in));
    } catch (const json::exception& e) {
        spdlog::warn("Corrupt inventory for {}: {}", source_path.string(), e.what());
        return std::nullopt;
    }
}

void InventoryCache::remove_all() noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec)) {
        return;
    }
    std::filesystem::remove_all(directory_, ec);
    if (ec) {
        spdlog::warn("Cannot remove inventory cache {}: {}", directory_.string(), ec.message());
    } else {
        spdlog::debug("Removed inventory cache {}", directory_.string());
    }
}

// ============================================================================
// InventorySnapshot implementation
// ============================================================================

InventorySnapshot InventorySnapshot::load(const std::filesystem::path& cache_directory) {
    InventorySnapshot snapshot;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(cache_directory, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        std::ifstream in(entry.path(), std::ios::binary);
        if (!in) {
            spdlog::warn("Cannot open {}", entry.path().string());
            continue;
        }
        try {
            snapshot.add(FileInventory::from_json(json::parse(in)));
        } catch (const json::exception& e) {
            spdlog::warn("Skipping corrupt inventory {}: {}", entry.path().string(), e.what());
        }
    }
    if (ec) {
        spdlog::warn("Cannot list {}: {}", cache_directory.string(), ec.message());
    }

    spdlog::debug("Loaded {} inventories", snapshot.size());
    return snapshot;
}

void InventorySnapshot::add(FileInventory inventory) {
    std::string key = inventory.filename;
    inventories_.insert_or_assign(std::move(key), std::move(inventory));
}

const FileInventory* InventorySnapshot::find(const std::filesystem::path& source_path) const {
    auto it = inventories_.find(source_path.string());
    if (it != inventories_.end()) {
        return &it->second;
    }

    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(source_path, ec);
    if (ec || canonical == source_path) {
        return nullptr;
    }
    it = inventories_.find(canonical.string());
    return it == inventories_.end() ? nullptr : &it->second;
}

} // namespace apiscope
