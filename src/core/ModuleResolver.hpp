#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace apiscope {

/**
 * @brief Where an import specifier points
 */
struct Origin {
    enum class Kind {
        FILE,        // Relative specifier resolved to a source file
        PACKAGE,     // Bare specifier with a local package directory
        EXTERNAL,    // Builtin or externally installed module
        NOT_FOUND    // Relative specifier with no matching file
    };

    Kind kind = Kind::NOT_FOUND;
    std::filesystem::path path;  // Empty unless FILE or PACKAGE

    static constexpr std::string_view kExternalSentinel = "<builtin_or_external>";

    static Origin file(std::filesystem::path p) { return {Kind::FILE, std::move(p)}; }
    static Origin package(std::filesystem::path p) { return {Kind::PACKAGE, std::move(p)}; }
    static Origin external() { return {Kind::EXTERNAL, {}}; }
    static Origin not_found() { return {Kind::NOT_FOUND, {}}; }

    bool has_path() const { return kind == Kind::FILE || kind == Kind::PACKAGE; }

    bool operator==(const Origin& other) const {
        return kind == other.kind && path == other.path;
    }

    bool operator!=(const Origin& other) const { return !(*this == other); }
};

std::string_view to_string(Origin::Kind kind);

Origin::Kind origin_kind_from_string(std::string_view name);

/**
 * @brief Resolves import specifiers the way the Node runtime would
 *
 * Relative specifiers are joined to the importing directory and probed with
 * each source extension, then with `/index` plus each extension. Bare
 * specifiers resolve to `node_modules/<specifier>` beneath the importing
 * directory when present, otherwise to the external sentinel.
 */
class ModuleResolver {
public:
    static constexpr std::string_view kPackageDirectory = "node_modules";

    /**
     * @brief Resolve a specifier; never throws
     * @param specifier Text of the import source without quotes
     * @param importing_directory Directory of the importing file
     */
    static Origin resolve(std::string_view specifier,
                          const std::filesystem::path& importing_directory);

    /**
     * @brief True for `./x`, `../x`, `.` and `..`
     */
    static bool is_relative(std::string_view specifier);
};

}  // namespace apiscope
