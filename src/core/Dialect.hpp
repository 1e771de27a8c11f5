#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <vector>

// Forward declarations for tree-sitter C API
extern "C" {
    struct TSLanguage;
}

namespace apiscope {

/**
 * @brief Concrete grammar variants of the ECMAScript family
 */
enum class Dialect {
    JAVASCRIPT,   // Plain script (.js, .cjs, .mjs)
    TYPESCRIPT,   // Typed script (.ts, .cts, .mts)
    TSX,          // Typed script with inline markup (.tsx)
    UNKNOWN       // Not a supported source file
};

/**
 * @brief Grammar selection and dialect metadata
 */
class DialectUtils {
public:
    /**
     * @brief Select the grammar dialect for a file
     *
     * Selection is by extension only and case-insensitive. Markup wins over
     * typed script; plain script is the default for any other supported
     * extension.
     *
     * @param filepath Path to the file
     * @return Dialect (UNKNOWN if the extension is not supported)
     */
    static Dialect select(const std::filesystem::path& filepath);

    /**
     * @brief Check whether the file extension belongs to the walked set
     */
    static bool is_supported(const std::filesystem::path& filepath);

    /**
     * @brief True for TYPESCRIPT and TSX
     */
    static bool is_typed(Dialect dialect);

    /**
     * @brief Get tree-sitter TSLanguage for the given dialect
     * @return Pointer to TSLanguage or nullptr for UNKNOWN
     */
    static const TSLanguage* get_ts_language(Dialect dialect);

    /**
     * @brief Convert Dialect to its display name ("javascript", "typescript", "tsx")
     */
    static std::string_view to_string(Dialect dialect);

    /**
     * @brief Parse a dialect name ("js", "javascript", "ts", "typescript", "tsx")
     */
    static Dialect from_string(std::string_view name);

    /**
     * @brief Extensions probed when resolving extensionless relative imports
     *
     * Order is significant: the first existing candidate wins.
     */
    static const std::vector<std::string_view>& resolution_extensions();

    /**
     * @brief All extensions picked up by the directory walk
     */
    static const std::vector<std::string_view>& source_extensions();
};

}  // namespace apiscope
