#include "core/Dialect.hpp"
#include <algorithm>
#include <cctype>

// Tree-sitter grammars
extern "C" {
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
}

namespace apiscope {

namespace {

std::string lowercase_extension(const std::filesystem::path& filepath) {
    std::string ext = filepath.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

}  // namespace

Dialect DialectUtils::select(const std::filesystem::path& filepath) {
    if (filepath.empty()) {
        return Dialect::UNKNOWN;
    }

    std::string ext = lowercase_extension(filepath);
    if (ext.empty()) {
        return Dialect::UNKNOWN;
    }

    if (ext == ".tsx") {
        return Dialect::TSX;
    }

    if (ext == ".ts" || ext == ".cts" || ext == ".mts") {
        return Dialect::TYPESCRIPT;
    }

    if (ext == ".js" || ext == ".cjs" || ext == ".mjs") {
        return Dialect::JAVASCRIPT;
    }

    return Dialect::UNKNOWN;
}

bool DialectUtils::is_supported(const std::filesystem::path& filepath) {
    return select(filepath) != Dialect::UNKNOWN;
}

bool DialectUtils::is_typed(Dialect dialect) {
    return dialect == Dialect::TYPESCRIPT || dialect == Dialect::TSX;
}

const TSLanguage* DialectUtils::get_ts_language(Dialect dialect) {
    switch (dialect) {
        case Dialect::JAVASCRIPT:
            return tree_sitter_javascript();
        case Dialect::TYPESCRIPT:
            return tree_sitter_typescript();
        case Dialect::TSX:
            return tree_sitter_tsx();
        case Dialect::UNKNOWN:
        default:
            return nullptr;
    }
}

std::string_view DialectUtils::to_string(Dialect dialect) {
    switch (dialect) {
        case Dialect::JAVASCRIPT:
            return "javascript";
        case Dialect::TYPESCRIPT:
            return "typescript";
        case Dialect::TSX:
            return "tsx";
        case Dialect::UNKNOWN:
        default:
            return "unknown";
    }
}

Dialect DialectUtils::from_string(std::string_view name) {
    std::string lower_name;
    lower_name.resize(name.size());
    std::transform(name.begin(), name.end(), lower_name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_name == "javascript" || lower_name == "js") {
        return Dialect::JAVASCRIPT;
    }

    if (lower_name == "typescript" || lower_name == "ts") {
        return Dialect::TYPESCRIPT;
    }

    if (lower_name == "tsx") {
        return Dialect::TSX;
    }

    return Dialect::UNKNOWN;
}

const std::vector<std::string_view>& DialectUtils::resolution_extensions() {
    static const std::vector<std::string_view> extensions = {
        ".ts", ".tsx", ".cts", ".mts", ".js", ".mjs", ".cjs", ".d.ts"
    };
    return extensions;
}

const std::vector<std::string_view>& DialectUtils::source_extensions() {
    static const std::vector<std::string_view> extensions = {
        ".js", ".cjs", ".mjs", ".ts", ".tsx", ".cts", ".mts"
    };
    return extensions;
}

}  // namespace apiscope
