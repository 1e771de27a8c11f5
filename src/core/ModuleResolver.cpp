#include "core/ModuleResolver.hpp"
#include "core/Dialect.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace apiscope {

namespace {

bool is_file(const std::filesystem::path& candidate) {
    std::error_code ec;
    return std::filesystem::is_regular_file(candidate, ec);
}

std::filesystem::path absolute_normal(const std::filesystem::path& p) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    return absolute.lexically_normal();
}

}  // namespace

std::string_view to_string(Origin::Kind kind) {
    switch (kind) {
        case Origin::Kind::FILE:
            return "file";
        case Origin::Kind::PACKAGE:
            return "package";
        case Origin::Kind::EXTERNAL:
            return "external";
        case Origin::Kind::NOT_FOUND:
        default:
            return "not_found";
    }
}

Origin::Kind origin_kind_from_string(std::string_view name) {
    if (name == "file") {
        return Origin::Kind::FILE;
    }
    if (name == "package") {
        return Origin::Kind::PACKAGE;
    }
    if (name == "external") {
        return Origin::Kind::EXTERNAL;
    }
    return Origin::Kind::NOT_FOUND;
}

bool ModuleResolver::is_relative(std::string_view specifier) {
    return specifier == "." || specifier == ".." ||
           specifier.rfind("./", 0) == 0 || specifier.rfind("../", 0) == 0;
}

Origin ModuleResolver::resolve(std::string_view specifier,
                               const std::filesystem::path& importing_directory) {
    if (specifier.empty()) {
        return Origin::not_found();
    }

    if (is_relative(specifier)) {
        std::filesystem::path joined = absolute_normal(importing_directory / std::string(specifier));
        std::string base = joined.string();
        if (!base.empty() && base.back() == '/') {
            base.pop_back();
        }

        // Specifiers that already carry their extension
        if (is_file(base)) {
            return Origin::file(base);
        }

        for (auto ext : DialectUtils::resolution_extensions()) {
            std::filesystem::path candidate = base + std::string(ext);
            if (is_file(candidate)) {
                return Origin::file(candidate);
            }
        }

        for (auto ext : DialectUtils::resolution_extensions()) {
            std::filesystem::path candidate = base + "/index" + std::string(ext);
            if (is_file(candidate)) {
                return Origin::file(candidate);
            }
        }

        spdlog::debug("Unresolved relative import '{}' from {}", specifier, importing_directory.string());
        return Origin::not_found();
    }

    std::filesystem::path package_dir =
        importing_directory / std::string(kPackageDirectory) / std::string(specifier);
    std::error_code ec;
    if (std::filesystem::exists(package_dir, ec)) {
        return Origin::package(absolute_normal(package_dir));
    }

    return Origin::external();
}

}  // namespace apiscope
