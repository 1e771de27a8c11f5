#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Metadata written into the document's `info` and `servers`
 */
struct DocumentInfo {
    std::string title;
    std::string version = "1.0.0";
    std::string description;
    std::string generated_at;      // ISO-8601 UTC; filled with the current time when empty
    std::string commit_reference;
    std::string repository_url;
    std::string host;
};

/**
 * @brief Assembles OpenAPI 3.0 documents from per-endpoint fragments
 *
 * Path keys always use `{param}`. Merging the same (path, method) twice keeps
 * the later operation.
 */
class SwaggerMerger {
public:
    /**
     * @brief Rewrite `:param` segments as `{param}`
     *
     * `/users/:id/posts/:post-id` -> `/users/{id}/posts/{post-id}`
     */
    static std::string normalize_route(std::string_view route);

    /**
     * @brief Empty document with metadata and no paths
     */
    static json make_document(const DocumentInfo& info);

    /**
     * @brief Copy every (path, method) operation of `fragment` into `document`
     */
    static void merge(json& document, const json& fragment);

    /**
     * @brief Final cleanup after all fragments are merged
     *
     * - drops the wildcard paths `/*` and `*`
     * - re-keys remaining colon-style paths, folding into existing entries
     * - POST `/{name}`: optional body, `201` with the best known schema, `404`
     * - GET `/{name}`: no `400` response
     * - DELETE `/{name}/{id}`: `_dependent` accepts a string or string array
     */
    static void post_process(json& document);

    /**
     * @brief Current UTC time as `YYYY-MM-DDTHH:MM:SSZ`
     */
    static std::string utc_timestamp();
};

} // namespace apiscope
