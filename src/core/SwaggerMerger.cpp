#include "core/SwaggerMerger.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <regex>
#include <vector>

namespace apiscope {

namespace {

json default_created_schema() {
    return {
        {"type", "object"},
        {"properties", {{"id", {{"type", "string"}}}}},
        {"additionalProperties", true}
    };
}

json* operation(json& paths, const char* path, const char* method) {
    auto path_it = paths.find(path);
    if (path_it == paths.end() || !path_it->is_object()) {
        return nullptr;
    }
    auto method_it = path_it->find(method);
    if (method_it == path_it->end() || !method_it->is_object()) {
        return nullptr;
    }
    return &*method_it;
}

void repair_collection_create(json& post) {
    if (post.contains("requestBody") && post["requestBody"].is_object()) {
        post["requestBody"]["required"] = false;
    }

    json& responses = post["responses"];
    if (!responses.is_object()) {
        responses = json::object();
    }

    json schema;
    for (const char* code : {"201", "200"}) {
        if (!responses.contains(code)) {
            continue;
        }
        const json& response = responses[code];
        if (!response.is_object() || !response.contains("content")) {
            continue;
        }
        const json& content = response["content"];
        if (content.is_object() && content.contains("application/json") &&
            content["application/json"].is_object() &&
            content["application/json"].contains("schema")) {
            schema = content["application/json"]["schema"];
            if (!schema.is_null() && !schema.empty()) {
                break;
            }
        }
    }
    if (schema.is_null() || schema.empty()) {
        schema = default_created_schema();
    }

    responses = {
        {"201", {
            {"description", "Resource created successfully."},
            {"content", {{"application/json", {{"schema", schema}}}}}
        }},
        {"404", {{"description", "Collection not found."}}}
    };
}

}  // namespace

std::string SwaggerMerger::normalize_route(std::string_view route) {
    static const std::regex colon_param(R"(:([A-Za-z_][\w-]*))");
    return std::regex_replace(std::string(route), colon_param, "{$1}");
}

std::string SwaggerMerger::utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

json SwaggerMerger::make_document(const DocumentInfo& info) {
    return {
        {"openapi", "3.0.0"},
        {"info", {
            {"title", info.title},
            {"version", info.version},
            {"description", info.description},
            {"generated_at", info.generated_at.empty() ? utc_timestamp() : info.generated_at},
            {"commit_reference", info.commit_reference},
            {"repository_url", info.repository_url}
        }},
        {"servers", json::array({{{"url", info.host}}})},
        {"paths", json::object()}
    };
}

void SwaggerMerger::merge(json& document, const json& fragment) {
    if (!fragment.is_object() || !fragment.contains("paths") || !fragment["paths"].is_object()) {
        spdlog::debug("Fragment without paths ignored");
        return;
    }
    if (!document.contains("paths") || !document["paths"].is_object()) {
        document["paths"] = json::object();
    }

    json& paths = document["paths"];
    for (const auto& [path_key, methods] : fragment["paths"].items()) {
        if (!methods.is_object()) {
            continue;
        }
        json& target = paths[normalize_route(path_key)];
        if (!target.is_object()) {
            target = json::object();
        }
        for (const auto& [method, payload] : methods.items()) {
            target[method] = payload;
        }
    }
}

void SwaggerMerger::post_process(json& document) {
    if (!document.contains("paths") || !document["paths"].is_object()) {
        return;
    }
    json& paths = document["paths"];

    paths.erase("/*");
    paths.erase("*");

    std::vector<std::string> keys;
    for (const auto& [key, value] : paths.items()) {
        keys.push_back(key);
    }
    for (const auto& original : keys) {
        std::string normalized = normalize_route(original);
        if (normalized == original) {
            continue;
        }
        json existing = std::move(paths[original]);
        paths.erase(original);
        if (!paths.contains(normalized)) {
            paths[normalized] = std::move(existing);
        } else {
            paths[normalized].update(existing);
        }
    }

    if (json* post = operation(paths, "/{name}", "post")) {
        repair_collection_create(*post);
    }

    if (json* get = operation(paths, "/{name}", "get")) {
        if (get->contains("responses") && (*get)["responses"].is_object()) {
            (*get)["responses"].erase("400");
        }
    }

    if (json* del = operation(paths, "/{name}/{id}", "delete")) {
        if (del->contains("parameters") && (*del)["parameters"].is_array()) {
            for (auto& param : (*del)["parameters"]) {
                if (param.is_object() && param.value("name", "") == "_dependent") {
                    param["schema"] = {
                        {"oneOf", json::array({
                            {{"type", "string"}},
                            {{"type", "array"}, {"items", {{"type", "string"}}}}
                        })}
                    };
                    break;
                }
            }
        }
    }
}

} // namespace apiscope
