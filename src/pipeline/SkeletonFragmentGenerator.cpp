#include "pipeline/SkeletonFragmentGenerator.hpp"
#include "core/RouteHeuristics.hpp"
#include <cctype>
#include <regex>

namespace apiscope {

namespace {

std::string capitalize_word(std::string_view word) {
    std::string result;
    bool upper_next = true;
    for (char c : word) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            upper_next = true;
            continue;
        }
        result += upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        upper_next = false;
    }
    return result;
}

bool has_request_body(std::string_view method) {
    return method == "post" || method == "put" || method == "patch";
}

}  // namespace

std::vector<std::string> SkeletonFragmentGenerator::path_parameters(std::string_view route) {
    static const std::regex param(R"(\{([^{}/]+)\})");
    std::vector<std::string> names;
    const std::string text(route);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), param);
         it != std::sregex_iterator(); ++it) {
        names.push_back(it->str(1));
    }
    return names;
}

std::string SkeletonFragmentGenerator::operation_id(std::string_view method, std::string_view route) {
    std::string id = RouteHeuristics::to_lower(method);

    size_t pos = 0;
    while (pos <= route.size()) {
        size_t next = route.find('/', pos);
        std::string_view segment = route.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (segment.size() > 2 && segment.front() == '{' && segment.back() == '}') {
            id += "By" + capitalize_word(segment.substr(1, segment.size() - 2));
        } else {
            id += capitalize_word(segment);
        }
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }
    return id;
}

json SkeletonFragmentGenerator::operation(std::string_view method, const EndpointRecord& endpoint,
                                          const ContextBundle& bundle, const std::string& route) {
    json op = {
        {"summary", RouteHeuristics::to_upper(method) + " " + route},
        {"operationId", operation_id(method, route)},
        {"x-context-blocks", bundle.context_blocks().size()},
        {"x-source", endpoint.file_path + ":" + std::to_string(endpoint.start_line) +
                     "-" + std::to_string(endpoint.end_line)}
    };

    json parameters = json::array();
    for (const auto& name : path_parameters(route)) {
        parameters.push_back({
            {"name", name},
            {"in", "path"},
            {"required", true},
            {"schema", {{"type", "string"}}}
        });
    }
    if (!parameters.empty()) {
        op["parameters"] = parameters;
    }

    if (has_request_body(method)) {
        op["requestBody"] = {
            {"required", true},
            {"content", {{"application/json", {{"schema", {{"type", "object"}}}}}}}
        };
    }

    const char* status = method == "post" ? "201" : "200";
    op["responses"] = {
        {status, {{"description", "Successful response."}}}
    };
    return op;
}

json SkeletonFragmentGenerator::generate(const EndpointRecord& endpoint,
                                         const ContextBundle& bundle,
                                         const std::string& route) const {
    json fragment = {{"paths", json::object()}};
    if (route.empty()) {
        return fragment;
    }

    std::string method = RouteHeuristics::to_lower(endpoint.method);
    json& methods = fragment["paths"][route];
    methods = json::object();

    if (method == "all") {
        for (auto verb : RouteHeuristics::http_methods()) {
            if (verb != "all") {
                methods[std::string(verb)] = operation(verb, endpoint, bundle, route);
            }
        }
    } else {
        methods[method] = operation(method, endpoint, bundle, route);
    }

    return fragment;
}

} // namespace apiscope
