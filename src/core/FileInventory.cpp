#include "core/FileInventory.hpp"

namespace apiscope {

namespace {

json declarations_to_json(const std::vector<Declaration>& items, std::string_view type) {
    json result = json::array();
    for (const auto& item : items) {
        result.push_back({
            {"type", std::string(type)},
            {"name", item.name},
            {"start_line", item.start_line},
            {"end_line", item.end_line}
        });
    }
    return result;
}

std::vector<Declaration> declarations_from_json(const json& j, const char* key) {
    std::vector<Declaration> items;
    if (!j.contains(key)) {
        return items;
    }
    for (const auto& entry : j.at(key)) {
        Declaration decl;
        decl.name = entry.at("name").get<std::string>();
        decl.start_line = entry.at("start_line").get<int>();
        decl.end_line = entry.at("end_line").get<int>();
        items.push_back(std::move(decl));
    }
    return items;
}

json origin_to_json(const Origin& origin) {
    switch (origin.kind) {
        case Origin::Kind::FILE:
        case Origin::Kind::PACKAGE:
            return origin.path.string();
        case Origin::Kind::EXTERNAL:
            return std::string(Origin::kExternalSentinel);
        case Origin::Kind::NOT_FOUND:
        default:
            return nullptr;
    }
}

}  // namespace

json FileInventory::to_json() const {
    json calls = json::array();
    for (const auto& call : function_calls) {
        calls.push_back({
            {"type", call.kind == CallKind::FUNCTION_CALL ? "function_call" : "method_call"},
            {"name", call.name},
            {"start_line", call.start_line},
            {"end_line", call.end_line}
        });
    }

    json import_list = json::array();
    for (const auto& imp : imports) {
        import_list.push_back({
            {"type", "import"},
            {"imported_name", imp.imported_name},
            {"local_name", imp.local_name},
            {"from_module", imp.from_module},
            {"origin", origin_to_json(imp.origin)},
            {"origin_kind", std::string(to_string(imp.origin.kind))},
            {"line", imp.line},
            {"path_exists", imp.path_exists},
            {"usage_lines", imp.usage_lines}
        });
    }

    return {
        {"filename", filename},
        {"dialect", std::string(DialectUtils::to_string(dialect))},
        {"used_fallback", used_fallback},
        {"elements", {
            {"classes", declarations_to_json(classes, "class")},
            {"functions", declarations_to_json(functions, "function")},
            {"variables", declarations_to_json(variables, "variable")},
            {"function_calls", calls},
            {"imports", import_list}
        }}
    };
}

FileInventory FileInventory::from_json(const json& j) {
    FileInventory inventory;
    inventory.filename = j.at("filename").get<std::string>();
    inventory.dialect = DialectUtils::from_string(j.value("dialect", "javascript"));
    inventory.used_fallback = j.value("used_fallback", false);

    const json& elements = j.at("elements");
    inventory.classes = declarations_from_json(elements, "classes");
    inventory.functions = declarations_from_json(elements, "functions");
    inventory.variables = declarations_from_json(elements, "variables");

    for (const auto& entry : elements.value("function_calls", json::array())) {
        CallSite call;
        call.name = entry.at("name").get<std::string>();
        call.start_line = entry.at("start_line").get<int>();
        call.end_line = entry.at("end_line").get<int>();
        call.kind = entry.value("type", "function_call") == "method_call"
            ? CallKind::METHOD_CALL : CallKind::FUNCTION_CALL;
        inventory.function_calls.push_back(std::move(call));
    }

    for (const auto& entry : elements.value("imports", json::array())) {
        ImportRecord imp;
        imp.imported_name = entry.at("imported_name").get<std::string>();
        imp.local_name = entry.value("local_name", imp.imported_name);
        imp.from_module = entry.at("from_module").get<std::string>();
        imp.origin.kind = origin_kind_from_string(entry.value("origin_kind", "not_found"));
        if (imp.origin.has_path() && entry.at("origin").is_string()) {
            imp.origin.path = entry.at("origin").get<std::string>();
        }
        imp.line = entry.at("line").get<int>();
        imp.path_exists = entry.value("path_exists", false);
        imp.usage_lines = entry.value("usage_lines", std::vector<int>{});
        inventory.imports.push_back(std::move(imp));
    }

    return inventory;
}

}  // namespace apiscope
