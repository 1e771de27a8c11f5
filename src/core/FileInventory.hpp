#pragma once

#include "core/Dialect.hpp"
#include "core/ModuleResolver.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief A named declaration and its 1-based inclusive line span
 */
struct Declaration {
    std::string name;
    int start_line = 1;
    int end_line = 1;

    bool contains(int line) const { return start_line <= line && line <= end_line; }
};

enum class CallKind {
    FUNCTION_CALL,  // callee is a bare identifier: foo()
    METHOD_CALL     // callee is a member access: obj.foo()
};

struct CallSite {
    std::string name;
    int start_line = 1;
    int end_line = 1;
    CallKind kind = CallKind::FUNCTION_CALL;
};

/**
 * @brief One imported binding
 *
 * `imported_name` is the name looked up in the origin module; `local_name`
 * is the binding visible in the importing file. Namespace and side-effect
 * imports use kNamespaceImport as imported name.
 */
struct ImportRecord {
    static constexpr std::string_view kNamespaceImport = "*";

    std::string imported_name;
    std::string local_name;
    std::string from_module;
    Origin origin;
    int line = 1;
    bool path_exists = false;
    std::vector<int> usage_lines;  // Sorted, excludes `line`
};

/**
 * @brief Structured symbol inventory of one source file
 */
struct FileInventory {
    std::string filename;
    Dialect dialect = Dialect::JAVASCRIPT;
    bool used_fallback = false;  // Extracted with the plain grammar after a typed failure

    std::vector<Declaration> classes;
    std::vector<Declaration> functions;
    std::vector<Declaration> variables;
    std::vector<CallSite> function_calls;
    std::vector<ImportRecord> imports;

    json to_json() const;
    static FileInventory from_json(const json& j);
};

}  // namespace apiscope
