#pragma once

#include "core/EndpointDetector.hpp"
#include "core/FileInventory.hpp"
#include "core/InventoryCache.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace apiscope {

using json = nlohmann::json;

/**
 * @brief Literal source lines copied from one file
 */
struct CodeBlock {
    std::string name;
    std::string file;
    int start_line = 1;
    int end_line = 1;
    std::vector<std::string> lines;  // Each keeps its newline

    std::string text() const;
    json to_json() const;
};

/**
 * @brief A call to an in-file function and the definition chosen for it
 */
struct InFileDependency {
    std::string name;
    std::string file;
    int call_start_line = 1;
    int call_end_line = 1;
    int definition_start_line = 1;
    int definition_end_line = 1;
};

/**
 * @brief Source context for one endpoint
 */
struct ContextBundle {
    std::vector<std::string> handler_lines;
    std::vector<CodeBlock> dependency_blocks;   // In-file definitions, discovery order
    std::vector<CodeBlock> import_blocks;       // Declarations from origin files
    std::optional<CodeBlock> responder_block;   // Catch-all `use('/:name', ...)` block

    /**
     * @brief Dependency, import and responder blocks in that order
     */
    std::vector<std::vector<std::string>> context_blocks() const;

    json to_json() const;
};

/**
 * @brief Assembles the ContextBundle of an endpoint from cached inventories
 *
 * Only reads files and the snapshot; a single instance may be used from
 * several threads at once.
 */
class DependencySlicer {
public:
    explicit DependencySlicer(const InventorySnapshot& snapshot);

    /**
     * @brief Build the bundle; missing files and spans are skipped
     */
    ContextBundle slice(const EndpointRecord& endpoint) const;

    /**
     * @brief In-file functions reached from the endpoint's span
     *
     * Bare calls inside the span whose name is a declared function (never an
     * HTTP verb name) are dependencies, as are the registration's handler
     * references. Definition spans of dependencies are scanned the same way
     * until no new definition appears. Method calls are not followed.
     */
    static std::vector<InFileDependency> find_in_file_dependencies(
        const FileInventory& inventory, const EndpointRecord& endpoint);

    /**
     * @brief Imports with an on-disk origin used inside the endpoint or its dependencies
     */
    static std::vector<const ImportRecord*> find_relevant_imports(
        const FileInventory& inventory, int start_line, int end_line,
        const std::vector<InFileDependency>& dependencies);

    /**
     * @brief Pick the declaration a call at `call_line` refers to
     *
     * Candidates are ordered by start line. A declaration whose span contains
     * the call wins. Otherwise the last one starting at or before the call is
     * taken. When every candidate starts after the call, the first one is
     * used. Returns nullptr only for an empty candidate list.
     */
    static const Declaration* select_definition(std::vector<const Declaration*> candidates,
                                                int call_line);

    /**
     * @brief First `.use('/:...')` registration and its brace-delimited block
     */
    static std::optional<CodeBlock> find_use_block(const std::vector<std::string>& lines,
                                                   const std::string& file);

private:
    const InventorySnapshot& snapshot_;

    std::optional<CodeBlock> materialize_import(const ImportRecord& import) const;
};

} // namespace apiscope
