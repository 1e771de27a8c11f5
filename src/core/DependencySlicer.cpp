#include "core/DependencySlicer.hpp"
#include "core/RouteHeuristics.hpp"
#include "core/SourceFile.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <regex>
#include <set>
#include <tuple>
#include <utility>

namespace apiscope {

namespace {

std::vector<const Declaration*> named(const std::vector<Declaration>& declarations,
                                      const std::string& name) {
    std::vector<const Declaration*> found;
    for (const auto& decl : declarations) {
        if (decl.name == name) {
            found.push_back(&decl);
        }
    }
    return found;
}

CodeBlock make_block(std::string name, std::string file, int start_line, int end_line,
                     const std::vector<std::string>& lines) {
    CodeBlock block;
    block.name = std::move(name);
    block.file = std::move(file);
    block.start_line = start_line;
    block.end_line = end_line;
    block.lines = slice_lines(lines, start_line, end_line);
    return block;
}

}  // namespace

std::string CodeBlock::text() const {
    return join_lines(lines);
}

json CodeBlock::to_json() const {
    return {
        {"name", name},
        {"file", file},
        {"start_line", start_line},
        {"end_line", end_line},
        {"code", text()}
    };
}

std::vector<std::vector<std::string>> ContextBundle::context_blocks() const {
    std::vector<std::vector<std::string>> blocks;
    for (const auto& block : dependency_blocks) {
        blocks.push_back(block.lines);
    }
    for (const auto& block : import_blocks) {
        blocks.push_back(block.lines);
    }
    if (responder_block) {
        blocks.push_back(responder_block->lines);
    }
    return blocks;
}

json ContextBundle::to_json() const {
    json deps = json::array();
    for (const auto& block : dependency_blocks) {
        deps.push_back(block.to_json());
    }
    json imports = json::array();
    for (const auto& block : import_blocks) {
        imports.push_back(block.to_json());
    }

    return {
        {"handler", join_lines(handler_lines)},
        {"dependencies", deps},
        {"imports", imports},
        {"responder", responder_block ? responder_block->to_json() : json(nullptr)}
    };
}

// ============================================================================
// DependencySlicer implementation
// ============================================================================

DependencySlicer::DependencySlicer(const InventorySnapshot& snapshot)
    : snapshot_(snapshot) {
}

const Declaration* DependencySlicer::select_definition(std::vector<const Declaration*> candidates,
                                                       int call_line) {
    if (candidates.empty()) {
        return nullptr;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Declaration* a, const Declaration* b) {
                         return a->start_line < b->start_line;
                     });

    const Declaration* preceding = nullptr;
    for (const Declaration* candidate : candidates) {
        if (candidate->contains(call_line)) {
            return candidate;
        }
        if (candidate->start_line <= call_line) {
            preceding = candidate;
        }
    }
    return preceding ? preceding : candidates.front();
}

std::vector<InFileDependency> DependencySlicer::find_in_file_dependencies(
    const FileInventory& inventory, const EndpointRecord& endpoint) {
    std::vector<InFileDependency> dependencies;
    std::set<std::pair<int, int>> visited;
    std::deque<std::pair<int, int>> pending = {{endpoint.start_line, endpoint.end_line}};

    auto add = [&](const std::string& name, int call_start, int call_end,
                   const Declaration* definition) {
        InFileDependency dep;
        dep.name = name;
        dep.file = inventory.filename;
        dep.call_start_line = call_start;
        dep.call_end_line = call_end;
        // A call without a located definition points at itself
        dep.definition_start_line = definition ? definition->start_line : call_start;
        dep.definition_end_line = definition ? definition->end_line : call_end;

        auto span = std::make_pair(dep.definition_start_line, dep.definition_end_line);
        if (!visited.insert(span).second) {
            return;
        }
        dependencies.push_back(std::move(dep));
        pending.push_back(span);
    };

    // Handlers passed by name: router.get('/x', handler)
    for (const auto& ref : endpoint.handler_refs) {
        auto candidates = named(inventory.functions, ref);
        if (candidates.empty()) {
            candidates = named(inventory.variables, ref);
        }
        if (candidates.empty()) {
            continue;
        }
        add(ref, endpoint.start_line, endpoint.end_line,
            select_definition(candidates, endpoint.start_line));
    }

    while (!pending.empty()) {
        auto [start_line, end_line] = pending.front();
        pending.pop_front();

        for (const auto& call : inventory.function_calls) {
            if (call.kind != CallKind::FUNCTION_CALL ||
                call.start_line < start_line || call.end_line > end_line ||
                RouteHeuristics::is_http_method(call.name)) {
                continue;
            }
            auto candidates = named(inventory.functions, call.name);
            if (candidates.empty()) {
                continue;
            }
            add(call.name, call.start_line, call.end_line,
                select_definition(candidates, call.start_line));
        }
    }

    return dependencies;
}

std::vector<const ImportRecord*> DependencySlicer::find_relevant_imports(
    const FileInventory& inventory, int start_line, int end_line,
    const std::vector<InFileDependency>& dependencies) {
    std::vector<const ImportRecord*> relevant;

    auto in_scope = [&](int line) {
        if (start_line <= line && line <= end_line) {
            return true;
        }
        for (const auto& dep : dependencies) {
            if ((dep.call_start_line <= line && line <= dep.call_end_line) ||
                (dep.definition_start_line <= line && line <= dep.definition_end_line)) {
                return true;
            }
        }
        return false;
    };

    for (const auto& imp : inventory.imports) {
        if (!imp.path_exists) {
            continue;
        }
        if (std::any_of(imp.usage_lines.begin(), imp.usage_lines.end(), in_scope)) {
            relevant.push_back(&imp);
        }
    }

    return relevant;
}

std::optional<CodeBlock> DependencySlicer::materialize_import(const ImportRecord& import) const {
    const FileInventory* origin = snapshot_.find(import.origin.path);
    if (!origin) {
        spdlog::debug("No inventory for {}, skipping import {}", import.origin.path.string(),
                      import.imported_name);
        return std::nullopt;
    }

    const Declaration* match = nullptr;
    for (const auto* category : {&origin->classes, &origin->functions, &origin->variables}) {
        auto found = named(*category, import.imported_name);
        if (!found.empty()) {
            match = found.front();
            break;
        }
    }
    if (!match) {
        return std::nullopt;
    }

    auto source = read_source(import.origin.path);
    if (!source) {
        spdlog::debug("Cannot read {}", import.origin.path.string());
        return std::nullopt;
    }

    auto block = make_block(import.imported_name, import.origin.path.string(),
                            match->start_line, match->end_line, split_lines(*source));
    if (block.lines.empty()) {
        return std::nullopt;
    }
    return block;
}

std::optional<CodeBlock> DependencySlicer::find_use_block(const std::vector<std::string>& lines,
                                                          const std::string& file) {
    static const std::regex use_pattern(R"(\.use\s*\(\s*['"]/:)");

    for (size_t i = 0; i < lines.size(); i++) {
        if (!std::regex_search(lines[i], use_pattern)) {
            continue;
        }

        CodeBlock block;
        block.name = "use";
        block.file = file;
        block.start_line = static_cast<int>(i) + 1;

        int depth = 0;
        bool started = false;
        for (size_t j = i; j < lines.size(); j++) {
            const std::string& line = lines[j];
            block.lines.push_back(line);
            depth += static_cast<int>(std::count(line.begin(), line.end(), '{')) -
                     static_cast<int>(std::count(line.begin(), line.end(), '}'));
            if (line.find('{') != std::string::npos) {
                started = true;
            }
            if (started && depth <= 0) {
                break;
            }
        }
        block.end_line = block.start_line + static_cast<int>(block.lines.size()) - 1;
        return block;
    }

    return std::nullopt;
}

ContextBundle DependencySlicer::slice(const EndpointRecord& endpoint) const {
    ContextBundle bundle;

    auto source = read_source(endpoint.file_path);
    if (!source) {
        spdlog::warn("Cannot read {}", endpoint.file_path);
        return bundle;
    }
    auto lines = split_lines(*source);
    bundle.handler_lines = slice_lines(lines, endpoint.start_line, endpoint.end_line);

    const FileInventory* inventory = snapshot_.find(endpoint.file_path);
    if (!inventory) {
        spdlog::debug("No inventory for {}", endpoint.file_path);
        return bundle;
    }

    auto dependencies = find_in_file_dependencies(*inventory, endpoint);
    for (const auto& dep : dependencies) {
        auto block = make_block(dep.name, dep.file, dep.definition_start_line,
                                dep.definition_end_line, lines);
        if (!block.lines.empty()) {
            bundle.dependency_blocks.push_back(std::move(block));
        }
    }

    std::set<std::tuple<std::string, int, int>> emitted;
    for (const ImportRecord* imp : find_relevant_imports(*inventory, endpoint.start_line,
                                                         endpoint.end_line, dependencies)) {
        auto block = materialize_import(*imp);
        if (!block) {
            continue;
        }
        if (emitted.emplace(block->file, block->start_line, block->end_line).second) {
            bundle.import_blocks.push_back(std::move(*block));
        }
    }

    bundle.responder_block = find_use_block(lines, endpoint.file_path);

    spdlog::debug("Sliced {} {}: {} dependencies, {} imports", endpoint.method,
                  endpoint.route.value_or("<dynamic>"), bundle.dependency_blocks.size(),
                  bundle.import_blocks.size());
    return bundle;
}

} // namespace apiscope
