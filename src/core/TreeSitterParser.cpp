#include "core/TreeSitterParser.hpp"
#include "core/SourceFile.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

extern "C" {
    #include <tree_sitter/api.h>
}

namespace apiscope {

namespace {

std::optional<int> first_error_in(TSNode node) {
    if (ts_node_is_error(node) || ts_node_is_missing(node)) {
        return static_cast<int>(ts_node_start_point(node).row) + 1;
    }
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_has_error(child)) {
            continue;
        }
        if (auto line = first_error_in(child)) {
            return line;
        }
    }
    return std::nullopt;
}

}  // namespace

Tree::Tree(TSTree* tree) : tree_(tree) {
    if (!tree_) {
        throw std::invalid_argument("Tree requires a parsed TSTree");
    }
}

Tree::~Tree() {
    if (tree_) {
        ts_tree_delete(tree_);
    }
}

Tree::Tree(Tree&& other) noexcept : tree_(other.tree_) {
    other.tree_ = nullptr;
}

Tree& Tree::operator=(Tree&& other) noexcept {
    if (this != &other) {
        if (tree_) {
            ts_tree_delete(tree_);
        }
        tree_ = other.tree_;
        other.tree_ = nullptr;
    }
    return *this;
}

TSNode Tree::root_node() const {
    return ts_tree_root_node(tree_);
}

bool Tree::has_error() const {
    return ts_node_has_error(root_node());
}

std::optional<int> Tree::first_error_line() const {
    TSNode root = root_node();
    if (!ts_node_has_error(root)) {
        return std::nullopt;
    }
    return first_error_in(root);
}

TreeSitterParser::TreeSitterParser(Dialect dialect) : dialect_(dialect) {
    const TSLanguage* grammar = DialectUtils::get_ts_language(dialect);
    if (!grammar) {
        throw std::runtime_error("No grammar for dialect " +
                                 std::string(DialectUtils::to_string(dialect)));
    }

    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("ts_parser_new failed");
    }
    if (!ts_parser_set_language(parser_, grammar)) {
        release();
        throw std::runtime_error("Grammar ABI mismatch for dialect " +
                                 std::string(DialectUtils::to_string(dialect)));
    }
}

TreeSitterParser::~TreeSitterParser() {
    release();
}

TreeSitterParser::TreeSitterParser(TreeSitterParser&& other) noexcept
    : parser_(other.parser_), dialect_(other.dialect_) {
    other.parser_ = nullptr;
}

TreeSitterParser& TreeSitterParser::operator=(TreeSitterParser&& other) noexcept {
    if (this != &other) {
        release();
        parser_ = other.parser_;
        dialect_ = other.dialect_;
        other.parser_ = nullptr;
    }
    return *this;
}

void TreeSitterParser::release() {
    if (parser_) {
        ts_parser_delete(parser_);
        parser_ = nullptr;
    }
}

std::unique_ptr<Tree> TreeSitterParser::parse_string(std::string_view source) {
    TSTree* raw = ts_parser_parse_string(parser_, nullptr, source.data(),
                                         static_cast<uint32_t>(source.size()));
    if (!raw) {
        spdlog::error("tree-sitter produced no tree ({})", DialectUtils::to_string(dialect_));
        return nullptr;
    }
    return std::make_unique<Tree>(raw);
}

std::unique_ptr<Tree> TreeSitterParser::parse_clean(std::string_view source) {
    auto tree = parse_string(source);
    if (!tree) {
        return nullptr;
    }
    if (auto line = tree->first_error_line()) {
        spdlog::debug("{} parse has a syntax error at line {}",
                      DialectUtils::to_string(dialect_), *line);
        return nullptr;
    }
    return tree;
}

std::unique_ptr<Tree> TreeSitterParser::parse_file(const std::filesystem::path& filepath) {
    auto source = read_source(filepath);
    if (!source) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }
    return parse_string(*source);
}

std::string TreeSitterParser::node_text(TSNode node, std::string_view source) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= end || end > source.size()) {
        return "";
    }
    return std::string(source.substr(start, end - start));
}

} // namespace apiscope
