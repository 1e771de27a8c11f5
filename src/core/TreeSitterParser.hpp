#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "core/Dialect.hpp"

extern "C" {
    struct TSParser;
    struct TSTree;
    struct TSNode;
}

namespace apiscope {

/**
 * @brief Owning handle of a parsed syntax tree
 */
class Tree {
public:
    explicit Tree(TSTree* tree);
    ~Tree();

    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;
    Tree(Tree&& other) noexcept;
    Tree& operator=(Tree&& other) noexcept;

    TSNode root_node() const;

    /**
     * @brief True when the grammar had to recover from ERROR or MISSING nodes
     */
    bool has_error() const;

    /**
     * @brief 1-based line of the first ERROR or MISSING node, in document order
     */
    std::optional<int> first_error_line() const;

    TSTree* get() const { return tree_; }

private:
    TSTree* tree_;
};

/**
 * @brief Parser bound to one ECMAScript dialect
 *
 * Not safe to share between threads; every worker owns its parsers.
 */
class TreeSitterParser {
public:
    /**
     * @throws std::runtime_error for UNKNOWN or a grammar ABI mismatch
     */
    explicit TreeSitterParser(Dialect dialect = Dialect::JAVASCRIPT);
    ~TreeSitterParser();

    TreeSitterParser(const TreeSitterParser&) = delete;
    TreeSitterParser& operator=(const TreeSitterParser&) = delete;
    TreeSitterParser(TreeSitterParser&& other) noexcept;
    TreeSitterParser& operator=(TreeSitterParser&& other) noexcept;

    /**
     * @brief Parse text, keeping whatever tree error recovery produced
     * @return nullptr only when tree-sitter gives up entirely
     */
    std::unique_ptr<Tree> parse_string(std::string_view source);

    /**
     * @brief Parse text and accept the result only without syntax errors
     *
     * Route detection relies on node shapes, so a recovered tree is treated
     * as no tree at all.
     */
    std::unique_ptr<Tree> parse_clean(std::string_view source);

    /**
     * @throws std::runtime_error if the file cannot be read
     */
    std::unique_ptr<Tree> parse_file(const std::filesystem::path& filepath);

    /**
     * @brief Source bytes covered by a node, empty when out of range
     */
    static std::string node_text(TSNode node, std::string_view source);

    Dialect dialect() const { return dialect_; }

private:
    void release();

    TSParser* parser_ = nullptr;
    Dialect dialect_;
};

} // namespace apiscope
