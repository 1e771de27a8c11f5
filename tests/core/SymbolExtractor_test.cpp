#include <gtest/gtest.h>
#include "core/SymbolExtractor.hpp"
#include <algorithm>
#include <filesystem>

using namespace apiscope;
namespace fs = std::filesystem;

namespace {

fs::path fixtures_dir() {
    return fs::path(__FILE__).parent_path() / ".." / "fixtures";
}

const Declaration* find_declaration(const std::vector<Declaration>& decls, const std::string& name) {
    auto it = std::find_if(decls.begin(), decls.end(),
                           [&](const Declaration& d) { return d.name == name; });
    return it == decls.end() ? nullptr : &*it;
}

const ImportRecord* find_import(const FileInventory& inventory, const std::string& local_name) {
    auto it = std::find_if(inventory.imports.begin(), inventory.imports.end(),
                           [&](const ImportRecord& r) { return r.local_name == local_name; });
    return it == inventory.imports.end() ? nullptr : &*it;
}

}  // namespace

class SymbolExtractorTest : public ::testing::Test {
protected:
    SymbolExtractor extractor_;
};

// Test 1: RouterFile - functions, variables, calls and imports of a plain script
TEST_F(SymbolExtractorTest, RouterFile) {
    fs::path file = fixtures_dir() / "widgets" / "routes.js";
    FileInventory inventory = extractor_.extract(file);

    EXPECT_EQ(inventory.dialect, Dialect::JAVASCRIPT);
    EXPECT_FALSE(inventory.used_fallback);

    const auto* load_widget = find_declaration(inventory.functions, "loadWidget");
    ASSERT_NE(load_widget, nullptr);
    EXPECT_EQ(load_widget->start_line, 6);
    EXPECT_EQ(load_widget->end_line, 8);

    const auto* handler = find_declaration(inventory.functions, "handler");
    ASSERT_NE(handler, nullptr);
    EXPECT_EQ(handler->start_line, 10);
    EXPECT_EQ(handler->end_line, 13);

    EXPECT_NE(find_declaration(inventory.variables, "router"), nullptr);
    EXPECT_NE(find_declaration(inventory.variables, "widget"), nullptr);

    bool saw_load_call = std::any_of(
        inventory.function_calls.begin(), inventory.function_calls.end(),
        [](const CallSite& c) {
            return c.name == "loadWidget" && c.start_line == 11 && c.kind == CallKind::FUNCTION_CALL;
        });
    EXPECT_TRUE(saw_load_call) << "Bare call to loadWidget on line 11";

    bool saw_method_call = std::any_of(
        inventory.function_calls.begin(), inventory.function_calls.end(),
        [](const CallSite& c) { return c.name == "json" && c.kind == CallKind::METHOD_CALL; });
    EXPECT_TRUE(saw_method_call) << "res.json() is a method call";
}

// Test 2: RequireImports - require() bindings are resolved and their usages recorded
TEST_F(SymbolExtractorTest, RequireImports) {
    fs::path file = fixtures_dir() / "widgets" / "routes.js";
    FileInventory inventory = extractor_.extract(file);

    const auto* db = find_import(inventory, "db");
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->from_module, "./db");
    EXPECT_EQ(db->line, 2);
    EXPECT_EQ(db->origin.kind, Origin::Kind::FILE);
    EXPECT_EQ(db->origin.path.filename(), "db.js");
    EXPECT_TRUE(db->path_exists);
    EXPECT_EQ(db->usage_lines, std::vector<int>{7}) << "Declaration line is not a usage";

    const auto* express = find_import(inventory, "express");
    ASSERT_NE(express, nullptr);
    EXPECT_EQ(express->origin.kind, Origin::Kind::EXTERNAL);
    EXPECT_FALSE(express->path_exists);
    EXPECT_EQ(express->usage_lines, std::vector<int>{4});
}

// Test 3: EsImportForms - default, namespace, named, aliased and side-effect imports
TEST_F(SymbolExtractorTest, EsImportForms) {
    std::string source =
        "import express from 'express';\n"
        "import * as path from 'path';\n"
        "import { a, b as c } from './local';\n"
        "import './polyfills';\n"
        "a(c, path.sep);\n";

    FileInventory inventory = extractor_.extract_source(
        source, fixtures_dir() / "imports.ts", Dialect::TYPESCRIPT, fixtures_dir());

    ASSERT_EQ(inventory.imports.size(), 5u);

    const auto* def = find_import(inventory, "express");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->imported_name, "express");

    const auto* ns = find_import(inventory, "path");
    ASSERT_NE(ns, nullptr);
    EXPECT_EQ(ns->imported_name, ImportRecord::kNamespaceImport);
    EXPECT_EQ(ns->usage_lines, std::vector<int>{5});

    const auto* aliased = find_import(inventory, "c");
    ASSERT_NE(aliased, nullptr);
    EXPECT_EQ(aliased->imported_name, "b");
    EXPECT_EQ(aliased->from_module, "./local");
    EXPECT_EQ(aliased->origin.kind, Origin::Kind::NOT_FOUND);
    EXPECT_FALSE(aliased->path_exists);

    const auto* side_effect = find_import(inventory, "");
    ASSERT_NE(side_effect, nullptr);
    EXPECT_EQ(side_effect->from_module, "./polyfills");
    EXPECT_EQ(side_effect->line, 4);
}

// Test 4: DestructuredRequire - object patterns produce one record per binding
TEST_F(SymbolExtractorTest, DestructuredRequire) {
    std::string source =
        "const { join, resolve: r } = require('path');\n"
        "join(r('.'), 'x');\n";

    FileInventory inventory = extractor_.extract_source(
        source, fixtures_dir() / "paths.js", Dialect::JAVASCRIPT, fixtures_dir());

    ASSERT_EQ(inventory.imports.size(), 2u);
    const auto* join = find_import(inventory, "join");
    ASSERT_NE(join, nullptr);
    EXPECT_EQ(join->imported_name, "join");

    const auto* resolve = find_import(inventory, "r");
    ASSERT_NE(resolve, nullptr);
    EXPECT_EQ(resolve->imported_name, "resolve");
    EXPECT_EQ(resolve->usage_lines, std::vector<int>{2});
}

// Test 5: ExportedDeclarationsWiden - spans cover the export keyword and the full statement
TEST_F(SymbolExtractorTest, ExportedDeclarationsWiden) {
    std::string source =
        "export const limit =\n"
        "  10;\n"
        "\n"
        "export class Service {\n"
        "  run() {}\n"
        "}\n";

    FileInventory inventory = extractor_.extract_source(
        source, fixtures_dir() / "exports.ts", Dialect::TYPESCRIPT, fixtures_dir());

    const auto* limit = find_declaration(inventory.variables, "limit");
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(limit->start_line, 1);
    EXPECT_EQ(limit->end_line, 2);

    const auto* service = find_declaration(inventory.classes, "Service");
    ASSERT_NE(service, nullptr);
    EXPECT_EQ(service->start_line, 4);
    EXPECT_EQ(service->end_line, 6);
}

// Test 6: SpansAreOrdered - every recorded span is 1-based and non-inverted
TEST_F(SymbolExtractorTest, SpansAreOrdered) {
    for (const char* name : {"users.controller.ts", "users.service.ts", "validate_twice.js"}) {
        FileInventory inventory = extractor_.extract(fixtures_dir() / name);
        for (const auto* decls : {&inventory.classes, &inventory.functions, &inventory.variables}) {
            for (const auto& decl : *decls) {
                EXPECT_GE(decl.start_line, 1) << name << ": " << decl.name;
                EXPECT_LE(decl.start_line, decl.end_line) << name << ": " << decl.name;
            }
        }
        for (const auto& call : inventory.function_calls) {
            EXPECT_LE(call.start_line, call.end_line) << name << ": " << call.name;
        }
    }
}

// Test 7: Idempotent - extracting the same file twice gives identical inventories
TEST_F(SymbolExtractorTest, Idempotent) {
    fs::path file = fixtures_dir() / "users.controller.ts";

    json first = extractor_.extract(file).to_json();
    SymbolExtractor fresh;
    json second = fresh.extract(file).to_json();
    json third = extractor_.extract(file).to_json();

    EXPECT_EQ(first.dump(), second.dump());
    EXPECT_EQ(first.dump(), third.dump()) << "Cached parsers and queries do not leak state";
}

// Test 8: DuplicateNamesKept - both declarations of a repeated name are recorded
TEST_F(SymbolExtractorTest, DuplicateNamesKept) {
    FileInventory inventory = extractor_.extract(fixtures_dir() / "validate_twice.js");

    auto count = std::count_if(inventory.functions.begin(), inventory.functions.end(),
                               [](const Declaration& d) { return d.name == "validate"; });
    EXPECT_EQ(count, 2);
}

// Test 9: TypedFileWithSyntaxErrors - the tree is still queried
TEST_F(SymbolExtractorTest, TypedFileWithSyntaxErrors) {
    FileInventory inventory = extractor_.extract(fixtures_dir() / "malformed_decorators.ts");

    EXPECT_EQ(inventory.dialect, Dialect::TYPESCRIPT);
    EXPECT_FALSE(inventory.used_fallback);
    EXPECT_NE(find_declaration(inventory.functions, "formatName"), nullptr);
    EXPECT_NE(find_declaration(inventory.functions, "buildReport"), nullptr);
}

// Test 10: FallbackToPlainGrammar - a typed query failure retries with the plain grammar
TEST_F(SymbolExtractorTest, FallbackToPlainGrammar) {
    extractor_.override_symbol_query(Dialect::TYPESCRIPT, "(nonexistent_node) @x");

    std::string source =
        "function a() {}\n"
        "function b() { return a(); }\n";
    FileInventory inventory = extractor_.extract_source(
        source, fixtures_dir() / "fallback.ts", Dialect::TYPESCRIPT, fixtures_dir());

    EXPECT_TRUE(inventory.used_fallback);
    EXPECT_EQ(inventory.dialect, Dialect::TYPESCRIPT) << "Selected dialect is reported";
    EXPECT_NE(find_declaration(inventory.functions, "a"), nullptr);
    EXPECT_NE(find_declaration(inventory.functions, "b"), nullptr);
}

// Test 11: PlainGrammarFailureThrows - there is nothing to fall back to
TEST_F(SymbolExtractorTest, PlainGrammarFailureThrows) {
    extractor_.override_symbol_query(Dialect::JAVASCRIPT, "(nonexistent_node) @x");

    EXPECT_THROW(extractor_.extract_source("function a() {}", fixtures_dir() / "a.js",
                                           Dialect::JAVASCRIPT, fixtures_dir()),
                 ParseError);
}

// Test 12: MissingFile - unreadable input is a ParseError
TEST_F(SymbolExtractorTest, MissingFile) {
    EXPECT_THROW(extractor_.extract(fixtures_dir() / "does_not_exist.js"), ParseError);
}

// Test 13: JsonRoundTrip - serialized inventories restore the same content
TEST_F(SymbolExtractorTest, JsonRoundTrip) {
    FileInventory inventory = extractor_.extract(fixtures_dir() / "widgets" / "routes.js");

    FileInventory restored = FileInventory::from_json(inventory.to_json());

    EXPECT_EQ(restored.to_json().dump(), inventory.to_json().dump());
    ASSERT_NE(find_import(restored, "db"), nullptr);
    EXPECT_EQ(find_import(restored, "db")->origin.kind, Origin::Kind::FILE);
}
