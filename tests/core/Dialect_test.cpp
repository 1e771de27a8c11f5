#include <gtest/gtest.h>
#include "core/Dialect.hpp"

using namespace apiscope;

TEST(DialectTest, SelectsByExtension) {
    EXPECT_EQ(DialectUtils::select("src/app.js"), Dialect::JAVASCRIPT);
    EXPECT_EQ(DialectUtils::select("src/app.cjs"), Dialect::JAVASCRIPT);
    EXPECT_EQ(DialectUtils::select("src/app.mjs"), Dialect::JAVASCRIPT);
    EXPECT_EQ(DialectUtils::select("src/app.ts"), Dialect::TYPESCRIPT);
    EXPECT_EQ(DialectUtils::select("src/app.cts"), Dialect::TYPESCRIPT);
    EXPECT_EQ(DialectUtils::select("src/app.mts"), Dialect::TYPESCRIPT);
    EXPECT_EQ(DialectUtils::select("src/App.tsx"), Dialect::TSX);
}

TEST(DialectTest, SelectionIsCaseInsensitive) {
    EXPECT_EQ(DialectUtils::select("ROUTES.JS"), Dialect::JAVASCRIPT);
    EXPECT_EQ(DialectUtils::select("Page.TSX"), Dialect::TSX);
    EXPECT_EQ(DialectUtils::select("server.Ts"), Dialect::TYPESCRIPT);
}

TEST(DialectTest, UnsupportedFiles) {
    EXPECT_EQ(DialectUtils::select("README.md"), Dialect::UNKNOWN);
    EXPECT_EQ(DialectUtils::select("Makefile"), Dialect::UNKNOWN);
    EXPECT_EQ(DialectUtils::select(""), Dialect::UNKNOWN);
    EXPECT_FALSE(DialectUtils::is_supported("styles.css"));
    EXPECT_TRUE(DialectUtils::is_supported("index.mjs"));
}

TEST(DialectTest, TypedDialects) {
    EXPECT_TRUE(DialectUtils::is_typed(Dialect::TYPESCRIPT));
    EXPECT_TRUE(DialectUtils::is_typed(Dialect::TSX));
    EXPECT_FALSE(DialectUtils::is_typed(Dialect::JAVASCRIPT));
    EXPECT_FALSE(DialectUtils::is_typed(Dialect::UNKNOWN));
}

TEST(DialectTest, NamesRoundTrip) {
    for (Dialect dialect : {Dialect::JAVASCRIPT, Dialect::TYPESCRIPT, Dialect::TSX}) {
        EXPECT_EQ(DialectUtils::from_string(DialectUtils::to_string(dialect)), dialect);
    }
    EXPECT_EQ(DialectUtils::from_string("js"), Dialect::JAVASCRIPT);
    EXPECT_EQ(DialectUtils::from_string("ts"), Dialect::TYPESCRIPT);
    EXPECT_EQ(DialectUtils::from_string("python"), Dialect::UNKNOWN);
}

TEST(DialectTest, GrammarsAvailable) {
    EXPECT_NE(DialectUtils::get_ts_language(Dialect::JAVASCRIPT), nullptr);
    EXPECT_NE(DialectUtils::get_ts_language(Dialect::TYPESCRIPT), nullptr);
    EXPECT_NE(DialectUtils::get_ts_language(Dialect::TSX), nullptr);
    EXPECT_EQ(DialectUtils::get_ts_language(Dialect::UNKNOWN), nullptr);
}

TEST(DialectTest, ResolutionOrderPrefersTypedSources) {
    const auto& exts = DialectUtils::resolution_extensions();
    ASSERT_FALSE(exts.empty());
    EXPECT_EQ(exts.front(), ".ts");
    EXPECT_EQ(exts.back(), ".d.ts");
}
