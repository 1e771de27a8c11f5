#include "tools/DetectEndpointsTool.hpp"
#include "tools/ExtractSymbolsTool.hpp"
#include "tools/GenerateSwaggerTool.hpp"
#include "tools/SliceEndpointTool.hpp"
#include "pipeline/SkeletonFragmentGenerator.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace apiscope;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::path test_dir = fs::path(__FILE__).parent_path();
        fixtures_dir = test_dir / ".." / "fixtures";
        ASSERT_TRUE(fs::exists(fixtures_dir)) << "Fixtures directory not found: " << fixtures_dir;

        // Tools that cache inventories write beneath the root, so they get a copy
        work_dir = fs::temp_directory_path() /
            (std::string("apiscope_tools_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(work_dir);
        fs::create_directories(work_dir);
        fs::copy(fixtures_dir / "widgets", work_dir / "widgets", fs::copy_options::recursive);

        config.api_host = "http://localhost:3000";
        config.commit_reference = "cafebabe";
    }

    void TearDown() override {
        fs::remove_all(work_dir);
    }

    fs::path fixtures_dir;
    fs::path work_dir;
    PipelineConfig config;
};

TEST_F(ToolsTest, ExtractSymbolsTool_Success) {
    ExtractSymbolsTool tool;

    json result = tool.execute({{"filepath", (fixtures_dir / "widgets" / "routes.js").string()}});

    ASSERT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["dialect"], "javascript");
    EXPECT_TRUE(result.contains("elements"));
}

TEST_F(ToolsTest, ExtractSymbolsTool_FileNotFound) {
    ExtractSymbolsTool tool;

    json result = tool.execute({{"filepath", "/nonexistent/file.js"}});

    EXPECT_TRUE(result.contains("error"));
}

TEST_F(ToolsTest, ExtractSymbolsTool_MissingParameter) {
    ExtractSymbolsTool tool;

    json result = tool.execute(json::object());

    EXPECT_TRUE(result.contains("error"));
}

TEST_F(ToolsTest, DetectEndpointsTool_SingleFile) {
    DetectEndpointsTool tool(config);

    json result = tool.execute({{"filepath", (fixtures_dir / "users.controller.ts").string()}});

    ASSERT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["count"], 2);
    EXPECT_EQ(result["files_scanned"], 1);

    bool found = false;
    for (const auto& endpoint : result["endpoints"]) {
        if (endpoint["method"] == "GET" && endpoint["route"] == "/users/{id}") {
            found = true;
            EXPECT_EQ(endpoint["tier"], "decorator");
        }
    }
    EXPECT_TRUE(found) << result.dump();
}

TEST_F(ToolsTest, DetectEndpointsTool_RawRoutes) {
    DetectEndpointsTool tool(config);

    json result = tool.execute({
        {"filepath", (fixtures_dir / "widgets").string()},
        {"normalize", false}
    });

    ASSERT_EQ(result["count"], 1);
    EXPECT_EQ(result["endpoints"][0]["route"], "/widgets/:id");
    EXPECT_EQ(result["endpoints"][0]["handlers"][0], "handler");
    EXPECT_EQ(result["files_scanned"], 2);
}

TEST_F(ToolsTest, DetectEndpointsTool_MissingPath) {
    DetectEndpointsTool tool(config);

    EXPECT_TRUE(tool.execute(json::object()).contains("error"));
    EXPECT_TRUE(tool.execute({{"filepath", "/nonexistent/dir"}}).contains("error"));
}

TEST_F(ToolsTest, SliceEndpointTool_Success) {
    SliceEndpointTool tool(config);

    json result = tool.execute({
        {"root", work_dir.string()},
        {"filepath", (work_dir / "widgets" / "routes.js").string()},
        {"method", "get"},
        {"route", "/widgets/:id"}
    });

    ASSERT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["endpoint"]["route"], "/widgets/{id}");
    EXPECT_EQ(result["bundle"]["dependencies"].size(), 2);
    ASSERT_EQ(result["bundle"]["imports"].size(), 1);
    EXPECT_EQ(result["bundle"]["imports"][0]["name"], "db");
    EXPECT_FALSE(fs::exists(work_dir / ".apiscope_inventory"));
}

TEST_F(ToolsTest, SliceEndpointTool_NoMatch) {
    SliceEndpointTool tool(config);

    json result = tool.execute({
        {"root", work_dir.string()},
        {"filepath", (work_dir / "widgets" / "routes.js").string()},
        {"method", "POST"}
    });

    EXPECT_TRUE(result.contains("error"));
    EXPECT_EQ(result["candidates"], 1);
}

TEST_F(ToolsTest, SliceEndpointTool_MissingParameters) {
    SliceEndpointTool tool(config);

    json result = tool.execute({{"root", work_dir.string()}});

    EXPECT_TRUE(result.contains("error"));
}

TEST_F(ToolsTest, GenerateSwaggerTool_Success) {
    GenerateSwaggerTool tool(config, std::make_shared<SkeletonFragmentGenerator>());

    json result = tool.execute({{"root", (work_dir / "widgets").string()}, {"title", "Widgets"}});

    ASSERT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["swagger"]["info"]["title"], "Widgets");
    EXPECT_EQ(result["swagger"]["servers"][0]["url"], "http://localhost:3000");
    EXPECT_TRUE(result["swagger"]["paths"].contains("/widgets/{id}"));
    EXPECT_EQ(result["stats"]["endpoints"], 1);
}

TEST_F(ToolsTest, GenerateSwaggerTool_BadRoot) {
    GenerateSwaggerTool tool(config, std::make_shared<SkeletonFragmentGenerator>());

    EXPECT_TRUE(tool.execute({{"root", "/nonexistent/dir"}}).contains("error"));
    EXPECT_TRUE(tool.execute(json::object()).contains("error"));
    EXPECT_THROW(GenerateSwaggerTool unusable(config, nullptr), std::invalid_argument);
}

TEST_F(ToolsTest, ToolInfoSchemas) {
    for (const ToolInfo& info : {ExtractSymbolsTool::get_info(), DetectEndpointsTool::get_info(),
                                 SliceEndpointTool::get_info(), GenerateSwaggerTool::get_info()}) {
        EXPECT_FALSE(info.name.empty());
        EXPECT_FALSE(info.description.empty()) << info.name;
        EXPECT_EQ(info.input_schema["type"], "object") << info.name;
        EXPECT_TRUE(info.input_schema.contains("required")) << info.name;
    }
}
