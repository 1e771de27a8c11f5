#include <gtest/gtest.h>
#include "core/EndpointDetector.hpp"
#include <algorithm>
#include <filesystem>

using namespace apiscope;
namespace fs = std::filesystem;

namespace {

fs::path fixtures_dir() {
    return fs::path(__FILE__).parent_path() / ".." / "fixtures";
}

const EndpointRecord* find_endpoint(const std::vector<EndpointRecord>& endpoints,
                                    const std::string& method, const std::string& route) {
    auto it = std::find_if(endpoints.begin(), endpoints.end(), [&](const EndpointRecord& e) {
        return e.method == method && e.route && *e.route == route;
    });
    return it == endpoints.end() ? nullptr : &*it;
}

}  // namespace

class EndpointDetectorTest : public ::testing::Test {
protected:
    EndpointDetector detector_;
};

// Test 1: RouterCall - express-style registration with a named handler
TEST_F(EndpointDetectorTest, RouterCall) {
    auto endpoints = detector_.detect(fixtures_dir() / "widgets" / "routes.js");

    ASSERT_EQ(endpoints.size(), 1u) << "express.Router() and module.exports are not routes";
    const auto& endpoint = endpoints[0];
    EXPECT_EQ(endpoint.method, "GET");
    ASSERT_TRUE(endpoint.route.has_value());
    EXPECT_EQ(*endpoint.route, "/widgets/:id");
    EXPECT_EQ(endpoint.start_line, 15);
    EXPECT_EQ(endpoint.end_line, 15);
    EXPECT_EQ(endpoint.tier, DetectionTier::CALL_PATTERN);
    EXPECT_EQ(endpoint.handler_refs, std::vector<std::string>{"handler"});
}

// Test 2: InlineHandlers - arrow handlers produce no handler references
TEST_F(EndpointDetectorTest, InlineHandlers) {
    auto endpoints = detector_.detect(fixtures_dir() / "optional_catch.js");

    ASSERT_EQ(endpoints.size(), 2u);
    const auto* health = find_endpoint(endpoints, "GET", "/health");
    ASSERT_NE(health, nullptr);
    EXPECT_EQ(health->start_line, 3);
    EXPECT_EQ(health->end_line, 9);
    EXPECT_TRUE(health->handler_refs.empty());

    const auto* items = find_endpoint(endpoints, "POST", "/items");
    ASSERT_NE(items, nullptr);
    EXPECT_EQ(items->start_line, 11);
}

// Test 3: ControllerDecorators - class prefix composed with method decorators
TEST_F(EndpointDetectorTest, ControllerDecorators) {
    auto endpoints = detector_.detect(fixtures_dir() / "users.controller.ts");

    ASSERT_EQ(endpoints.size(), 2u) << "helper() carries no HTTP decorator";

    const auto* find_one = find_endpoint(endpoints, "GET", "/users/:id");
    ASSERT_NE(find_one, nullptr);
    EXPECT_EQ(find_one->start_line, 8) << "Span starts at the decorator";
    EXPECT_EQ(find_one->end_line, 11);
    EXPECT_EQ(find_one->tier, DetectionTier::DECORATOR);

    const auto* create = find_endpoint(endpoints, "POST", "/users/");
    ASSERT_NE(create, nullptr) << "Empty decorator argument maps to the controller prefix";
    EXPECT_EQ(create->start_line, 13);
    EXPECT_EQ(create->end_line, 16);
}

// Test 4: ControllerWithoutPath - bare @Controller() mounts at the root
TEST_F(EndpointDetectorTest, ControllerWithoutPath) {
    std::string source =
        "@Controller()\n"
        "class HealthController {\n"
        "  @Get('status')\n"
        "  status() { return 'ok'; }\n"
        "\n"
        "  @Delete()\n"
        "  // removes everything\n"
        "  purge() {}\n"
        "}\n";

    auto endpoints = detector_.detect_source(source, "health.ts", Dialect::TYPESCRIPT);

    ASSERT_EQ(endpoints.size(), 2u);
    EXPECT_NE(find_endpoint(endpoints, "GET", "/status"), nullptr);
    EXPECT_NE(find_endpoint(endpoints, "DELETE", "/"), nullptr)
        << "Comments between decorator and member do not detach the decorator";
}

// Test 5: UnparseableFile - text patterns recover route calls
TEST_F(EndpointDetectorTest, UnparseableFile) {
    auto endpoints = detector_.detect(fixtures_dir() / "broken_routes.js");

    ASSERT_EQ(endpoints.size(), 2u);

    const auto* status = find_endpoint(endpoints, "GET", "/status");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->start_line, 3);
    EXPECT_EQ(status->tier, DetectionTier::TEXT_PATTERN);

    const auto* remove = find_endpoint(endpoints, "DELETE", "/items/:id");
    ASSERT_NE(remove, nullptr);
    EXPECT_EQ(remove->start_line, 5);
}

// Test 6: MalformedTypedController - decorator markers recovered from text
TEST_F(EndpointDetectorTest, MalformedTypedController) {
    auto endpoints = detector_.detect(fixtures_dir() / "malformed_decorators.ts");

    ASSERT_EQ(endpoints.size(), 1u);
    EXPECT_EQ(endpoints[0].method, "GET");
    ASSERT_TRUE(endpoints[0].route.has_value());
    EXPECT_EQ(*endpoints[0].route, "/reports/:id");
    EXPECT_EQ(endpoints[0].start_line, 13);
    EXPECT_EQ(endpoints[0].tier, DetectionTier::TEXT_PATTERN);
}

// Test 7: NonRouteObjects - verb-named methods on other objects are ignored
TEST_F(EndpointDetectorTest, NonRouteObjects) {
    std::string source =
        "const cache = new Map();\n"
        "cache.get('/x');\n"
        "headers.delete('/y');\n"
        "apiRouter.put('/z', update);\n";

    auto endpoints = detector_.detect_source(source, "mixed.js", Dialect::JAVASCRIPT);

    ASSERT_EQ(endpoints.size(), 1u);
    EXPECT_EQ(endpoints[0].method, "PUT");
    EXPECT_EQ(endpoints[0].handler_refs, std::vector<std::string>{"update"});
}

// Test 8: DynamicRoutes - interpolated templates and variables have no route
TEST_F(EndpointDetectorTest, DynamicRoutes) {
    std::string source =
        "app.get(`/users/${id}`, show);\n"
        "app.all(prefix, anything);\n"
        "app.patch(`/plain`, edit);\n";

    auto endpoints = detector_.detect_source(source, "dynamic.js", Dialect::JAVASCRIPT);

    ASSERT_EQ(endpoints.size(), 3u);
    EXPECT_EQ(endpoints[0].route, std::nullopt);
    EXPECT_EQ(endpoints[1].method, "ALL");
    EXPECT_EQ(endpoints[1].route, std::nullopt);
    EXPECT_EQ(endpoints[2].route, std::optional<std::string>("/plain"));
}

// Test 9: TiersDeduplicate - the same declaration seen by two tiers is kept once
TEST_F(EndpointDetectorTest, TiersDeduplicate) {
    std::string source =
        "app.get('/a', a);\n"
        "app.post('/b', b);\n";

    ParsedSource parsed = detector_.parse(source, Dialect::JAVASCRIPT);
    ASSERT_TRUE(parsed.structural);

    ParsedSource text_only;
    text_only.text = parsed.text;
    text_only.dialect = parsed.dialect;

    auto structural = detector_.call_pattern_tier(parsed, "dup.js");
    auto textual = EndpointDetector::text_pattern_tier(text_only, "dup.js");
    ASSERT_TRUE(structural.has_value());
    ASSERT_TRUE(textual.has_value());
    ASSERT_EQ(textual->size(), 2u);

    std::vector<EndpointRecord> merged = *structural;
    EndpointDetector::merge_unique(merged, *textual);

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].tier, DetectionTier::CALL_PATTERN) << "First tier wins";
}

// Test 10: TierApplicability - tiers decline inputs they do not handle
TEST_F(EndpointDetectorTest, TierApplicability) {
    ParsedSource parsed = detector_.parse("app.get('/a', a);", Dialect::JAVASCRIPT);

    EXPECT_FALSE(detector_.decorator_tier(parsed, "a.js").has_value()) << "Plain script";
    EXPECT_FALSE(EndpointDetector::text_pattern_tier(parsed, "a.js").has_value()) << "Structural parse";
    EXPECT_FALSE(detector_.decorator_text_tier(parsed, "a.js").has_value()) << "Plain script";
}

// Test 11: RepairOptionalCatch - every parameterless catch gains a binding
TEST_F(EndpointDetectorTest, RepairOptionalCatch) {
    std::string source =
        "try { a(); } catch { b(); }\n"
        "try { c(); } catch{ d(); }\n"
        "try { e(); } catch (err) { f(err); }\n";

    size_t replaced = 0;
    std::string repaired = EndpointDetector::repair_optional_catch(source, replaced);

    EXPECT_EQ(replaced, 2u);
    EXPECT_EQ(repaired.find("catch {"), std::string::npos);
    EXPECT_EQ(repaired.find("catch{"), std::string::npos);
    EXPECT_NE(repaired.find("catch (err)"), std::string::npos);

    size_t untouched = 0;
    EXPECT_EQ(EndpointDetector::repair_optional_catch("let x = 1;", untouched), "let x = 1;");
    EXPECT_EQ(untouched, 0u);

    std::string split =
        "try {\n"
        "  a();\n"
        "} catch\n"
        "{\n"
        "  b();\n"
        "}\n"
        "app.get('/after', h);\n";
    size_t split_replaced = 0;
    std::string split_repaired = EndpointDetector::repair_optional_catch(split, split_replaced);
    EXPECT_EQ(split_replaced, 1u);
    EXPECT_EQ(std::count(split_repaired.begin(), split_repaired.end(), '\n'),
              std::count(split.begin(), split.end(), '\n'))
        << "Line breaks inside the catch clause are preserved";
    EXPECT_NE(split_repaired.find("catch (__apiscope_err)\n{"), std::string::npos);
}

// Test 12: Prefilter - cheap text screening
TEST_F(EndpointDetectorTest, Prefilter) {
    EXPECT_TRUE(EndpointDetector::may_define_endpoints("router.get('/x', h);"));
    EXPECT_TRUE(EndpointDetector::may_define_endpoints("app . post ('/x', h);"));
    EXPECT_TRUE(EndpointDetector::may_define_endpoints("@Controller('users')\nclass A {}"));
    EXPECT_FALSE(EndpointDetector::may_define_endpoints("const v = map.get('k');"));
    EXPECT_FALSE(EndpointDetector::may_define_endpoints("@Injectable()\nexport class S {}"));
    EXPECT_FALSE(EndpointDetector::may_define_endpoints(""));
}

// Test 13: MissingFile - detection never throws
TEST_F(EndpointDetectorTest, MissingFile) {
    std::vector<EndpointRecord> endpoints;
    EXPECT_NO_THROW(endpoints = detector_.detect(fixtures_dir() / "does_not_exist.js"));
    EXPECT_TRUE(endpoints.empty());
}

// Test 14: RecordJson - serialized shape of an endpoint
TEST_F(EndpointDetectorTest, RecordJson) {
    EndpointRecord record;
    record.method = "GET";
    record.file_path = "a.js";
    record.start_line = 4;
    record.end_line = 6;
    record.handler_refs = {"show"};

    json j = record.to_json();

    EXPECT_EQ(j["type"], "function");
    EXPECT_TRUE(j["route"].is_null());
    EXPECT_EQ(j["tier"], "call_pattern");
    EXPECT_EQ(j["handlers"][0], "show");
    EXPECT_EQ(j["start_line"], 4);
}
