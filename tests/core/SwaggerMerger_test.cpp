#include <gtest/gtest.h>
#include "core/SwaggerMerger.hpp"
#include <regex>

using namespace apiscope;

namespace {

json fragment(const std::string& path, const std::string& method, const std::string& summary) {
    return {{"paths", {{path, {{method, {{"summary", summary}}}}}}}};
}

}  // namespace

// Test 1: NormalizeRoute - colon segments become braces
TEST(SwaggerMergerTest, NormalizeRoute) {
    EXPECT_EQ(SwaggerMerger::normalize_route("/users/:id"), "/users/{id}");
    EXPECT_EQ(SwaggerMerger::normalize_route("/users/:id/posts/:post-id"), "/users/{id}/posts/{post-id}");
    EXPECT_EQ(SwaggerMerger::normalize_route("/already/{id}"), "/already/{id}");
    EXPECT_EQ(SwaggerMerger::normalize_route("/"), "/");
}

// Test 2: MakeDocument - metadata and empty paths
TEST(SwaggerMergerTest, MakeDocument) {
    DocumentInfo info;
    info.title = "Widgets";
    info.description = "Widget service";
    info.generated_at = "2024-01-02T03:04:05Z";
    info.commit_reference = "abc123";
    info.repository_url = "https://example.com/widgets.git";
    info.host = "http://localhost:3000";

    json doc = SwaggerMerger::make_document(info);

    EXPECT_EQ(doc["openapi"], "3.0.0");
    EXPECT_EQ(doc["info"]["title"], "Widgets");
    EXPECT_EQ(doc["info"]["version"], "1.0.0");
    EXPECT_EQ(doc["info"]["generated_at"], "2024-01-02T03:04:05Z");
    EXPECT_EQ(doc["info"]["commit_reference"], "abc123");
    EXPECT_EQ(doc["servers"][0]["url"], "http://localhost:3000");
    EXPECT_TRUE(doc["paths"].is_object());
    EXPECT_TRUE(doc["paths"].empty());
}

// Test 3: GeneratedTimestamp - filled in when not given
TEST(SwaggerMergerTest, GeneratedTimestamp) {
    json doc = SwaggerMerger::make_document(DocumentInfo{});
    std::string stamp = doc["info"]["generated_at"];

    EXPECT_TRUE(std::regex_match(stamp, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)"))) << stamp;
}

// Test 4: MethodsShareAPath - fragments for one path merge in either order
TEST(SwaggerMergerTest, MethodsShareAPath) {
    json forward = SwaggerMerger::make_document(DocumentInfo{});
    SwaggerMerger::merge(forward, fragment("/items", "get", "list"));
    SwaggerMerger::merge(forward, fragment("/items", "post", "create"));

    json backward = SwaggerMerger::make_document(DocumentInfo{});
    SwaggerMerger::merge(backward, fragment("/items", "post", "create"));
    SwaggerMerger::merge(backward, fragment("/items", "get", "list"));

    EXPECT_EQ(forward["paths"], backward["paths"]);
    EXPECT_EQ(forward["paths"]["/items"].size(), 2u);
}

// Test 5: LaterOperationWins - same path and method
TEST(SwaggerMergerTest, LaterOperationWins) {
    json doc = SwaggerMerger::make_document(DocumentInfo{});
    SwaggerMerger::merge(doc, fragment("/items/:id", "get", "first"));
    SwaggerMerger::merge(doc, fragment("/items/{id}", "get", "second"));

    ASSERT_TRUE(doc["paths"].contains("/items/{id}"));
    EXPECT_FALSE(doc["paths"].contains("/items/:id"));
    EXPECT_EQ(doc["paths"]["/items/{id}"]["get"]["summary"], "second");
}

// Test 6: FragmentsWithoutPaths - ignored
TEST(SwaggerMergerTest, FragmentsWithoutPaths) {
    json doc = SwaggerMerger::make_document(DocumentInfo{});
    SwaggerMerger::merge(doc, json::object());
    SwaggerMerger::merge(doc, json::array());
    SwaggerMerger::merge(doc, {{"paths", "nope"}});

    EXPECT_TRUE(doc["paths"].empty());
}

// Test 7: PostProcessWildcardsAndKeys - wildcard paths dropped, colon keys folded
TEST(SwaggerMergerTest, PostProcessWildcardsAndKeys) {
    json doc = SwaggerMerger::make_document(DocumentInfo{});
    doc["paths"]["/*"] = {{"get", json::object()}};
    doc["paths"]["*"] = {{"get", json::object()}};
    doc["paths"]["/a/:id"] = {{"put", {{"summary", "put"}}}};
    doc["paths"]["/a/{id}"] = {{"get", {{"summary", "get"}}}};

    SwaggerMerger::post_process(doc);

    EXPECT_FALSE(doc["paths"].contains("/*"));
    EXPECT_FALSE(doc["paths"].contains("*"));
    EXPECT_FALSE(doc["paths"].contains("/a/:id"));
    EXPECT_EQ(doc["paths"]["/a/{id}"].size(), 2u);
}

// Test 8: PostProcessCollectionRoutes - create, list and delete repairs
TEST(SwaggerMergerTest, PostProcessCollectionRoutes) {
    json doc = SwaggerMerger::make_document(DocumentInfo{});
    doc["paths"]["/{name}"]["post"] = {
        {"requestBody", {{"required", true}}},
        {"responses", {
            {"200", {{"content", {{"application/json", {{"schema", {{"type", "array"}}}}}}}}},
            {"400", {{"description", "bad"}}}
        }}
    };
    doc["paths"]["/{name}"]["get"] = {
        {"responses", {{"200", {{"description", "ok"}}}, {"400", {{"description", "bad"}}}}}
    };
    doc["paths"]["/{name}/{id}"]["delete"] = {
        {"parameters", json::array({
            {{"name", "id"}, {"in", "path"}},
            {{"name", "_dependent"}, {"in", "query"}, {"schema", {{"type", "string"}}}}
        })}
    };

    SwaggerMerger::post_process(doc);

    const json& post = doc["paths"]["/{name}"]["post"];
    EXPECT_EQ(post["requestBody"]["required"], false);
    EXPECT_TRUE(post["responses"].contains("201"));
    EXPECT_TRUE(post["responses"].contains("404"));
    EXPECT_FALSE(post["responses"].contains("200"));
    EXPECT_EQ(post["responses"]["201"]["content"]["application/json"]["schema"]["type"], "array")
        << "Best known schema is reused";

    const json& get = doc["paths"]["/{name}"]["get"];
    EXPECT_FALSE(get["responses"].contains("400"));
    EXPECT_TRUE(get["responses"].contains("200"));

    const json& dependent = doc["paths"]["/{name}/{id}"]["delete"]["parameters"][1];
    ASSERT_TRUE(dependent["schema"].contains("oneOf"));
    EXPECT_EQ(dependent["schema"]["oneOf"].size(), 2u);
}

// Test 9: PostProcessDefaultSchema - created response without a known schema
TEST(SwaggerMergerTest, PostProcessDefaultSchema) {
    json doc = SwaggerMerger::make_document(DocumentInfo{});
    doc["paths"]["/{name}"]["post"] = {{"responses", {{"200", {{"description", "ok"}}}}}};

    SwaggerMerger::post_process(doc);

    const json& schema = doc["paths"]["/{name}"]["post"]["responses"]["201"]
                            ["content"]["application/json"]["schema"];
    EXPECT_EQ(schema["type"], "object");
    EXPECT_TRUE(schema["properties"].contains("id"));
}
