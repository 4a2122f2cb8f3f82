#include "mcp/recommend_tool.hpp"
#include "engine/request_handler.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace cadence;
using namespace cadence::engine;
using cadence::test::json;

namespace {

    const json& enum_of(const json& tool, const std::string& property) {
        return tool.at("inputSchema").at("properties").at(property).at("items").at("enum");
    }

    bool lists(const json& values, const std::string& value) {
        return std::find(values.begin(), values.end(), json(value)) != values.end();
    }

    std::string text_of(const json& result) {
        return result.at("content").at(0).at("text").get<std::string>();
    }

}

TEST(RecommendToolTest, SchemaEnumeratesEachVocabulary)
{
    const json tool = mcp::recommend_tool();
    for (Facet facet : kAllFacets) {
        const std::string name(to_string(facet));
        const auto& values = enum_of(tool, name);
        EXPECT_EQ(values.size(), vocabulary_of(facet).size()) << name;
        for (const auto& v : values) EXPECT_TRUE(is_known_value(facet, v.get<std::string>())) << name << " " << v;
    }

    EXPECT_TRUE(lists(enum_of(tool, "activity"), "studying"));
    EXPECT_TRUE(lists(enum_of(tool, "activity"), "working-out"));
    EXPECT_TRUE(lists(enum_of(tool, "genre"), "lo-fi"));
    EXPECT_FALSE(lists(enum_of(tool, "genre"), "lofi"));
    EXPECT_FALSE(lists(enum_of(tool, "vibe_tags"), "dreamy"));
    EXPECT_FALSE(lists(enum_of(tool, "mood"), "sad"));

    const auto& match = tool["inputSchema"]["properties"]["match"]["enum"];
    ASSERT_TRUE(match.is_array());
    EXPECT_EQ(match, json::array({"any", "all"}));
}

TEST(RecommendToolTest, BuildQueryMapsArguments)
{
    auto request = mcp::build_query({{"query", "night drive"}, {"genre", json::array({"synth-pop"})}, {"limit", 3},
                                     {"match", "all"}, {"mood", nullptr}});
    EXPECT_EQ(request["method"], "query");
    const auto& params = request["params"];
    EXPECT_EQ(params["text"], "night drive");
    EXPECT_EQ(params["limit"], 3);
    EXPECT_EQ(params["match"], "all");
    EXPECT_EQ(params["filters"], json({{"genre", json::array({"synth-pop"})}}));

    auto browse = mcp::build_query(json::object());
    EXPECT_FALSE(browse["params"].contains("text"));
    EXPECT_FALSE(browse["params"].contains("filters"));
}

TEST(RecommendToolTest, UnreadableRepliesBecomeErrorResults)
{
    for (const std::string reply : {"", "{not json", "[1,2]", R"({"result":"pong"})"}) {
        auto result = mcp::tool_result(reply);
        EXPECT_EQ(result.value("isError", false), true) << reply;
        EXPECT_FALSE(text_of(result).empty());
    }
}

TEST(RecommendToolTest, DaemonErrorsBecomeErrorResults)
{
    auto result = mcp::tool_result(R"({"error":{"code":"invalid_facet","message":"unknown facet dimension: tempo"}})");
    EXPECT_EQ(result.value("isError", false), true);
    EXPECT_EQ(text_of(result), "invalid_facet: unknown facet dimension: tempo");
}

TEST(RecommendToolTest, FormatsScoredHitsWithStrength)
{
    json reply = {{"result", {{"in_scope", 1}, {"hits", json::array({{
        {"title", "Song A"}, {"artist", json::array({"Artist A"})}, {"score", 0.5}, {"description", "soft synths"},
        {"mood", json::array({"dreamy"})}, {"genre", json::array({"pop"})}, {"energy", "low"}
    }})}}}};
    auto result = mcp::tool_result(reply.dump());
    EXPECT_FALSE(result.contains("isError"));
    const std::string text = text_of(result);
    EXPECT_NE(text.find("Songs in scope: 1"), std::string::npos);
    EXPECT_NE(text.find("1. Song A - Artist A (very strong, 0.500)"), std::string::npos);
    EXPECT_NE(text.find("energy: low"), std::string::npos);
}

TEST(RecommendToolTest, AnswersThroughTheRequestHandler)
{
    Config config;
    SnapshotManager manager(create_hashing_embedder(32), BuildOptions{});
    manager.publish(test::abc_catalog());
    RequestHandler handler(manager, config);

    auto request = mcp::build_query({{"mood", json::array({"dreamy"})}, {"genre", json::array({"rock"})}});
    auto text = text_of(mcp::tool_result(handler.handle(request.dump())));
    EXPECT_NE(text.find("Songs in scope: 1"), std::string::npos);
    EXPECT_NE(text.find("Song C - Artist C"), std::string::npos);
    EXPECT_EQ(text.find("Song A"), std::string::npos);

    auto none = text_of(mcp::tool_result(handler.handle(mcp::build_query({{"genre", json::array({"jazz"})}}).dump())));
    EXPECT_NE(none.find("No songs matched"), std::string::npos);
}
