#include <gtest/gtest.h>
#include "tool_names.hpp"

using namespace relay;
using json = nlohmann::ordered_json;

TEST(ToolNamesTest, MappedNames) {
    EXPECT_EQ(NormalizeToolName("todowrite"), "TodoWrite");
    EXPECT_EQ(NormalizeToolName("webfetch"), "WebFetch");
    EXPECT_EQ(NormalizeToolName("google_search"), "Google_Search");
}

TEST(ToolNamesTest, CapitalizesFirstCharacter) {
    EXPECT_EQ(NormalizeToolName("my_tool"), "My_tool");
    EXPECT_EQ(NormalizeToolName("read"), "Read");
    EXPECT_EQ(NormalizeToolName("Bash"), "Bash");
    EXPECT_EQ(NormalizeToolName("_private"), "_private");
    EXPECT_EQ(NormalizeToolName(""), "");
}

TEST(ToolNamesTest, Idempotent) {
    for (const char* name : {"todowrite", "my_tool", "Glob", "x"}) {
        const auto once = NormalizeToolName(name);
        EXPECT_EQ(NormalizeToolName(once), once);
    }
}

TEST(ToolNamesTest, NonStringValuesUnchanged) {
    EXPECT_EQ(NormalizeToolNameValue(json(nullptr)), json(nullptr));
    EXPECT_EQ(NormalizeToolNameValue(json(7)), json(7));
    EXPECT_EQ(NormalizeToolNameValue(json("edit")), json("Edit"));
}

TEST(ToolNamesTest, BuiltinTypes) {
    EXPECT_TRUE(IsBuiltinToolType(std::string("web_search_20250305")));
    EXPECT_TRUE(IsBuiltinToolType(std::string("bash_20250124")));
    EXPECT_TRUE(IsBuiltinToolType(std::string("text_editor_20250429")));
    EXPECT_FALSE(IsBuiltinToolType(std::string("custom")));
    EXPECT_FALSE(IsBuiltinToolType(std::nullopt));
    EXPECT_FALSE(IsBuiltinToolType(std::string("")));
}

TEST(ToolNamesTest, NormalizesDeclarationsAndHistory) {
    json body = json::parse(R"({
        "tools": [
            {"name": "todowrite", "input_schema": {"type": "object"}},
            {"type": "web_search_20250305", "name": "web_search"}
        ],
        "messages": [
            {"role": "assistant", "content": [
                {"type": "text", "text": "ok"},
                {"type": "tool_use", "id": "t1", "name": "read", "input": {}}
            ]},
            {"role": "user", "content": "read please"}
        ]
    })");
    auto req = ParseRequestEnvelope(body, nullptr);
    ASSERT_TRUE(req.has_value());
    json out = ToJson(NormalizeRequestToolNames(std::move(*req)));

    EXPECT_EQ(out["tools"][0]["name"], "TodoWrite");
    EXPECT_EQ(out["tools"][0]["input_schema"], json({{"type", "object"}}));
    EXPECT_EQ(out["tools"][1]["name"], "web_search");
    EXPECT_EQ(out["messages"][0]["content"][1]["name"], "Read");
    EXPECT_EQ(out["messages"][0]["content"][1]["id"], "t1");
    EXPECT_EQ(out["messages"][1]["content"], "read please");
}
