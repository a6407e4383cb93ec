#include <gtest/gtest.h>
#include "field_sanitizer.hpp"

using namespace relay;
using json = nlohmann::ordered_json;

TEST(FieldSanitizerTest, RemovesSentinelMembersAndElements) {
    json in = {
        {"model", "claude-3-7-sonnet"},
        {"metadata", "[undefined]"},
        {"messages", json::array({
            {{"role", "user"}, {"content", "hi"}, {"name", "[undefined]"}},
            "[undefined]"
        })}
    };
    json out = StripUndefinedSentinels(in);
    EXPECT_FALSE(out.contains("metadata"));
    ASSERT_EQ(out["messages"].size(), 1);
    EXPECT_FALSE(out["messages"][0].contains("name"));
    EXPECT_EQ(out["messages"][0]["content"], "hi");
    EXPECT_EQ(out["model"], "claude-3-7-sonnet");
}

TEST(FieldSanitizerTest, StripsAtAnyDepth) {
    json in = {{"a", {{"b", {{"c", json::array({1, "[undefined]", 2})}, {"d", "[undefined]"}}}}}};
    json out = StripUndefinedSentinels(in);
    EXPECT_EQ(out, json({{"a", {{"b", {{"c", json::array({1, 2})}}}}}}));
}

TEST(FieldSanitizerTest, ScalarsAndLookalikesUntouched) {
    EXPECT_EQ(StripUndefinedSentinels(json(42)), json(42));
    EXPECT_EQ(StripUndefinedSentinels(json(nullptr)), json(nullptr));
    // A bare sentinel at the root is not inside a container.
    EXPECT_EQ(StripUndefinedSentinels(json("[undefined]")), json("[undefined]"));
    json in = {{"text", "[undefined] but longer"}, {"flag", nullptr}};
    EXPECT_EQ(StripUndefinedSentinels(in), in);
}

TEST(FieldSanitizerTest, Idempotent) {
    json in = json::parse(R"({"x":["[undefined]",{"y":"[undefined]","z":[]}]})");
    json once = StripUndefinedSentinels(in);
    EXPECT_EQ(StripUndefinedSentinels(once), once);
    EXPECT_EQ(once, json::parse(R"({"x":[{"z":[]}]})"));
}
