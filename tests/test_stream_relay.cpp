#include <gtest/gtest.h>
#include "stream_relay.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace relay;

namespace {

const char* kStream =
    "event: message_start\n"
    "data: {\"type\":\"message_start\",\"message\":{\"id\":\"m\"}}\n\n"
    "event: content_block_start\n"
    "data: {\"type\":\"content_block_start\",\"index\":1,\"content_block\":{\"type\":\"tool_use\",\"id\":\"t\",\"name\":\"todowrite\",\"input\":{}}}\n\n"
    "event: content_block_delta\n"
    "data: {\"type\":\"content_block_delta\",\"index\":1,\"delta\":{\"type\":\"input_json_delta\",\"partial_json\":\"{\"}}\n\n"
    "data: [DONE]\n\n";

}  // namespace

class SseStreamRelayTest : public ::testing::Test {
protected:
    std::string Run(const std::string& input, size_t chunk_size) {
        std::string out;
        SseStreamRelay relay([&out](const std::string& event) {
            out += event;
            return true;
        });
        for (size_t i = 0; i < input.size(); i += chunk_size) {
            EXPECT_TRUE(relay.Feed(input.substr(i, chunk_size)));
        }
        EXPECT_TRUE(relay.Finish());
        return out;
    }
};

TEST(SseRewriteTest, RenamesToolUseStart) {
    const std::string line =
        "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"tool_use\",\"id\":\"t\",\"name\":\"my_tool\",\"input\":{}}}";
    EXPECT_EQ(RewriteSseLine(line),
              "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"tool_use\",\"id\":\"t\",\"name\":\"My_tool\",\"input\":{}}}");
}

TEST(SseRewriteTest, LeavesOtherLinesUntouched) {
    EXPECT_EQ(RewriteSseLine("event: content_block_start"), "event: content_block_start");
    EXPECT_EQ(RewriteSseLine("data: [DONE]"), "data: [DONE]");
    EXPECT_EQ(RewriteSseLine("data:"), "data:");
    EXPECT_EQ(RewriteSseLine("data: {not json"), "data: {not json");
    const std::string text_start =
        "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"text\",\"text\":\"\"}}";
    EXPECT_EQ(RewriteSseLine(text_start), text_start);
    const std::string empty_name =
        "data: {\"type\":\"content_block_start\",\"content_block\":{\"type\":\"tool_use\",\"name\":\"\"}}";
    EXPECT_EQ(RewriteSseLine(empty_name), empty_name);
}

TEST_F(SseStreamRelayTest, OutputIndependentOfChunking) {
    const std::string whole = Run(kStream, std::string(kStream).size());
    for (size_t chunk : {1u, 2u, 3u, 7u, 64u}) {
        EXPECT_EQ(Run(kStream, chunk), whole) << "chunk=" << chunk;
    }
    EXPECT_NE(whole.find("\"name\":\"TodoWrite\""), std::string::npos);
    EXPECT_EQ(whole.find("todowrite"), std::string::npos);
    EXPECT_NE(whole.find("data: [DONE]\n\n"), std::string::npos);
}

TEST_F(SseStreamRelayTest, EventsAreFramedInOrder) {
    std::vector<std::string> events;
    SseStreamRelay relay([&events](const std::string& event) {
        events.push_back(event);
        return true;
    });
    EXPECT_TRUE(relay.Feed("data: a\n\ndata: b\n"));
    EXPECT_EQ(events.size(), 1);
    EXPECT_TRUE(relay.Feed("\ndata: c"));
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0], "data: a\n\n");
    EXPECT_EQ(events[1], "data: b\n\n");
    EXPECT_EQ(relay.BufferedBytes(), std::string("data: c").size());
    EXPECT_EQ(relay.EventsForwarded(), 2);
}

TEST_F(SseStreamRelayTest, FinishFlushesTrailingEvent) {
    EXPECT_EQ(Run("data: x\n\ndata: tail", 4), "data: x\n\ndata: tail\n\n");
    EXPECT_EQ(Run("data: x\n\n  \n", 3), "data: x\n\n");
}

TEST_F(SseStreamRelayTest, SinkFailureStopsRelay) {
    int calls = 0;
    SseStreamRelay relay([&calls](const std::string&) {
        calls++;
        return false;
    });
    EXPECT_FALSE(relay.Feed("data: a\n\ndata: b\n\n"));
    EXPECT_FALSE(relay.Feed("data: c\n\n"));
    EXPECT_FALSE(relay.Finish());
    EXPECT_EQ(calls, 1);
}
