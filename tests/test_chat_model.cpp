#include <gtest/gtest.h>
#include "clawchat_chat_model.hpp"

#include <limits>

using namespace clawchat;
using json = nlohmann::json;

namespace {

int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

TEST(ChatModelTest, FlattenContent) {
    EXPECT_EQ(flatten_content("plain"), "plain");
    EXPECT_EQ(flatten_content(json::array({
        {{"type", "text"}, {"text", "a"}},
        {{"type", "image"}, {"url", "x"}},
        {{"type", "text"}, {"text", "b"}},
    })), "ab");
    EXPECT_EQ(flatten_content(json(42)), "");
    EXPECT_EQ(flatten_content(json()), "");
}

TEST(ChatModelTest, TimestampFromMilliseconds) {
    EXPECT_EQ(epoch_ms(parse_timestamp(json(1700000000123LL))), 1700000000123LL);
}

TEST(ChatModelTest, TimestampFromRfc3339) {
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-11-14T22:13:20Z")), 1700000000000LL);
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-11-14T22:13:20.5Z")), 1700000000500LL);
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-11-15T00:13:20+02:00")), 1700000000000LL);
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-11-14T21:13:20-01:00")), 1700000000000LL);
}

TEST(ChatModelTest, BadTimestampIsEpoch) {
    EXPECT_EQ(epoch_ms(parse_timestamp("yesterday")), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-11-14 22:13:20")), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-13-14T22:13:20Z")), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp(json::object())), 0);
}

TEST(ChatModelTest, DayMustExistInMonth) {
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-02-31T00:00:00Z")), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-04-31T00:00:00Z")), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp("2023-02-29T00:00:00Z")), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp("2024-02-29T00:00:00Z")), 1709164800000LL);
}

TEST(ChatModelTest, UnrepresentableTimestampIsEpoch) {
    EXPECT_EQ(epoch_ms(parse_timestamp(json(9000000000000000000LL))), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp(json(-9000000000000000000LL))), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp(json(std::numeric_limits<uint64_t>::max()))), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp(json(1e300))), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp(json(std::numeric_limits<double>::quiet_NaN()))), 0);
    EXPECT_EQ(epoch_ms(parse_timestamp(json(1500.9))), 1500);
}

TEST(ChatModelTest, SessionsIgnoreNonObjects) {
    auto sessions = parse_sessions({{"sessions", {1, {{"key", "k"}, {"label", 7}}}}});
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].key, "k");
    EXPECT_TRUE(sessions[0].label.empty());

    EXPECT_TRUE(parse_sessions(json::object()).empty());
    EXPECT_TRUE(parse_sessions({{"sessions", "nope"}}).empty());
}

TEST(ChatModelTest, HistoryDropsEmptyAndForeignRoles) {
    auto messages = parse_history({{"messages", {
        {{"role", "user"}, {"content", "q"}, {"timestamp", 1000}},
        {{"role", "assistant"}, {"content", json::array({{{"type", "tool_use"}}})}},
        {{"role", "toolResult"}, {"content", "r"}},
        {{"role", "assistant"}, {"content", "a"}, {"timestamp", "bad"}},
    }}});

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].content, "q");
    EXPECT_EQ(epoch_ms(messages[0].timestamp), 1000);
    EXPECT_EQ(messages[1].content, "a");
    EXPECT_EQ(epoch_ms(messages[1].timestamp), 0);
}

TEST(ChatModelTest, ChatEventFields) {
    ChatEvent ev = parse_chat_event({
        {"runId", "r"}, {"sessionKey", "s"}, {"seq", 4}, {"state", "error"},
        {"errorMessage", "boom"}, {"message", {{"content", {{{"type", "text"}, {"text", "t"}}}}}},
    });
    EXPECT_EQ(ev.run_id, "r");
    EXPECT_EQ(ev.session_key, "s");
    EXPECT_EQ(ev.sequence, 4);
    EXPECT_EQ(ev.state, ChatState::Error);
    EXPECT_EQ(ev.error_message, "boom");
    EXPECT_EQ(ev.content, "t");
}

TEST(ChatModelTest, SequenceOutOfRangeIsZero) {
    EXPECT_EQ(parse_chat_event({{"seq", 7.0}}).sequence, 7);
    EXPECT_EQ(parse_chat_event({{"seq", 1e300}}).sequence, 0);
    EXPECT_EQ(parse_chat_event({{"seq", -1e19}}).sequence, 0);
    EXPECT_EQ(parse_chat_event({{"seq", std::numeric_limits<uint64_t>::max()}}).sequence, 0);
    EXPECT_EQ(parse_chat_event({{"seq", "3"}}).sequence, 0);
}

TEST(ChatModelTest, UnknownState) {
    EXPECT_EQ(parse_chat_event({{"state", "aborted"}}).state, ChatState::Unknown);
    EXPECT_EQ(parse_chat_event(json::array()).state, ChatState::Unknown);
    EXPECT_STREQ(chat_state_name(ChatState::Final), "final");
}
