#include "als/parser/claude_parser.hpp"
#include "als/parser/timestamp.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace als::parser;
using nlohmann::json;

namespace {

json user_line(const std::string& text, const std::string& ts = "2024-01-15T10:00:00Z") {
    return json{{"type", "user"}, {"timestamp", ts}, {"message", {{"role", "user"}, {"content", text}}}};
}

json assistant_line(const json& blocks, const std::string& ts = "2024-01-15T10:00:05Z") {
    return json{{"type", "assistant"}, {"timestamp", ts},
                {"message", {{"role", "assistant"}, {"content", blocks}}}};
}

json text_block(const std::string& text) {
    return json{{"type", "text"}, {"text", text}};
}

json usage_line(const std::string& message_id, int in, int out, int cache_create, int cache_read) {
    json line = assistant_line(json::array({text_block("working")}));
    line["message"]["id"] = message_id;
    line["message"]["usage"] = {{"input_tokens", in},
                                {"output_tokens", out},
                                {"cache_creation_input_tokens", cache_create},
                                {"cache_read_input_tokens", cache_read}};
    return line;
}

std::string jsonl(const std::vector<json>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line.dump() + "\n";
    }
    return out;
}

ParseResult parse(const std::string& data, const std::string& id = "sess-1") {
    std::istringstream in(data);
    return parse_claude_stream(in, id, "my_app", "laptop");
}

} // namespace

TEST(ClaudeParserTest, BasicConversation) {
    auto r = parse(jsonl({user_line("Fix the login bug"),
                          assistant_line(json::array({text_block("On it.")}))}));

    const auto& s = r.session;
    EXPECT_EQ(s.id, "sess-1");
    EXPECT_EQ(s.project, "my_app");
    EXPECT_EQ(s.machine, "laptop");
    EXPECT_EQ(s.agent, AgentType::Claude);
    EXPECT_EQ(s.message_count, 2);
    EXPECT_EQ(s.user_message_count, 1);
    EXPECT_EQ(s.first_message, "Fix the login bug");
    EXPECT_EQ(s.started_at, parse_timestamp("2024-01-15T10:00:00Z"));
    EXPECT_EQ(s.ended_at, parse_timestamp("2024-01-15T10:00:05Z"));

    ASSERT_EQ(r.messages.size(), 2u);
    EXPECT_EQ(r.messages[0].ordinal, 0);
    EXPECT_EQ(r.messages[0].role, Role::User);
    EXPECT_EQ(r.messages[1].ordinal, 1);
    EXPECT_EQ(r.messages[1].role, Role::Assistant);
    EXPECT_EQ(r.messages[1].content, "On it.");
}

TEST(ClaudeParserTest, EmptyInput) {
    auto r = parse("");
    EXPECT_EQ(r.session.message_count, 0);
    EXPECT_TRUE(r.messages.empty());
    EXPECT_TRUE(r.session.first_message.empty());
    EXPECT_TRUE(is_zero(r.session.started_at));
}

TEST(ClaudeParserTest, BlankUserContentDropped) {
    auto r = parse(jsonl({user_line("   \n\t"), user_line("real")}));
    EXPECT_EQ(r.session.message_count, 1);
    EXPECT_EQ(r.session.first_message, "real");
}

TEST(ClaudeParserTest, FirstMessageTruncated) {
    auto r = parse(jsonl({user_line(std::string(400, 'a'))}));
    EXPECT_EQ(r.session.first_message.size(), kFirstMessageMaxChars + 3);
    EXPECT_EQ(r.session.first_message.substr(kFirstMessageMaxChars), "...");
    EXPECT_EQ(r.messages[0].content.size(), 400u);
}

TEST(ClaudeParserTest, MalformedLinesSkipped) {
    std::string data = jsonl({user_line("first")});
    data += "{not json\n";
    data += "\n   \n";
    data += "[1,2,3]\n";
    data += user_line("second").dump() + "\n";
    data += R"({"type":"user","message":{"content":"trunc)";

    auto r = parse(data);
    EXPECT_EQ(r.session.message_count, 2);
    EXPECT_EQ(r.skipped_lines, 3u);
}

TEST(ClaudeParserTest, InvalidUtf8LineDoesNotLoseTheRest) {
    std::string data = jsonl({user_line("hello")});
    data += "{\"type\":\"user\",\"message\":{\"content\":\"bad \xff\xfe bytes\"}}\n";

    auto r = parse(data);
    EXPECT_GE(r.session.message_count, 1);
    EXPECT_EQ(r.session.first_message, "hello");
}

TEST(ClaudeParserTest, LargeMessage) {
    const std::string big(1024 * 1024, 'x');
    auto r = parse(jsonl({user_line(big)}));
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.messages[0].content_length, 1048576u);
}

TEST(ClaudeParserTest, MetaAndCompactSummaryAreSystem) {
    json meta = user_line("Caveat: local command output");
    meta["isMeta"] = true;
    json summary = user_line("Summary of the earlier work");
    summary["isCompactSummary"] = true;

    auto r = parse(jsonl({meta, summary, user_line("real question")}));

    ASSERT_EQ(r.messages.size(), 3u);
    EXPECT_EQ(r.messages[0].role, Role::System);
    EXPECT_EQ(r.messages[1].role, Role::System);
    EXPECT_EQ(r.messages[2].role, Role::User);
    EXPECT_EQ(r.session.message_count, 3);
    EXPECT_EQ(r.session.user_message_count, 1);
    EXPECT_EQ(r.session.first_message, "real question");
}

TEST(ClaudeParserTest, SystemContentHeuristics) {
    auto r = parse(jsonl({
        user_line("This session is being continued from a previous conversation that ran out"),
        user_line("[Request interrupted by user for tool use]"),
        user_line("<task-notification>done</task-notification>"),
        user_line("<command-message>init</command-message>"),
        user_line("<command-name>/clear</command-name>"),
        user_line("<local-command-stdout></local-command-stdout>"),
        user_line("Stop hook feedback: lint failed"),
        user_line("an actual request"),
    }));

    ASSERT_EQ(r.messages.size(), 8u);
    for (std::size_t i = 0; i < 7; ++i) {
        EXPECT_EQ(r.messages[i].role, Role::System) << "message " << i;
    }
    EXPECT_EQ(r.messages[7].role, Role::User);
    EXPECT_EQ(r.session.user_message_count, 1);
    EXPECT_EQ(r.session.first_message, "an actual request");
}

TEST(ClaudeParserTest, AssistantTextNeverReclassified) {
    auto r = parse(jsonl({assistant_line(json::array({text_block("<command-name>echo</command-name>")}))}));
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.messages[0].role, Role::Assistant);
}

TEST(ClaudeParserTest, ToolUseAndResults) {
    json call = assistant_line(json::array({
        text_block("Let me check."),
        {{"type", "tool_use"}, {"id", "toolu_1"}, {"name", "Read"}, {"input", {{"file_path", "/a.go"}}}},
    }));
    json result = {{"type", "user"},
                   {"timestamp", "2024-01-15T10:00:06Z"},
                   {"message", {{"content", json::array({
                       {{"type", "tool_result"}, {"tool_use_id", "toolu_1"}, {"content", "package main"}},
                   })}}}};

    auto r = parse(jsonl({user_line("look"), call, result}));

    ASSERT_EQ(r.messages.size(), 3u);
    const auto& assistant = r.messages[1];
    EXPECT_TRUE(assistant.has_tool_use);
    EXPECT_EQ(assistant.content, "Let me check.\n[Read: /a.go]");
    ASSERT_EQ(assistant.tool_calls.size(), 1u);
    EXPECT_EQ(assistant.tool_calls[0].tool_use_id, "toolu_1");
    EXPECT_EQ(assistant.tool_calls[0].category, "Read");
    EXPECT_EQ(json::parse(assistant.tool_calls[0].input_json), json({{"file_path", "/a.go"}}));

    const auto& carrier = r.messages[2];
    EXPECT_EQ(carrier.content, "");
    ASSERT_EQ(carrier.tool_results.size(), 1u);
    EXPECT_EQ(carrier.tool_results[0].content_length, 12u);
    // the result-only user message is not counted as a user turn
    EXPECT_EQ(r.session.user_message_count, 1);
}

TEST(ClaudeParserTest, ThinkingFlag) {
    auto r = parse(jsonl({assistant_line(json::array({
        {{"type", "thinking"}, {"thinking", "hmm"}},
        text_block("answer"),
    }))}));
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_TRUE(r.messages[0].has_thinking);
    EXPECT_EQ(r.messages[0].content, "[Thinking]\nhmm\nanswer");
}

TEST(ClaudeParserTest, ParentFromForeignSessionId) {
    json line = user_line("continue");
    line["sessionId"] = "parent-abc";
    auto r = parse(jsonl({line}), "child-xyz");
    EXPECT_EQ(r.session.parent_session_id, "parent-abc");
}

TEST(ClaudeParserTest, OwnSessionIdIsNotParent) {
    json line = user_line("hello");
    line["sessionId"] = "child-xyz";
    auto r = parse(jsonl({line}), "child-xyz");
    EXPECT_EQ(r.session.parent_session_id, "");
}

TEST(ClaudeParserTest, ParentFromTranscriptReference) {
    const std::string plan =
        "Implement the following plan:\n\n# Plan\n...\n\nIf you need details, read the full "
        "transcript at: /home/u/.claude/projects/-home-u-app/prev-session-42.jsonl";
    auto r = parse(jsonl({user_line(plan)}), "child-xyz");
    EXPECT_EQ(r.session.parent_session_id, "prev-session-42");
}

TEST(ClaudeParserTest, SessionIdBeatsTranscriptReference) {
    json line = user_line(
        "Implement the following plan: read the transcript at /x/prev-session-42.jsonl");
    line["sessionId"] = "sid-parent";
    auto r = parse(jsonl({line}), "child-xyz");
    EXPECT_EQ(r.session.parent_session_id, "sid-parent");
}

TEST(ClaudeParserTest, TranscriptIgnoredWithoutPlanPrefix) {
    EXPECT_EQ(extract_transcript_session_id("see transcript at /x/abc.jsonl"), "");
    EXPECT_EQ(extract_transcript_session_id("Implement the following plan: see transcript /x/abc.jsonl"), "abc");
    EXPECT_EQ(extract_transcript_session_id("Implement the following plan: nothing here"), "");
}

TEST(ClaudeParserTest, TokenUsageLastRecordPerMessageWins) {
    auto r = parse(jsonl({
        usage_line("msg-1", 10, 5, 0, 0),
        usage_line("msg-1", 100, 50, 10, 200),
        usage_line("msg-2", 150, 75, 20, 300),
    }));

    const auto& u = r.session.token_usage;
    EXPECT_EQ(u.input_tokens, 250);
    EXPECT_EQ(u.output_tokens, 125);
    EXPECT_EQ(u.cache_creation_input_tokens, 30);
    EXPECT_EQ(u.cache_read_input_tokens, 500);
}

TEST(ClaudeParserTest, TokenUsageDuplicatesCollapse) {
    auto r = parse(jsonl({
        usage_line("msg-1", 100, 50, 10, 200),
        usage_line("msg-1", 100, 50, 10, 200),
    }));
    EXPECT_EQ(r.session.token_usage, (TokenUsage{100, 50, 10, 200}));
}

TEST(ClaudeParserTest, NoUsageIsZero) {
    auto r = parse(jsonl({user_line("hi")}));
    EXPECT_EQ(r.session.token_usage, TokenUsage{});
}

TEST(ClaudeParserTest, SnapshotTimestampFallback) {
    json line = {{"type", "user"},
                 {"snapshot", {{"timestamp", "2024-02-01T08:00:00Z"}}},
                 {"message", {{"content", "hello"}}}};
    auto r = parse(jsonl({line}));
    EXPECT_EQ(r.session.started_at, parse_timestamp("2024-02-01T08:00:00Z"));
}

TEST(ClaudeParserTest, MissingFileIsNotFound) {
    auto r = parse_claude_session("/nonexistent/dir/abc.jsonl", "p", "m");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, als::ErrorCode::NotFound);
}

TEST(ClaudeParserTest, IsSystemContent) {
    EXPECT_TRUE(is_system_content("<local-command-caveat>x"));
    EXPECT_FALSE(is_system_content("please run <command-name>"));
    EXPECT_FALSE(is_system_content(""));
}
