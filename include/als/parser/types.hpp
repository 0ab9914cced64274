#pragma once

/**
 * @file types.hpp
 * @brief Normalized session and message shapes shared by both log grammars
 *
 * Both the Claude and the Codex parsers produce exactly these types.
 * Everything downstream (pairing, identity resolution, the stores) works
 * on them and never sees raw JSON.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace als::parser {

enum class AgentType {
    Claude,
    Codex
};

enum class Role {
    User,
    Assistant,
    System
};

using Timestamp = std::chrono::system_clock::time_point;

inline const char* to_string(AgentType agent) {
    switch (agent) {
        case AgentType::Claude: return "claude";
        case AgentType::Codex: return "codex";
    }
    return "unknown";
}

inline const char* to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::System: return "system";
    }
    return "unknown";
}

/**
 * @brief A tool invocation found in an assistant turn
 *
 * result_content / result_content_length stay empty and zero until
 * pairing finds the matching ToolResult ("pending" rather than failed).
 */
struct ParsedToolCall {
    std::string tool_use_id;
    std::string tool_name;
    std::string category;
    std::string input_json;
    std::size_t result_content_length = 0;
    std::string result_content;
};

/**
 * @brief Output of a tool as reported back in a later user turn
 */
struct ParsedToolResult {
    std::string tool_use_id;
    std::size_t content_length = 0;
    std::string content;
};

struct ParsedMessage {
    int ordinal = 0;
    Role role = Role::User;
    std::string content;
    Timestamp timestamp{};
    bool has_thinking = false;
    bool has_tool_use = false;
    std::size_t content_length = 0;
    std::vector<ParsedToolCall> tool_calls;
    std::vector<ParsedToolResult> tool_results;
};

struct TokenUsage {
    std::int64_t input_tokens = 0;
    std::int64_t output_tokens = 0;
    std::int64_t cache_creation_input_tokens = 0;
    std::int64_t cache_read_input_tokens = 0;

    bool operator==(const TokenUsage& other) const {
        return input_tokens == other.input_tokens &&
               output_tokens == other.output_tokens &&
               cache_creation_input_tokens == other.cache_creation_input_tokens &&
               cache_read_input_tokens == other.cache_read_input_tokens;
    }
};

struct ParsedSession {
    std::string id;
    std::string project;
    std::string machine;
    AgentType agent = AgentType::Claude;
    std::string first_message;
    Timestamp started_at{};
    Timestamp ended_at{};
    int message_count = 0;
    int user_message_count = 0;
    std::string parent_session_id;
    TokenUsage token_usage;
    std::vector<std::string> mcp_servers;

    std::string file_path;
    std::int64_t file_size = 0;
    std::int64_t file_mtime = 0;
    std::string file_hash;
};

/**
 * @brief Session metadata plus its messages in file order
 */
struct ParseResult {
    ParsedSession session;
    std::vector<ParsedMessage> messages;
    std::size_t skipped_lines = 0;
};

} // namespace als::parser
