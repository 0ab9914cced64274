#include "als/parser/claude_parser.hpp"

#include "als/pairing/pairing.hpp"
#include "als/parser/content.hpp"
#include "als/parser/jsonl.hpp"
#include "als/parser/timestamp.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <map>

using nlohmann::json;

namespace als::parser {
namespace {

constexpr std::array<const char*, 7> kSystemPrefixes{
    "This session is being continued from a previous conversation",
    "[Request interrupted by user",
    "<task-notification>",
    "<command-message>",
    "<command-name>",
    "<local-command-",
    "Stop hook feedback:",
};

constexpr std::array<const char*, 2> kPlanPrefixes{
    "Implement the following plan",
    "This session is being continued from a previous conversation",
};

bool is_id_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string tool_result_text(const json& block) {
    const json& content = get_field(block, "content");
    if (content.is_string()) {
        return content.get<std::string>();
    }
    std::string out;
    if (content.is_array()) {
        for (const auto& part : content) {
            if (get_string(part, "type") != "text") {
                continue;
            }
            if (!out.empty()) {
                out += "\n";
            }
            out += get_string(part, "text");
        }
    }
    return out;
}

std::vector<ParsedToolResult> collect_tool_results(const json& content) {
    std::vector<ParsedToolResult> results;
    if (!content.is_array()) {
        return results;
    }
    for (const auto& block : content) {
        if (get_string(block, "type") != "tool_result") {
            continue;
        }
        ParsedToolResult result;
        result.tool_use_id = get_string(block, "tool_use_id");
        result.content = tool_result_text(block);
        result.content_length = result.content.size();
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<ParsedToolCall> collect_tool_calls(const json& content) {
    std::vector<ParsedToolCall> calls;
    if (!content.is_array()) {
        return calls;
    }
    for (const auto& block : content) {
        if (get_string(block, "type") != "tool_use") {
            continue;
        }
        ParsedToolCall call;
        call.tool_use_id = get_string(block, "id");
        call.tool_name = get_string(block, "name");
        call.category = tool_category(call.tool_name);
        const json& input = get_field(block, "input");
        call.input_json = input.is_null() ? std::string{} : input.dump();
        calls.push_back(std::move(call));
    }
    return calls;
}

TokenUsage read_usage(const json& usage) {
    TokenUsage out;
    out.input_tokens = get_int(usage, "input_tokens");
    out.output_tokens = get_int(usage, "output_tokens");
    out.cache_creation_input_tokens = get_int(usage, "cache_creation_input_tokens");
    out.cache_read_input_tokens = get_int(usage, "cache_read_input_tokens");
    return out;
}

Timestamp record_timestamp(const json& record) {
    std::string raw = get_string(record, "timestamp");
    if (raw.empty()) {
        raw = get_string(get_field(record, "snapshot"), "timestamp");
    }
    return parse_timestamp(raw);
}

// Incremental builder; one instance per file.
class ClaudeSessionBuilder {
public:
    ClaudeSessionBuilder(std::string session_id, std::string project, std::string machine) {
        result_.session.id = std::move(session_id);
        result_.session.project = std::move(project);
        result_.session.machine = std::move(machine);
        result_.session.agent = AgentType::Claude;
    }

    void add(const json& record) {
        const std::string type = get_string(record, "type");
        if (type == "user") {
            add_user(record);
        } else if (type == "assistant") {
            add_assistant(record);
        }
    }

    ParseResult finish(std::size_t skipped) {
        auto& session = result_.session;
        for (const auto& [key, usage] : usage_by_message_) {
            session.token_usage.input_tokens += usage.input_tokens;
            session.token_usage.output_tokens += usage.output_tokens;
            session.token_usage.cache_creation_input_tokens += usage.cache_creation_input_tokens;
            session.token_usage.cache_read_input_tokens += usage.cache_read_input_tokens;
        }

        if (!sid_parent_.empty()) {
            session.parent_session_id = sid_parent_;
        } else if (!transcript_parent_.empty() && transcript_parent_ != session.id) {
            session.parent_session_id = transcript_parent_;
        }

        const auto [total, user] = pairing::post_filter_counts(result_.messages);
        session.message_count = total;
        session.user_message_count = user;
        result_.skipped_lines = skipped;
        return std::move(result_);
    }

private:
    void add_user(const json& record) {
        const json& message = get_field(record, "message");
        const json& content = get_field(message, "content");

        const std::string sid = get_string(record, "sessionId");
        if (sid_parent_.empty() && !sid.empty() && sid != result_.session.id) {
            sid_parent_ = sid;
        }

        TextContent text = extract_text_content(content);
        auto tool_results = collect_tool_results(content);
        const std::string trimmed = trim(text.text);
        if (trimmed.empty() && tool_results.empty()) {
            return;
        }

        if (!seen_user_ && !trimmed.empty()) {
            seen_user_ = true;
            transcript_parent_ = extract_transcript_session_id(trimmed);
        }

        Role role = Role::User;
        if (get_bool(record, "isMeta") || get_bool(record, "isCompactSummary") ||
            (!trimmed.empty() && is_system_content(trimmed))) {
            role = Role::System;
        }

        if (role == Role::User && !trimmed.empty() && result_.session.first_message.empty()) {
            result_.session.first_message = truncate_text(text.text, kFirstMessageMaxChars);
        }

        ParsedMessage msg;
        msg.role = role;
        msg.content = std::move(text.text);
        msg.content_length = msg.content.size();
        msg.timestamp = record_timestamp(record);
        msg.tool_results = std::move(tool_results);
        push(std::move(msg));
    }

    void add_assistant(const json& record) {
        const json& message = get_field(record, "message");
        const json& content = get_field(message, "content");

        const json& usage = get_field(message, "usage");
        if (usage.is_object()) {
            std::string key = get_string(message, "id");
            if (key.empty()) {
                key = "\x01line-" + std::to_string(anonymous_usage_++);
            }
            usage_by_message_[key] = read_usage(usage);
        }

        TextContent text = extract_text_content(content);
        auto tool_calls = collect_tool_calls(content);
        if (trim(text.text).empty() && tool_calls.empty()) {
            return;
        }

        ParsedMessage msg;
        msg.role = Role::Assistant;
        msg.content = std::move(text.text);
        msg.content_length = msg.content.size();
        msg.has_thinking = text.has_thinking;
        msg.has_tool_use = text.has_tool_use;
        msg.timestamp = record_timestamp(record);
        msg.tool_calls = std::move(tool_calls);
        push(std::move(msg));
    }

    void push(ParsedMessage msg) {
        msg.ordinal = static_cast<int>(result_.messages.size());
        auto& session = result_.session;
        if (!is_zero(msg.timestamp)) {
            if (is_zero(session.started_at) || msg.timestamp < session.started_at) {
                session.started_at = msg.timestamp;
            }
            if (is_zero(session.ended_at) || msg.timestamp > session.ended_at) {
                session.ended_at = msg.timestamp;
            }
        }
        result_.messages.push_back(std::move(msg));
    }

    ParseResult result_;
    std::map<std::string, TokenUsage> usage_by_message_;
    std::size_t anonymous_usage_ = 0;
    std::string sid_parent_;
    std::string transcript_parent_;
    bool seen_user_ = false;
};

} // namespace

bool is_system_content(const std::string& content) {
    for (const char* prefix : kSystemPrefixes) {
        if (starts_with(content, prefix)) {
            return true;
        }
    }
    return false;
}

std::string extract_transcript_session_id(const std::string& content) {
    bool is_plan = false;
    for (const char* prefix : kPlanPrefixes) {
        if (starts_with(content, prefix)) {
            is_plan = true;
            break;
        }
    }
    if (!is_plan) {
        return {};
    }

    const auto marker = content.find("transcript");
    if (marker == std::string::npos) {
        return {};
    }
    const auto ext = content.find(".jsonl", marker);
    if (ext == std::string::npos) {
        return {};
    }
    auto begin = ext;
    while (begin > marker && is_id_char(content[begin - 1])) {
        --begin;
    }
    return content.substr(begin, ext - begin);
}

ParseResult parse_claude_stream(std::istream& input,
                                const std::string& session_id,
                                const std::string& project,
                                const std::string& machine) {
    ClaudeSessionBuilder builder(session_id, project, machine);
    const std::size_t skipped = for_each_json_line(input, [&builder](const json& record) {
        builder.add(record);
    });
    if (skipped > 0) {
        spdlog::debug("claude session {}: skipped {} malformed lines", session_id, skipped);
    }
    return builder.finish(skipped);
}

Result<ParseResult> parse_claude_session(const std::filesystem::path& path,
                                         const std::string& project,
                                         const std::string& machine) {
    auto file = open_log_file(path);
    if (file.is_error()) {
        return Err<ParseResult>(file.error());
    }
    return Ok(parse_claude_stream(file.value(), path.stem().string(), project, machine));
}

} // namespace als::parser
