#include "als/parser/codex_parser.hpp"

#include "als/discovery/discovery.hpp"
#include "als/identity/project.hpp"
#include "als/parser/claude_parser.hpp"
#include "als/pairing/pairing.hpp"
#include "als/parser/content.hpp"
#include "als/parser/jsonl.hpp"
#include "als/parser/timestamp.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <optional>

using nlohmann::json;

namespace als::parser {
namespace {

constexpr std::array<const char*, 3> kInjectedContextPrefixes{
    "<environment_context>",
    "<user_instructions>",
    "# AGENTS.md",
};

std::optional<Role> role_from_string(const std::string& role) {
    if (role == "user") return Role::User;
    if (role == "assistant") return Role::Assistant;
    if (role == "developer" || role == "system") return Role::System;
    return std::nullopt;
}

bool is_injected_context(const std::string& text) {
    for (const char* prefix : kInjectedContextPrefixes) {
        if (text.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

std::string join_text_blocks(const json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    std::string out;
    if (!content.is_array()) {
        return out;
    }
    for (const auto& block : content) {
        const std::string type = get_string(block, "type");
        if (type != "input_text" && type != "output_text" && type != "text") {
            continue;
        }
        const std::string text = get_string(block, "text");
        if (text.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += "\n";
        }
        out += text;
    }
    return out;
}

// `command` is either a string or an argv array; "bash -lc <script>"
// collapses to the script.
std::string shell_command(const json& args) {
    const json& command = get_field(args, "command");
    if (command.is_string()) {
        return command.get<std::string>();
    }
    if (!command.is_array()) {
        return get_string(args, "cmd");
    }
    std::vector<std::string> argv;
    for (const auto& arg : command) {
        if (arg.is_string()) {
            argv.push_back(arg.get<std::string>());
        }
    }
    if (argv.size() == 3 && (argv[1] == "-lc" || argv[1] == "-c")) {
        return argv[2];
    }
    std::string out;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out += " ";
        }
        out += argv[i];
    }
    return out;
}

class CodexSessionBuilder {
public:
    CodexSessionBuilder(const std::string& file_name, std::string machine)
        : file_name_(file_name) {
        result_.session.machine = std::move(machine);
        result_.session.agent = AgentType::Codex;
    }

    void add(const json& record) {
        const std::string type = get_string(record, "type");
        const json& payload = get_field(record, "payload");
        if (type == "session_meta") {
            add_meta(payload);
        } else if (type == "response_item") {
            add_item(record, payload);
        }
    }

    ParseResult finish(std::size_t skipped) {
        auto& session = result_.session;

        std::string id = discovery::extract_uuid_from_rollout(file_name_);
        if (id.empty()) {
            id = meta_id_;
        }
        if (id.empty()) {
            id = std::filesystem::path(file_name_).stem().string();
        }
        session.id = kCodexIdPrefix + id;

        const auto [total, user] = pairing::post_filter_counts(result_.messages);
        session.message_count = total;
        session.user_message_count = user;
        result_.skipped_lines = skipped;
        return std::move(result_);
    }

private:
    void add_meta(const json& payload) {
        if (meta_id_.empty()) {
            meta_id_ = get_string(payload, "id");
        }
        const std::string cwd = get_string(payload, "cwd");
        if (result_.session.project.empty() && !cwd.empty()) {
            result_.session.project = identity::extract_project_from_cwd(cwd);
        }
        const std::string originator = get_string(payload, "originator");
        if (!originator.empty()) {
            originator_ = originator;
        }
    }

    void add_item(const json& record, const json& payload) {
        const std::string item_type = get_string(payload, "type");
        const Timestamp ts = parse_timestamp(get_string(record, "timestamp"));

        if (item_type == "function_call") {
            add_function_call(payload, ts);
            return;
        }
        if (item_type == "function_call_output") {
            add_function_output(payload, ts);
            return;
        }
        if (!item_type.empty() && item_type != "message") {
            return;
        }

        std::string role_name = get_string(payload, "role");
        if (role_name.empty()) {
            role_name = originator_;
        }
        auto role = role_from_string(role_name);
        if (!role) {
            return;
        }

        std::string text = join_text_blocks(get_field(payload, "content"));
        const std::string trimmed = trim(text);
        if (trimmed.empty()) {
            return;
        }
        if (*role == Role::User && is_injected_context(trimmed)) {
            role = Role::System;
        }

        if (*role == Role::User && result_.session.first_message.empty()) {
            result_.session.first_message = truncate_text(text, kFirstMessageMaxChars);
        }

        ParsedMessage msg;
        msg.role = *role;
        msg.content = std::move(text);
        msg.content_length = msg.content.size();
        msg.timestamp = ts;
        push(std::move(msg));
    }

    void add_function_call(const json& payload, Timestamp ts) {
        ParsedToolCall call;
        call.tool_use_id = get_string(payload, "call_id");
        call.tool_name = get_string(payload, "name");
        call.category = tool_category(call.tool_name);
        call.input_json = get_string(payload, "arguments");

        const json args = json::parse(call.input_json, nullptr, false);
        std::string rendered;
        if (call.category == "Bash") {
            rendered = "[Bash]\n$ " + (args.is_discarded() ? std::string{} : shell_command(args));
        } else {
            rendered = "[Tool: " + call.tool_name + "]";
        }

        ParsedMessage msg;
        msg.role = Role::Assistant;
        msg.content = std::move(rendered);
        msg.content_length = msg.content.size();
        msg.has_tool_use = true;
        msg.timestamp = ts;
        msg.tool_calls.push_back(std::move(call));
        push(std::move(msg));
    }

    void add_function_output(const json& payload, Timestamp ts) {
        ParsedToolResult result;
        result.tool_use_id = get_string(payload, "call_id");
        const json& output = get_field(payload, "output");
        if (output.is_string()) {
            result.content = output.get<std::string>();
        } else if (output.is_object()) {
            result.content = get_string(output, "content");
        }
        result.content_length = result.content.size();

        ParsedMessage msg;
        msg.role = Role::User;
        msg.timestamp = ts;
        msg.tool_results.push_back(std::move(result));
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

    const std::string& file_name_;
    ParseResult result_;
    std::string meta_id_;
    std::string originator_;
};

} // namespace

ParseResult parse_codex_stream(std::istream& input,
                               const std::string& file_name,
                               const std::string& machine) {
    CodexSessionBuilder builder(file_name, machine);
    const std::size_t skipped = for_each_json_line(input, [&builder](const json& record) {
        builder.add(record);
    });
    if (skipped > 0) {
        spdlog::debug("codex session {}: skipped {} malformed lines", file_name, skipped);
    }
    return builder.finish(skipped);
}

Result<ParseResult> parse_codex_session(const std::filesystem::path& path,
                                        const std::string& machine) {
    auto file = open_log_file(path);
    if (file.is_error()) {
        return Err<ParseResult>(file.error());
    }
    return Ok(parse_codex_stream(file.value(), path.filename().string(), machine));
}

} // namespace als::parser
