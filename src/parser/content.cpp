#include "als/parser/content.hpp"
#include "als/parser/jsonl.hpp"

#include <unordered_map>
#include <vector>

using nlohmann::json;

namespace als::parser {
namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

const json& array_or_empty(const json& j, const char* key) {
    static const json empty = json::array();
    if (!j.is_object()) {
        return empty;
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return empty;
    }
    return *it;
}

std::string format_ask_user_question(const std::string& name, const json& input) {
    std::vector<std::string> lines;
    lines.push_back("[Question: " + name + "]");
    for (const auto& question : array_or_empty(input, "questions")) {
        lines.push_back("  " + get_string(question, "question"));
        for (const auto& option : array_or_empty(question, "options")) {
            lines.push_back("    - " + get_string(option, "label") + ": " +
                            get_string(option, "description"));
        }
    }
    return join(lines, "\n");
}

std::string format_todo_write(const json& input) {
    static const std::unordered_map<std::string, std::string> icons{
        {"completed", "✓"},
        {"in_progress", "→"},
        {"pending", "○"},
    };

    std::vector<std::string> lines;
    lines.push_back("[Todo List]");
    for (const auto& todo : array_or_empty(input, "todos")) {
        auto it = icons.find(get_string(todo, "status"));
        const std::string icon = it != icons.end() ? it->second : "○";
        lines.push_back("  " + icon + " " + get_string(todo, "content"));
    }
    return join(lines, "\n");
}

std::string format_bash(const json& input) {
    const std::string cmd = get_string(input, "command");
    const std::string desc = get_string(input, "description");
    if (!desc.empty()) {
        return "[Bash: " + desc + "]\n$ " + cmd;
    }
    return "[Bash]\n$ " + cmd;
}

} // namespace

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string truncate_text(const std::string& text, std::size_t max_chars) {
    // Walk UTF-8 lead bytes so a multi-byte character is never split.
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) == 0x80) {
            continue;
        }
        if (chars == max_chars) {
            return text.substr(0, i) + "...";
        }
        ++chars;
    }
    return text;
}

std::string format_tool_use(const std::string& name, const json& input) {
    if (name == "AskUserQuestion") return format_ask_user_question(name, input);
    if (name == "TodoWrite") return format_todo_write(input);
    if (name == "EnterPlanMode") return "[Entering Plan Mode]";
    if (name == "ExitPlanMode") return "[Exiting Plan Mode]";
    if (name == "Read") return "[Read: " + get_string(input, "file_path") + "]";
    if (name == "Glob") {
        std::string path = get_string(input, "path");
        if (path.empty()) {
            path = ".";
        }
        return "[Glob: " + get_string(input, "pattern") + " in " + path + "]";
    }
    if (name == "Grep") return "[Grep: " + get_string(input, "pattern") + "]";
    if (name == "Edit") return "[Edit: " + get_string(input, "file_path") + "]";
    if (name == "Write") return "[Write: " + get_string(input, "file_path") + "]";
    if (name == "Bash") return format_bash(input);
    if (name == "Task") {
        return "[Task: " + get_string(input, "description") + " (" +
               get_string(input, "subagent_type") + ")]";
    }
    return "[Tool: " + name + "]";
}

TextContent extract_text_content(const json& content) {
    TextContent out;

    if (content.is_string()) {
        out.text = content.get<std::string>();
        return out;
    }
    if (!content.is_array()) {
        return out;
    }

    std::vector<std::string> parts;
    for (const auto& block : content) {
        const std::string type = get_string(block, "type");
        if (type == "text") {
            std::string text = get_string(block, "text");
            if (!text.empty()) {
                parts.push_back(std::move(text));
            }
        } else if (type == "thinking") {
            const std::string thinking = get_string(block, "thinking");
            if (!thinking.empty()) {
                out.has_thinking = true;
                parts.push_back("[Thinking]\n" + thinking);
            }
        } else if (type == "tool_use") {
            out.has_tool_use = true;
            parts.push_back(format_tool_use(get_string(block, "name"), get_field(block, "input")));
        }
    }

    out.text = join(parts, "\n");
    return out;
}

std::string mcp_server_name(const std::string& tool_name) {
    static const std::string prefix = "mcp__";
    if (tool_name.compare(0, prefix.size(), prefix) != 0) {
        return {};
    }
    const std::string rest = tool_name.substr(prefix.size());
    const auto sep = rest.find("__");
    if (sep == std::string::npos || sep == 0) {
        return {};
    }
    return rest.substr(0, sep);
}

std::string tool_category(const std::string& name) {
    static const std::unordered_map<std::string, std::string> categories{
        {"Read", "Read"},
        {"Edit", "Edit"},
        {"MultiEdit", "Edit"},
        {"NotebookEdit", "Edit"},
        {"apply_patch", "Edit"},
        {"Write", "Write"},
        {"Bash", "Bash"},
        {"BashOutput", "Bash"},
        {"KillShell", "Bash"},
        {"shell", "Bash"},
        {"exec_command", "Bash"},
        {"Grep", "Grep"},
        {"Glob", "Glob"},
        {"LS", "Glob"},
        {"Task", "Task"},
        {"WebFetch", "Web"},
        {"WebSearch", "Web"},
        {"TodoWrite", "Todo"},
    };

    auto it = categories.find(name);
    if (it != categories.end()) {
        return it->second;
    }
    std::string server = mcp_server_name(name);
    if (!server.empty()) {
        return server;
    }
    return "Other";
}

} // namespace als::parser
