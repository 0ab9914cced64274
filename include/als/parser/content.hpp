#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace als::parser {

/**
 * @brief Canonical text rendering of a message's content
 *
 * Thinking blocks render as "[Thinking]\n<text>" and tool_use blocks as
 * bracketed one-liners ("[Read: path]", "[Bash]\n$ cmd", ...), joined
 * with "\n", so consumers can split the blob without re-reading JSON.
 */
struct TextContent {
    std::string text;
    bool has_thinking = false;
    bool has_tool_use = false;
};

/// `content` may be a string, a block array, or anything else (ignored).
TextContent extract_text_content(const nlohmann::json& content);

/// Rendering for a single tool_use block (`name` + `input`).
std::string format_tool_use(const std::string& name, const nlohmann::json& input);

/**
 * @brief Bucket a raw tool name
 *
 * `mcp__<server>__<op>` reduces to `<server>`; unknown names are "Other".
 */
std::string tool_category(const std::string& name);

/// The `<server>` segment of `mcp__<server>__<op>`, or "" if malformed.
std::string mcp_server_name(const std::string& tool_name);

/// First `max_chars` code points plus "..." when longer.
std::string truncate_text(const std::string& text, std::size_t max_chars);

std::string trim(const std::string& s);

} // namespace als::parser
