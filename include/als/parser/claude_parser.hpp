#pragma once

#include "als/core/result.hpp"
#include "als/parser/types.hpp"

#include <filesystem>
#include <istream>
#include <string>

namespace als::parser {

/// Longest stored first-message prefix, before the "..." marker.
constexpr std::size_t kFirstMessageMaxChars = 300;

/**
 * @brief Parse a Claude Code session log
 *
 * The session id is the filename stem. `project` is the already-decoded
 * project label; `machine` is copied onto the session.
 *
 * Ordinals in the result follow file order and are NOT final: pairing
 * and filtering renumber them.
 */
Result<ParseResult> parse_claude_session(const std::filesystem::path& path,
                                         const std::string& project,
                                         const std::string& machine);

ParseResult parse_claude_stream(std::istream& input,
                                const std::string& session_id,
                                const std::string& project,
                                const std::string& machine);

/**
 * @brief True when user-typed content is synthetic (continuation and
 * interruption notices, command/notification XML payloads, hook feedback)
 */
bool is_system_content(const std::string& content);

/**
 * @brief Session id referenced by "...transcript ... <id>.jsonl" in a
 * plan-continuation prompt, or "" when the prompt is not one
 */
std::string extract_transcript_session_id(const std::string& content);

} // namespace als::parser
