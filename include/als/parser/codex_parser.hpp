#pragma once

#include "als/core/result.hpp"
#include "als/parser/types.hpp"

#include <filesystem>
#include <istream>
#include <string>

namespace als::parser {

constexpr const char* kCodexIdPrefix = "codex:";

/**
 * @brief Parse a Codex rollout file
 *
 * Session id is "codex:" + the UUID in the filename, falling back to the
 * session_meta id and then the filename stem. The project label is the
 * last component of the session_meta working directory.
 */
Result<ParseResult> parse_codex_session(const std::filesystem::path& path,
                                        const std::string& machine);

ParseResult parse_codex_stream(std::istream& input,
                               const std::string& file_name,
                               const std::string& machine);

} // namespace als::parser
