#pragma once

#include "als/parser/types.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace als::discovery {

/**
 * @brief A candidate session log found on disk
 *
 * project_hint is the raw encoded project directory name for Claude
 * files (decoded later by the identity module) and empty for Codex.
 */
struct DiscoveredFile {
    std::filesystem::path path;
    std::string project_hint;
    parser::AgentType agent = parser::AgentType::Claude;
};

/**
 * @brief `<root>/<project>/<session>.jsonl`, excluding `agent-*` sub-agent
 * transcripts. Sorted by path. Missing root yields an empty list.
 */
std::vector<DiscoveredFile> discover_claude_projects(const std::filesystem::path& projects_dir);

/**
 * @brief `<root>/YYYY/MM/DD/*.jsonl`. Non-numeric directories at any of
 * the three levels are skipped. Sorted by path.
 */
std::vector<DiscoveredFile> discover_codex_sessions(const std::filesystem::path& sessions_dir);

/// Returns "" when not found or when session_id is not a safe identifier.
std::string find_claude_source_file(const std::filesystem::path& projects_dir,
                                    const std::string& session_id);

/// session_id is the bare UUID (no "codex:" prefix). Stops at the first match.
std::string find_codex_source_file(const std::filesystem::path& sessions_dir,
                                   const std::string& session_id);

/**
 * @brief UUID suffix of `rollout-<anything>-<uuid>[.jsonl]`, or ""
 *
 * The UUID must end the stem: `rollout-x-<uuid>-extra.jsonl` yields "".
 */
std::string extract_uuid_from_rollout(const std::string& filename);

/// Non-empty and only [A-Za-z0-9_-]; anything else could escape a root.
bool is_valid_session_id(const std::string& id);

bool is_digits(const std::string& s);

/**
 * @brief Visit every numeric YYYY/MM/DD directory in name order
 *
 * The visitor returns false to stop the walk early.
 */
void walk_codex_day_dirs(const std::filesystem::path& root,
                         const std::function<bool(const std::filesystem::path&)>& visit);

} // namespace als::discovery
