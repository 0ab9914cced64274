#pragma once

#include <string>

namespace als::identity {

/**
 * @brief Decode a Claude project directory name into a project label
 *
 * Claude stores /Users/alice/code/my-app as "-Users-alice-code-my-app".
 * Decoding is heuristic:
 *   1. Names not starting with '-' are only normalized.
 *   2. The first known parent marker (code, projects, repos, src, work,
 *      dev; case-insensitive, markers tried in that order) wins and
 *      everything after it is the name: "my-app" -> "my_app".
 *   3. Otherwise the last segment that is not a system directory
 *      (users, home, var, tmp, private).
 *   4. Otherwise the raw name.
 * Dashes become underscores in every case.
 */
std::string get_project_name(const std::string& dir_name);

/// Last path component of a working directory, normalized; "" for / . ..
std::string extract_project_from_cwd(const std::string& cwd);

/// True for labels left behind by an older decoder (e.g. "_Users_alice_x").
bool needs_project_reparse(const std::string& project);

/**
 * @brief Choose the label to persist on resync
 *
 * A stored label that is non-empty and does not need reparse survives
 * (it may be a human override); otherwise the freshly derived one is used.
 */
std::string resolve_project(const std::string& stored, const std::string& derived);

std::string normalize_name(const std::string& name);

} // namespace als::identity
