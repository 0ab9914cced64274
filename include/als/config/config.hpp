#pragma once

#include "als/core/result.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace als::config {

constexpr const char* kDataDirEnv = "AGENT_VIEWER_DATA_DIR";
constexpr const char* kClaudeDirEnv = "CLAUDE_PROJECTS_DIR";
constexpr const char* kCodexDirEnv = "CODEX_SESSIONS_DIR";
constexpr const char* kConfigFileName = "config.json";

struct Config {
    std::filesystem::path data_dir;
    std::filesystem::path db_path;
    std::filesystem::path claude_projects_dir;
    std::filesystem::path codex_sessions_dir;
    std::string machine = "local";
    std::string log_level = "info";
};

/// Lookup used for environment variables; injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

std::optional<std::string> process_env(const char* name);

/**
 * @brief Resolve configuration
 *
 * Order, later wins: built-in defaults under $HOME, then
 * <data_dir>/config.json when present, then environment variables.
 * The data dir itself comes only from AGENT_VIEWER_DATA_DIR or the default.
 *
 * ERRORS:
 * - Config when config.json exists but is not a JSON object, or a
 *   known key has the wrong type
 */
Result<Config> load(const EnvLookup& env = process_env);

/// Defaults only; no file or environment overrides except HOME.
Config defaults(const EnvLookup& env = process_env);

/// Merge the keys of a config.json document into `config`.
Result<void> apply_file(Config& config, const std::filesystem::path& path);

} // namespace als::config
