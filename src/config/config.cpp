#include "als/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace als::config {
namespace {

// Optional string key; wrong type is an error, absence is not.
Result<void> read_string(const json& doc, const char* key, const fs::path& path,
                         const std::function<void(const std::string&)>& assign) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err<void>(ErrorCode::Config,
                         path.string() + ": \"" + key + "\" must be a string");
    }
    const auto value = it->get<std::string>();
    if (!value.empty()) {
        assign(value);
    }
    return Ok();
}

} // namespace

std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

Config defaults(const EnvLookup& env) {
    const fs::path home = env("HOME").value_or(".");

    Config config;
    config.data_dir = home / ".agentsview";
    config.db_path = config.data_dir / "sessions.db";
    config.claude_projects_dir = home / ".claude" / "projects";
    config.codex_sessions_dir = home / ".codex" / "sessions";
    return config;
}

Result<void> apply_file(Config& config, const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<void>(ErrorCode::Config, "opening " + path.string());
    }

    const json doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<void>(ErrorCode::Config, path.string() + ": not a JSON object");
    }

    const std::pair<const char*, std::function<void(const std::string&)>> keys[] = {
        {"claude_project_dir", [&](const std::string& v) { config.claude_projects_dir = v; }},
        {"codex_sessions_dir", [&](const std::string& v) { config.codex_sessions_dir = v; }},
        {"machine", [&](const std::string& v) { config.machine = v; }},
        {"log_level", [&](const std::string& v) { config.log_level = v; }},
    };
    for (const auto& [key, assign] : keys) {
        auto status = read_string(doc, key, path, assign);
        if (status.is_error()) {
            return status;
        }
    }
    return Ok();
}

Result<Config> load(const EnvLookup& env) {
    Config config = defaults(env);

    if (auto dir = env(kDataDirEnv)) {
        config.data_dir = *dir;
        config.db_path = config.data_dir / "sessions.db";
    }

    const fs::path file = config.data_dir / kConfigFileName;
    std::error_code ec;
    if (fs::exists(file, ec)) {
        auto status = apply_file(config, file);
        if (status.is_error()) {
            return Err<Config>(status.error());
        }
        spdlog::debug("loaded config from {}", file.string());
    }

    if (auto dir = env(kClaudeDirEnv)) {
        config.claude_projects_dir = *dir;
    }
    if (auto dir = env(kCodexDirEnv)) {
        config.codex_sessions_dir = *dir;
    }
    return Ok(std::move(config));
}

} // namespace als::config
