#include "als/discovery/discovery.hpp"

#include <algorithm>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

namespace als::discovery {
namespace {

constexpr const char* kJsonlExt = ".jsonl";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Directory entries sorted by name; unreadable directories yield nothing.
std::vector<fs::directory_entry> read_dir(const fs::path& dir) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return entries;
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });
    return entries;
}

bool is_dir(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_directory(ec);
}

void sort_by_path(std::vector<DiscoveredFile>& files) {
    std::sort(files.begin(), files.end(),
              [](const DiscoveredFile& a, const DiscoveredFile& b) {
                  return a.path.string() < b.path.string();
              });
}

} // namespace

std::vector<DiscoveredFile> discover_claude_projects(const fs::path& projects_dir) {
    std::vector<DiscoveredFile> files;

    for (const auto& project : read_dir(projects_dir)) {
        if (!is_dir(project)) {
            continue;
        }
        const std::string project_name = project.path().filename().string();

        for (const auto& session : read_dir(project.path())) {
            if (is_dir(session)) {
                continue;
            }
            const std::string name = session.path().filename().string();
            if (!ends_with(name, kJsonlExt)) {
                continue;
            }
            const std::string stem = name.substr(0, name.size() - 6);
            if (starts_with(stem, "agent-")) {
                continue;
            }

            DiscoveredFile file;
            file.path = session.path();
            file.project_hint = project_name;
            file.agent = parser::AgentType::Claude;
            files.push_back(std::move(file));
        }
    }

    sort_by_path(files);
    return files;
}

std::vector<DiscoveredFile> discover_codex_sessions(const fs::path& sessions_dir) {
    std::vector<DiscoveredFile> files;

    walk_codex_day_dirs(sessions_dir, [&files](const fs::path& day) {
        for (const auto& entry : read_dir(day)) {
            if (is_dir(entry)) {
                continue;
            }
            if (!ends_with(entry.path().filename().string(), kJsonlExt)) {
                continue;
            }
            DiscoveredFile file;
            file.path = entry.path();
            file.agent = parser::AgentType::Codex;
            files.push_back(std::move(file));
        }
        return true;
    });

    sort_by_path(files);
    return files;
}

std::string find_claude_source_file(const fs::path& projects_dir, const std::string& session_id) {
    if (!is_valid_session_id(session_id)) {
        return {};
    }

    const std::string target = session_id + kJsonlExt;
    for (const auto& project : read_dir(projects_dir)) {
        if (!is_dir(project)) {
            continue;
        }
        const fs::path candidate = project.path() / target;
        std::error_code ec;
        if (fs::exists(candidate, ec) && !ec) {
            return candidate.string();
        }
    }
    return {};
}

std::string find_codex_source_file(const fs::path& sessions_dir, const std::string& session_id) {
    if (!is_valid_session_id(session_id)) {
        return {};
    }

    std::string result;
    walk_codex_day_dirs(sessions_dir, [&](const fs::path& day) {
        for (const auto& entry : read_dir(day)) {
            if (is_dir(entry)) {
                continue;
            }
            const std::string name = entry.path().filename().string();
            if (!starts_with(name, "rollout-") || !ends_with(name, kJsonlExt)) {
                continue;
            }
            if (extract_uuid_from_rollout(name) == session_id) {
                result = entry.path().string();
                return false;
            }
        }
        return true;
    });
    return result;
}

void walk_codex_day_dirs(const fs::path& root,
                         const std::function<bool(const fs::path&)>& visit) {
    for (const auto& year : read_dir(root)) {
        if (!is_dir(year) || !is_digits(year.path().filename().string())) {
            continue;
        }
        for (const auto& month : read_dir(year.path())) {
            if (!is_dir(month) || !is_digits(month.path().filename().string())) {
                continue;
            }
            for (const auto& day : read_dir(month.path())) {
                if (!is_dir(day) || !is_digits(day.path().filename().string())) {
                    continue;
                }
                if (!visit(day.path())) {
                    return;
                }
            }
        }
    }
}

std::string extract_uuid_from_rollout(const std::string& filename) {
    static const std::regex uuid_re(
        "^rollout-.*-([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-"
        "[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12})$");

    std::string stem = filename;
    if (ends_with(stem, kJsonlExt)) {
        stem.resize(stem.size() - 6);
    }

    std::smatch match;
    if (!std::regex_match(stem, match, uuid_re) || match.size() < 2) {
        return {};
    }
    return match[1].str();
}

bool is_digits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

bool is_valid_session_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_';
    });
}

} // namespace als::discovery
