#include "als/identity/project.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <vector>

namespace als::identity {
namespace {

constexpr std::array<const char*, 6> kProjectMarkers{
    "code", "projects", "repos", "src", "work", "dev",
};

constexpr std::array<const char*, 5> kSystemDirs{
    "users", "home", "var", "tmp", "private",
};

constexpr std::array<const char*, 5> kBadPrefixes{
    "_Users", "_home", "_private", "_tmp", "_var",
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool equals_ignore_case(const std::string& a, const char* b) {
    return to_lower(a) == b;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        const auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join_from(const std::vector<std::string>& parts, std::size_t from, char sep) {
    std::string out;
    for (std::size_t i = from; i < parts.size(); ++i) {
        if (i > from) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

bool is_system_dir(const std::string& part) {
    const std::string lower = to_lower(part);
    return std::any_of(kSystemDirs.begin(), kSystemDirs.end(),
                       [&lower](const char* dir) { return lower == dir; });
}

} // namespace

std::string normalize_name(const std::string& name) {
    std::string out = name;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

std::string get_project_name(const std::string& dir_name) {
    if (dir_name.empty()) {
        return {};
    }
    if (dir_name.front() != '-') {
        return normalize_name(dir_name);
    }

    const auto parts = split(dir_name, '-');

    for (const char* marker : kProjectMarkers) {
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (equals_ignore_case(parts[i], marker) && i + 1 < parts.size()) {
                const std::string rest = join_from(parts, i + 1, '-');
                if (!rest.empty()) {
                    return normalize_name(rest);
                }
            }
        }
    }

    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!it->empty() && !is_system_dir(*it)) {
            return normalize_name(*it);
        }
    }

    return normalize_name(dir_name);
}

std::string extract_project_from_cwd(const std::string& cwd) {
    if (cwd.empty()) {
        return {};
    }
    std::filesystem::path path = std::filesystem::path(cwd).lexically_normal();
    std::string name = path.filename().string();
    if (name.empty()) {
        // "/a/b/" normalizes to a trailing separator with an empty filename
        name = path.parent_path().filename().string();
    }
    if (name.empty() || name == "." || name == ".." || name == "/") {
        return {};
    }
    if (name.find_first_of("/\\") != std::string::npos) {
        return {};
    }
    return normalize_name(name);
}

bool needs_project_reparse(const std::string& project) {
    for (const char* prefix : kBadPrefixes) {
        if (project.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return project.find("_var_folders_") != std::string::npos ||
           project.find("_var_tmp_") != std::string::npos;
}

std::string resolve_project(const std::string& stored, const std::string& derived) {
    if (!stored.empty() && !needs_project_reparse(stored)) {
        return stored;
    }
    return derived;
}

} // namespace als::identity
