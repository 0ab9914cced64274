#include "als/parser/jsonl.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <system_error>

using nlohmann::json;

namespace als::parser {
namespace {

constexpr std::int64_t kInt64Max = std::numeric_limits<std::int64_t>::max();
// 2^63, the first double past the int64 range.
constexpr double kInt64Bound = 9223372036854775808.0;

} // namespace

std::size_t for_each_json_line(std::istream& input, const std::function<void(const json&)>& handle) {
    std::size_t skipped = 0;
    std::string line;
    while (std::getline(input, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }
        json record = json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            ++skipped;
            continue;
        }
        handle(record);
    }
    return skipped;
}

Result<std::ifstream> open_log_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<std::ifstream>(ErrorCode::NotFound,
                                  "opening " + path.string() + ": no such file or directory");
    }
    if (std::filesystem::is_directory(path, ec)) {
        return Err<std::ifstream>(ErrorCode::IsADirectory,
                                  "opening " + path.string() + ": is a directory");
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err<std::ifstream>(ErrorCode::IOError,
                                  "opening " + path.string() + ": not a regular file");
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        const int err = errno;
        const ErrorCode code = err == EACCES ? ErrorCode::PermissionDenied : ErrorCode::IOError;
        return Err<std::ifstream>(code, "opening " + path.string() + ": " + std::strerror(err));
    }
    return Ok(std::move(input));
}

const json& get_field(const json& j, const char* key) {
    static const json null_value;
    if (!j.is_object()) {
        return null_value;
    }
    auto it = j.find(key);
    return it == j.end() ? null_value : *it;
}

std::string get_string(const json& j, const char* key) {
    const json& v = get_field(j, key);
    return v.is_string() ? v.get<std::string>() : std::string{};
}

std::int64_t get_int(const json& j, const char* key) {
    const json& v = get_field(j, key);
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(kInt64Max) ? kInt64Max : static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer()) {
        return v.get<std::int64_t>();
    }
    if (v.is_number_float()) {
        // Saturate to the int64 range.
        const double d = v.get<double>();
        if (std::isnan(d)) {
            return 0;
        }
        if (d >= kInt64Bound) {
            return kInt64Max;
        }
        if (d <= -kInt64Bound) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(d);
    }
    return 0;
}

bool get_bool(const json& j, const char* key) {
    const json& v = get_field(j, key);
    return v.is_boolean() && v.get<bool>();
}

} // namespace als::parser
