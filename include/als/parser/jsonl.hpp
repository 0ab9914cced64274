#pragma once

#include "als/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>

namespace als::parser {

/**
 * @brief Feed every well-formed JSON line of `input` to `handle`
 *
 * Blank lines are ignored. Lines that fail to parse (truncated writes,
 * invalid UTF-8, plain garbage) are counted and skipped, never fatal.
 * A final line without a trailing newline is still read.
 *
 * @return number of skipped malformed lines
 */
std::size_t for_each_json_line(std::istream& input,
                               const std::function<void(const nlohmann::json&)>& handle);

/// Open a session log; errors are "opening <path>: ..." (NotFound / IOError).
Result<std::ifstream> open_log_file(const std::filesystem::path& path);

std::string get_string(const nlohmann::json& j, const char* key);
std::int64_t get_int(const nlohmann::json& j, const char* key);
bool get_bool(const nlohmann::json& j, const char* key);

/// j[key] when it is an object/array/etc., otherwise a static null.
const nlohmann::json& get_field(const nlohmann::json& j, const char* key);

} // namespace als::parser
