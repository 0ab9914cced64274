#pragma once

#include "als/core/result.hpp"

#include <filesystem>
#include <istream>
#include <string>

namespace als::hash {

/**
 * @brief SHA-256 of every byte remaining in `input`, lowercase hex
 *
 * Reads in fixed-size chunks so large session files never sit in memory
 * whole. Fails with IOError if the stream goes bad before EOF.
 */
Result<std::string> digest(std::istream& input);

/**
 * @brief SHA-256 of a file's contents, lowercase hex
 *
 * ERRORS:
 * - NotFound         "opening <path>: ..." when the path or a parent
 *                    component does not exist
 * - PermissionDenied "opening <path>: ..." when stat or open is refused
 * - IsADirectory     "hashing <path>: is a directory"
 * - IOError          "hashing <path>: not a regular file" for FIFOs,
 *                    sockets and devices; symlink loops and other stat
 *                    or read failures otherwise
 *
 * Type checks run before opening, so a FIFO never blocks the caller.
 */
Result<std::string> digest_file(const std::filesystem::path& path);

} // namespace als::hash
