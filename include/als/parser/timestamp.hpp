#pragma once

#include "als/parser/types.hpp"

#include <string>

namespace als::parser {

/**
 * @brief Parse a log timestamp into UTC
 *
 * Accepted layouts, tried in order:
 *   2006-01-02T15:04:05.999999999Z07:00  (RFC3339, fraction optional)
 *   2006-01-02T15:04:05.000Z
 *   2006-01-02T15:04:05Z
 *   2006-01-02T15:04:05.000-07:00
 *   2006-01-02T15:04:05-07:00
 *   2006-01-02 15:04:05                  (no zone, taken as UTC)
 *
 * Empty or unparseable input yields the zero Timestamp, never an error.
 */
Timestamp parse_timestamp(const std::string& raw);

/// RFC3339 with trailing-zero-trimmed nanoseconds in UTC; "" for zero.
std::string format_timestamp(Timestamp ts);

inline bool is_zero(Timestamp ts) { return ts == Timestamp{}; }

} // namespace als::parser
