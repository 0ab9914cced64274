#pragma once

/**
 * @file pairing.hpp
 * @brief Post-processing of a parsed message list
 *
 * Runs after a parser and before persistence:
 *   pair_tool_results -> filter_empty_messages -> renumber_ordinals
 * pair_and_filter() does all three. The session-level rollups
 * (post_filter_counts, extract_mcp_servers) are taken from the final list.
 */

#include "als/parser/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace als::pairing {

/**
 * @brief Copy each tool result onto the earlier call with the same id
 *
 * A result is consumed at most once and also stays on its own message.
 * Results without a matching call are inert; calls without a result keep
 * a zero length.
 */
void pair_tool_results(std::vector<parser::ParsedMessage>& messages);

/**
 * @brief Drop user messages that are only tool-result placeholders
 *
 * Removes user messages whose trimmed content is empty and that carry at
 * least one tool result. Empty user messages without results and all
 * assistant messages are kept.
 */
void filter_empty_messages(std::vector<parser::ParsedMessage>& messages);

/// Reassign ordinals 0..N-1 in current order.
void renumber_ordinals(std::vector<parser::ParsedMessage>& messages);

void pair_and_filter(std::vector<parser::ParsedMessage>& messages);

/// (total messages, user messages with content)
std::pair<int, int> post_filter_counts(const std::vector<parser::ParsedMessage>& messages);

/// Distinct `<server>` names from `mcp__<server>__<op>` tool calls, sorted.
std::vector<std::string> extract_mcp_servers(const std::vector<parser::ParsedMessage>& messages);

} // namespace als::pairing
