#include "als/pairing/pairing.hpp"

#include "als/parser/content.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace als::pairing {

using parser::ParsedMessage;
using parser::ParsedToolCall;
using parser::Role;

void pair_tool_results(std::vector<ParsedMessage>& messages) {
    std::unordered_map<std::string, ParsedToolCall*> pending;

    for (auto& msg : messages) {
        for (const auto& result : msg.tool_results) {
            auto it = pending.find(result.tool_use_id);
            if (it == pending.end()) {
                continue;
            }
            it->second->result_content = result.content;
            it->second->result_content_length = result.content_length;
            pending.erase(it);
        }
        // Calls are registered after results so a message never pairs
        // with itself.
        for (auto& call : msg.tool_calls) {
            if (!call.tool_use_id.empty()) {
                pending[call.tool_use_id] = &call;
            }
        }
    }
}

void filter_empty_messages(std::vector<ParsedMessage>& messages) {
    messages.erase(
        std::remove_if(messages.begin(), messages.end(),
            [](const ParsedMessage& msg) {
                return msg.role == Role::User &&
                       !msg.tool_results.empty() &&
                       parser::trim(msg.content).empty();
            }),
        messages.end());
}

void renumber_ordinals(std::vector<ParsedMessage>& messages) {
    int ordinal = 0;
    for (auto& msg : messages) {
        msg.ordinal = ordinal++;
    }
}

void pair_and_filter(std::vector<ParsedMessage>& messages) {
    pair_tool_results(messages);
    filter_empty_messages(messages);
    renumber_ordinals(messages);
}

std::pair<int, int> post_filter_counts(const std::vector<ParsedMessage>& messages) {
    int user = 0;
    for (const auto& msg : messages) {
        if (msg.role == Role::User && !msg.content.empty()) {
            ++user;
        }
    }
    return {static_cast<int>(messages.size()), user};
}

std::vector<std::string> extract_mcp_servers(const std::vector<ParsedMessage>& messages) {
    std::set<std::string> servers;
    for (const auto& msg : messages) {
        for (const auto& call : msg.tool_calls) {
            std::string server = parser::mcp_server_name(call.tool_name);
            if (!server.empty()) {
                servers.insert(std::move(server));
            }
        }
    }
    return {servers.begin(), servers.end()};
}

} // namespace als::pairing
