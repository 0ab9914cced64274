#pragma once

#include "als/store/session_store.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace als::store {

/**
 * @brief Thread-safe in-memory SessionStore
 *
 * Reads take a shared lock and writes an exclusive one, so
 * write_session() is atomic with respect to every reader.
 * Messages are stored without tool results, matching what the
 * SQLite store keeps.
 */
class MemorySessionStore : public SessionStore {
public:
    MemorySessionStore() = default;

    Result<std::optional<SessionFileInfo>> get_session_file_info(const std::string& id) override;
    Result<std::optional<parser::ParsedSession>> get_session_full(const std::string& id) override;
    Result<void> upsert_session(const parser::ParsedSession& session) override;
    Result<void> replace_session_messages(const std::string& id,
                                          const std::vector<parser::ParsedMessage>& messages) override;
    Result<void> write_session(const parser::ParsedSession& session,
                               const std::vector<parser::ParsedMessage>& messages) override;
    Result<std::vector<parser::ParsedMessage>> get_all_messages(const std::string& id) override;
    Result<void> delete_session(const std::string& id) override;
    Result<std::size_t> session_count() override;

private:
    static std::vector<parser::ParsedMessage> strip_results(const std::vector<parser::ParsedMessage>& messages);

    std::unordered_map<std::string, parser::ParsedSession> sessions_;
    std::unordered_map<std::string, std::vector<parser::ParsedMessage>> messages_;
    mutable std::shared_mutex mutex_;
};

} // namespace als::store
