#pragma once

/**
 * @file session_store.hpp
 * @brief Persistence boundary used by the sync engine
 *
 * The engine only needs a narrow write path plus the two reads that drive
 * change detection and project-override preservation. Implementations:
 * - MemorySessionStore: in-process, used by tests and one-shot tools
 * - SqliteSessionStore: durable, single writer connection
 *
 * CONTRACT:
 * - write_session() applies the session row and the full message list
 *   atomically (delete-then-insert of messages). Readers never see a new
 *   session row with old messages or the reverse.
 * - A session with zero messages is a valid row (tombstone).
 * - Failures are reported as ErrorCode::Persistence.
 */

#include "als/core/result.hpp"
#include "als/parser/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace als::store {

struct SessionFileInfo {
    std::int64_t size = 0;
    std::string hash;
};

class SessionStore {
public:
    virtual ~SessionStore() = default;

    /// (size, hash) recorded at last sync; nullopt when the session is unknown.
    virtual Result<std::optional<SessionFileInfo>> get_session_file_info(const std::string& id) = 0;

    virtual Result<std::optional<parser::ParsedSession>> get_session_full(const std::string& id) = 0;

    virtual Result<void> upsert_session(const parser::ParsedSession& session) = 0;

    virtual Result<void> replace_session_messages(const std::string& id,
                                                  const std::vector<parser::ParsedMessage>& messages) = 0;

    /// upsert_session + replace_session_messages in one transaction.
    virtual Result<void> write_session(const parser::ParsedSession& session,
                                       const std::vector<parser::ParsedMessage>& messages) = 0;

    /// Messages in ordinal order, tool calls attached. Tool results are not kept.
    virtual Result<std::vector<parser::ParsedMessage>> get_all_messages(const std::string& id) = 0;

    virtual Result<void> delete_session(const std::string& id) = 0;

    virtual Result<std::size_t> session_count() = 0;
};

} // namespace als::store
