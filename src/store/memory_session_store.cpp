#include "als/store/memory_session_store.hpp"

#include <mutex>

namespace als::store {

using parser::ParsedMessage;
using parser::ParsedSession;

std::vector<ParsedMessage> MemorySessionStore::strip_results(const std::vector<ParsedMessage>& messages) {
    std::vector<ParsedMessage> stored = messages;
    for (auto& msg : stored) {
        msg.tool_results.clear();
    }
    return stored;
}

Result<std::optional<SessionFileInfo>> MemorySessionStore::get_session_file_info(const std::string& id) {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Ok(std::optional<SessionFileInfo>{});
    }
    return Ok(std::optional<SessionFileInfo>(SessionFileInfo{it->second.file_size, it->second.file_hash}));
}

Result<std::optional<ParsedSession>> MemorySessionStore::get_session_full(const std::string& id) {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Ok(std::optional<ParsedSession>{});
    }
    return Ok(std::optional<ParsedSession>(it->second));
}

Result<void> MemorySessionStore::upsert_session(const ParsedSession& session) {
    if (session.id.empty()) {
        return Err<void>(ErrorCode::Persistence, "upsert session: empty id");
    }
    std::unique_lock lock(mutex_);
    sessions_[session.id] = session;
    return Ok();
}

Result<void> MemorySessionStore::replace_session_messages(const std::string& id,
                                                          const std::vector<ParsedMessage>& messages) {
    std::unique_lock lock(mutex_);
    messages_[id] = strip_results(messages);
    return Ok();
}

Result<void> MemorySessionStore::write_session(const ParsedSession& session,
                                               const std::vector<ParsedMessage>& messages) {
    if (session.id.empty()) {
        return Err<void>(ErrorCode::Persistence, "write session: empty id");
    }
    auto stored = strip_results(messages);

    std::unique_lock lock(mutex_);
    sessions_[session.id] = session;
    messages_[session.id] = std::move(stored);
    return Ok();
}

Result<std::vector<ParsedMessage>> MemorySessionStore::get_all_messages(const std::string& id) {
    std::shared_lock lock(mutex_);
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return Ok(std::vector<ParsedMessage>{});
    }
    return Ok(it->second);
}

Result<void> MemorySessionStore::delete_session(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (sessions_.erase(id) == 0) {
        return Err<void>(ErrorCode::NotFound, "session not found: " + id);
    }
    messages_.erase(id);
    return Ok();
}

Result<std::size_t> MemorySessionStore::session_count() {
    std::shared_lock lock(mutex_);
    return Ok(sessions_.size());
}

} // namespace als::store
