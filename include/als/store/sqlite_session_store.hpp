#pragma once

#include "als/store/session_store.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>

namespace als::store {

/**
 * @brief SessionStore backed by a single SQLite connection
 *
 * Tables: sessions, messages, tool_calls. The connection runs in WAL
 * mode and every call goes through one mutex, which is also the write
 * serialization point for concurrent sync passes.
 *
 * EXAMPLE:
 * auto opened = SqliteSessionStore::open(data_dir / "sessions.db");
 * if (opened.is_error()) { ... }
 * Engine engine(*opened.value(), config);
 */
class SqliteSessionStore : public SessionStore {
public:
    /// Creates parent directories and the schema when missing.
    static Result<std::unique_ptr<SqliteSessionStore>> open(const std::filesystem::path& db_path);

    ~SqliteSessionStore() override;

    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

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

    /// Raw statement execution, for maintenance and tests.
    Result<void> exec(const std::string& sql);

private:
    explicit SqliteSessionStore(sqlite3* db);

    Result<void> init_schema();
    Result<void> exec_locked(const std::string& sql);
    Result<void> upsert_locked(const parser::ParsedSession& session);
    Result<void> replace_messages_locked(const std::string& id,
                                         const std::vector<parser::ParsedMessage>& messages);
    Result<void> in_transaction(const std::function<Result<void>()>& body);
    Error sqlite_error(const std::string& context) const;

    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace als::store
