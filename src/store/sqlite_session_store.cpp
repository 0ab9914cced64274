#include "als/store/sqlite_session_store.hpp"

#include "als/parser/timestamp.hpp"
#include "als/store/sqlite_statement.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace als::store {

using parser::ParsedMessage;
using parser::ParsedSession;
using parser::ParsedToolCall;

namespace {

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS sessions (
  id TEXT PRIMARY KEY,
  project TEXT NOT NULL DEFAULT '',
  machine TEXT NOT NULL DEFAULT '',
  agent TEXT NOT NULL DEFAULT 'claude',
  first_message TEXT,
  started_at TEXT,
  ended_at TEXT,
  message_count INTEGER NOT NULL DEFAULT 0,
  user_message_count INTEGER NOT NULL DEFAULT 0,
  parent_session_id TEXT,
  file_path TEXT,
  file_size INTEGER,
  file_mtime INTEGER,
  file_hash TEXT,
  input_tokens INTEGER NOT NULL DEFAULT 0,
  output_tokens INTEGER NOT NULL DEFAULT 0,
  cache_creation_input_tokens INTEGER NOT NULL DEFAULT 0,
  cache_read_input_tokens INTEGER NOT NULL DEFAULT 0,
  mcp_servers TEXT NOT NULL DEFAULT '[]',
  created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))
);
CREATE TABLE IF NOT EXISTS messages (
  session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,
  ordinal INTEGER NOT NULL,
  role TEXT NOT NULL,
  content TEXT NOT NULL,
  timestamp TEXT,
  has_thinking INTEGER NOT NULL DEFAULT 0,
  has_tool_use INTEGER NOT NULL DEFAULT 0,
  content_length INTEGER NOT NULL DEFAULT 0,
  PRIMARY KEY (session_id, ordinal)
);
CREATE TABLE IF NOT EXISTS tool_calls (
  session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,
  message_ordinal INTEGER NOT NULL,
  tool_use_id TEXT,
  tool_name TEXT NOT NULL,
  category TEXT NOT NULL,
  input_json TEXT,
  result_content_length INTEGER NOT NULL DEFAULT 0,
  result_content TEXT
);
CREATE INDEX IF NOT EXISTS idx_tool_calls_session ON tool_calls(session_id, message_ordinal);
)";

constexpr const char* kSessionColumns =
    "id, project, machine, agent, first_message, started_at, ended_at, "
    "message_count, user_message_count, parent_session_id, file_path, "
    "file_size, file_mtime, file_hash, input_tokens, output_tokens, "
    "cache_creation_input_tokens, cache_read_input_tokens, mcp_servers";

parser::AgentType agent_from_string(const std::string& agent) {
    return agent == "codex" ? parser::AgentType::Codex : parser::AgentType::Claude;
}

parser::Role role_from_string(const std::string& role) {
    if (role == "assistant") return parser::Role::Assistant;
    if (role == "system") return parser::Role::System;
    return parser::Role::User;
}

std::string encode_servers(const std::vector<std::string>& servers) {
    return nlohmann::json(servers).dump();
}

std::vector<std::string> decode_servers(const std::string& raw) {
    std::vector<std::string> servers;
    const auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return servers;
    }
    for (const auto& item : parsed) {
        if (item.is_string()) {
            servers.push_back(item.get<std::string>());
        }
    }
    return servers;
}

void bind_optional_text(SqliteStatement& stmt, int index, const std::string& value) {
    if (value.empty()) {
        stmt.bind_null(index);
    } else {
        stmt.bind_text(index, value);
    }
}

ParsedSession read_session(const SqliteStatement& stmt) {
    ParsedSession s;
    s.id = stmt.column_text(0);
    s.project = stmt.column_text(1);
    s.machine = stmt.column_text(2);
    s.agent = agent_from_string(stmt.column_text(3));
    s.first_message = stmt.column_text(4);
    s.started_at = parser::parse_timestamp(stmt.column_text(5));
    s.ended_at = parser::parse_timestamp(stmt.column_text(6));
    s.message_count = static_cast<int>(stmt.column_int64(7));
    s.user_message_count = static_cast<int>(stmt.column_int64(8));
    s.parent_session_id = stmt.column_text(9);
    s.file_path = stmt.column_text(10);
    s.file_size = stmt.column_int64(11);
    s.file_mtime = stmt.column_int64(12);
    s.file_hash = stmt.column_text(13);
    s.token_usage.input_tokens = stmt.column_int64(14);
    s.token_usage.output_tokens = stmt.column_int64(15);
    s.token_usage.cache_creation_input_tokens = stmt.column_int64(16);
    s.token_usage.cache_read_input_tokens = stmt.column_int64(17);
    s.mcp_servers = decode_servers(stmt.column_text(18));
    return s;
}

} // namespace

SqliteSessionStore::SqliteSessionStore(sqlite3* db) : db_(db) {}

SqliteSessionStore::~SqliteSessionStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

Result<std::unique_ptr<SqliteSessionStore>> SqliteSessionStore::open(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            return Err<std::unique_ptr<SqliteSessionStore>>(
                ErrorCode::Persistence,
                "creating " + db_path.parent_path().string() + ": " + ec.message());
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
        const std::string msg = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return Err<std::unique_ptr<SqliteSessionStore>>(
            ErrorCode::Persistence, "opening " + db_path.string() + ": " + msg);
    }

    std::unique_ptr<SqliteSessionStore> store(new SqliteSessionStore(db));
    auto schema = store->init_schema();
    if (schema.is_error()) {
        return Err<std::unique_ptr<SqliteSessionStore>>(schema.error());
    }
    spdlog::debug("opened session store {}", db_path.string());
    return Ok(std::move(store));
}

Error SqliteSessionStore::sqlite_error(const std::string& context) const {
    return Error{ErrorCode::Persistence, context + ": " + sqlite3_errmsg(db_)};
}

Result<void> SqliteSessionStore::exec_locked(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const std::string msg = err == nullptr ? "sqlite error" : err;
        if (err != nullptr) {
            sqlite3_free(err);
        }
        return Err<void>(ErrorCode::Persistence, msg);
    }
    return Ok();
}

Result<void> SqliteSessionStore::exec(const std::string& sql) {
    std::lock_guard lock(mutex_);
    return exec_locked(sql);
}

Result<void> SqliteSessionStore::init_schema() {
    std::lock_guard lock(mutex_);
    auto status = exec_locked("PRAGMA journal_mode=WAL;");
    if (status.is_error()) {
        return status;
    }
    status = exec_locked("PRAGMA foreign_keys=ON;");
    if (status.is_error()) {
        return status;
    }
    return exec_locked(kSchema);
}

Result<void> SqliteSessionStore::in_transaction(const std::function<Result<void>()>& body) {
    auto begin = exec_locked("BEGIN IMMEDIATE;");
    if (begin.is_error()) {
        return begin;
    }
    auto result = body();
    if (result.is_error()) {
        auto rollback = exec_locked("ROLLBACK;");
        if (rollback.is_error()) {
            spdlog::error("rollback failed: {}", rollback.error().message);
        }
        return result;
    }
    auto commit = exec_locked("COMMIT;");
    if (commit.is_error()) {
        auto rollback = exec_locked("ROLLBACK;");
        if (rollback.is_error()) {
            spdlog::error("rollback failed: {}", rollback.error().message);
        }
    }
    return commit;
}

Result<void> SqliteSessionStore::upsert_locked(const ParsedSession& s) {
    static const std::string sql = std::string("INSERT INTO sessions (") + kSessionColumns +
        ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19) "
        "ON CONFLICT(id) DO UPDATE SET "
        "project = excluded.project, machine = excluded.machine, agent = excluded.agent, "
        "first_message = excluded.first_message, started_at = excluded.started_at, "
        "ended_at = excluded.ended_at, message_count = excluded.message_count, "
        "user_message_count = excluded.user_message_count, "
        "parent_session_id = excluded.parent_session_id, file_path = excluded.file_path, "
        "file_size = excluded.file_size, file_mtime = excluded.file_mtime, "
        "file_hash = excluded.file_hash, input_tokens = excluded.input_tokens, "
        "output_tokens = excluded.output_tokens, "
        "cache_creation_input_tokens = excluded.cache_creation_input_tokens, "
        "cache_read_input_tokens = excluded.cache_read_input_tokens, "
        "mcp_servers = excluded.mcp_servers";

    if (s.id.empty()) {
        return Err<void>(ErrorCode::Persistence, "upsert session: empty id");
    }

    SqliteStatement stmt(db_, sql.c_str());
    if (!stmt.valid()) {
        return Err<void>(sqlite_error("prepare upsert session"));
    }
    stmt.bind_text(1, s.id);
    stmt.bind_text(2, s.project);
    stmt.bind_text(3, s.machine);
    stmt.bind_text(4, parser::to_string(s.agent));
    bind_optional_text(stmt, 5, s.first_message);
    bind_optional_text(stmt, 6, parser::format_timestamp(s.started_at));
    bind_optional_text(stmt, 7, parser::format_timestamp(s.ended_at));
    stmt.bind_int64(8, s.message_count);
    stmt.bind_int64(9, s.user_message_count);
    bind_optional_text(stmt, 10, s.parent_session_id);
    bind_optional_text(stmt, 11, s.file_path);
    stmt.bind_int64(12, s.file_size);
    stmt.bind_int64(13, s.file_mtime);
    bind_optional_text(stmt, 14, s.file_hash);
    stmt.bind_int64(15, s.token_usage.input_tokens);
    stmt.bind_int64(16, s.token_usage.output_tokens);
    stmt.bind_int64(17, s.token_usage.cache_creation_input_tokens);
    stmt.bind_int64(18, s.token_usage.cache_read_input_tokens);
    stmt.bind_text(19, encode_servers(s.mcp_servers));

    if (stmt.step() != SQLITE_DONE) {
        return Err<void>(sqlite_error("upsert session " + s.id));
    }
    return Ok();
}

Result<void> SqliteSessionStore::replace_messages_locked(const std::string& id,
                                                         const std::vector<ParsedMessage>& messages) {
    for (const char* sql : {"DELETE FROM tool_calls WHERE session_id = ?1",
                            "DELETE FROM messages WHERE session_id = ?1"}) {
        SqliteStatement del(db_, sql);
        if (!del.valid()) {
            return Err<void>(sqlite_error("prepare delete"));
        }
        del.bind_text(1, id);
        if (del.step() != SQLITE_DONE) {
            return Err<void>(sqlite_error("delete messages " + id));
        }
    }

    SqliteStatement insert_msg(db_,
        "INSERT INTO messages (session_id, ordinal, role, content, timestamp, "
        "has_thinking, has_tool_use, content_length) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
    SqliteStatement insert_call(db_,
        "INSERT INTO tool_calls (session_id, message_ordinal, tool_use_id, tool_name, "
        "category, input_json, result_content_length, result_content) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
    if (!insert_msg.valid() || !insert_call.valid()) {
        return Err<void>(sqlite_error("prepare insert messages"));
    }

    for (const auto& msg : messages) {
        insert_msg.reset();
        insert_msg.bind_text(1, id);
        insert_msg.bind_int64(2, msg.ordinal);
        insert_msg.bind_text(3, parser::to_string(msg.role));
        insert_msg.bind_text(4, msg.content);
        bind_optional_text(insert_msg, 5, parser::format_timestamp(msg.timestamp));
        insert_msg.bind_int64(6, msg.has_thinking ? 1 : 0);
        insert_msg.bind_int64(7, msg.has_tool_use ? 1 : 0);
        insert_msg.bind_int64(8, static_cast<std::int64_t>(msg.content_length));
        if (insert_msg.step() != SQLITE_DONE) {
            return Err<void>(sqlite_error("insert message " + id + "#" + std::to_string(msg.ordinal)));
        }

        for (const auto& call : msg.tool_calls) {
            insert_call.reset();
            insert_call.bind_text(1, id);
            insert_call.bind_int64(2, msg.ordinal);
            bind_optional_text(insert_call, 3, call.tool_use_id);
            insert_call.bind_text(4, call.tool_name);
            insert_call.bind_text(5, call.category);
            bind_optional_text(insert_call, 6, call.input_json);
            insert_call.bind_int64(7, static_cast<std::int64_t>(call.result_content_length));
            bind_optional_text(insert_call, 8, call.result_content);
            if (insert_call.step() != SQLITE_DONE) {
                return Err<void>(sqlite_error("insert tool call " + id));
            }
        }
    }
    return Ok();
}

Result<std::optional<SessionFileInfo>> SqliteSessionStore::get_session_file_info(const std::string& id) {
    std::lock_guard lock(mutex_);
    SqliteStatement stmt(db_, "SELECT file_size, file_hash FROM sessions WHERE id = ?1");
    if (!stmt.valid()) {
        return Err<std::optional<SessionFileInfo>>(sqlite_error("prepare file info"));
    }
    stmt.bind_text(1, id);
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return Ok(std::optional<SessionFileInfo>{});
    }
    if (rc != SQLITE_ROW) {
        return Err<std::optional<SessionFileInfo>>(sqlite_error("file info " + id));
    }
    return Ok(std::optional<SessionFileInfo>(SessionFileInfo{stmt.column_int64(0), stmt.column_text(1)}));
}

Result<std::optional<ParsedSession>> SqliteSessionStore::get_session_full(const std::string& id) {
    static const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE id = ?1";

    std::lock_guard lock(mutex_);
    SqliteStatement stmt(db_, sql.c_str());
    if (!stmt.valid()) {
        return Err<std::optional<ParsedSession>>(sqlite_error("prepare get session"));
    }
    stmt.bind_text(1, id);
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return Ok(std::optional<ParsedSession>{});
    }
    if (rc != SQLITE_ROW) {
        return Err<std::optional<ParsedSession>>(sqlite_error("get session " + id));
    }
    return Ok(std::optional<ParsedSession>(read_session(stmt)));
}

Result<void> SqliteSessionStore::upsert_session(const ParsedSession& session) {
    std::lock_guard lock(mutex_);
    return upsert_locked(session);
}

Result<void> SqliteSessionStore::replace_session_messages(const std::string& id,
                                                          const std::vector<ParsedMessage>& messages) {
    std::lock_guard lock(mutex_);
    return in_transaction([&] { return replace_messages_locked(id, messages); });
}

Result<void> SqliteSessionStore::write_session(const ParsedSession& session,
                                               const std::vector<ParsedMessage>& messages) {
    std::lock_guard lock(mutex_);
    return in_transaction([&]() -> Result<void> {
        auto upsert = upsert_locked(session);
        if (upsert.is_error()) {
            return upsert;
        }
        return replace_messages_locked(session.id, messages);
    });
}

Result<std::vector<ParsedMessage>> SqliteSessionStore::get_all_messages(const std::string& id) {
    std::lock_guard lock(mutex_);

    SqliteStatement stmt(db_,
        "SELECT ordinal, role, content, timestamp, has_thinking, has_tool_use, content_length "
        "FROM messages WHERE session_id = ?1 ORDER BY ordinal");
    SqliteStatement calls(db_,
        "SELECT message_ordinal, tool_use_id, tool_name, category, input_json, "
        "result_content_length, result_content "
        "FROM tool_calls WHERE session_id = ?1 ORDER BY message_ordinal, rowid");
    if (!stmt.valid() || !calls.valid()) {
        return Err<std::vector<ParsedMessage>>(sqlite_error("prepare get messages"));
    }

    std::vector<ParsedMessage> messages;
    stmt.bind_text(1, id);
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ParsedMessage msg;
        msg.ordinal = static_cast<int>(stmt.column_int64(0));
        msg.role = role_from_string(stmt.column_text(1));
        msg.content = stmt.column_text(2);
        msg.timestamp = parser::parse_timestamp(stmt.column_text(3));
        msg.has_thinking = stmt.column_int64(4) != 0;
        msg.has_tool_use = stmt.column_int64(5) != 0;
        msg.content_length = static_cast<std::size_t>(stmt.column_int64(6));
        messages.push_back(std::move(msg));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<ParsedMessage>>(sqlite_error("get messages " + id));
    }

    // Ordinals are contiguous, so the ordinal doubles as the index.
    calls.bind_text(1, id);
    while ((rc = calls.step()) == SQLITE_ROW) {
        const auto ordinal = static_cast<std::size_t>(calls.column_int64(0));
        if (ordinal >= messages.size()) {
            continue;
        }
        ParsedToolCall call;
        call.tool_use_id = calls.column_text(1);
        call.tool_name = calls.column_text(2);
        call.category = calls.column_text(3);
        call.input_json = calls.column_text(4);
        call.result_content_length = static_cast<std::size_t>(calls.column_int64(5));
        call.result_content = calls.column_text(6);
        messages[ordinal].tool_calls.push_back(std::move(call));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<ParsedMessage>>(sqlite_error("get tool calls " + id));
    }
    return Ok(std::move(messages));
}

Result<void> SqliteSessionStore::delete_session(const std::string& id) {
    std::lock_guard lock(mutex_);
    return in_transaction([&]() -> Result<void> {
        for (const char* sql : {"DELETE FROM tool_calls WHERE session_id = ?1",
                                "DELETE FROM messages WHERE session_id = ?1",
                                "DELETE FROM sessions WHERE id = ?1"}) {
            SqliteStatement stmt(db_, sql);
            if (!stmt.valid()) {
                return Err<void>(sqlite_error("prepare delete session"));
            }
            stmt.bind_text(1, id);
            if (stmt.step() != SQLITE_DONE) {
                return Err<void>(sqlite_error("delete session " + id));
            }
        }
        if (sqlite3_changes(db_) == 0) {
            return Err<void>(ErrorCode::NotFound, "session not found: " + id);
        }
        return Ok();
    });
}

Result<std::size_t> SqliteSessionStore::session_count() {
    std::lock_guard lock(mutex_);
    SqliteStatement stmt(db_, "SELECT COUNT(*) FROM sessions");
    if (!stmt.valid() || stmt.step() != SQLITE_ROW) {
        return Err<std::size_t>(sqlite_error("count sessions"));
    }
    return Ok(static_cast<std::size_t>(stmt.column_int64(0)));
}

} // namespace als::store
