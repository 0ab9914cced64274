#include "als/store/sqlite_statement.hpp"

namespace als::store {

SqliteStatement::SqliteStatement(sqlite3* db, const char* sql) noexcept {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

int SqliteStatement::bind_text(int index, const std::string& value) noexcept {
    return track_bind(sqlite3_bind_text(stmt_, index, value.c_str(),
                                        static_cast<int>(value.size()), SQLITE_TRANSIENT));
}

int SqliteStatement::bind_int64(int index, std::int64_t value) noexcept {
    return track_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
}

int SqliteStatement::bind_null(int index) noexcept {
    return track_bind(sqlite3_bind_null(stmt_, index));
}

int SqliteStatement::step() noexcept {
    if (bind_rc_ != SQLITE_OK) {
        return bind_rc_;
    }
    return sqlite3_step(stmt_);
}

int SqliteStatement::reset() noexcept {
    bind_rc_ = SQLITE_OK;
    sqlite3_clear_bindings(stmt_);
    return sqlite3_reset(stmt_);
}

int SqliteStatement::track_bind(int rc) noexcept {
    if (rc != SQLITE_OK && bind_rc_ == SQLITE_OK) {
        bind_rc_ = rc;
    }
    return rc;
}

std::string SqliteStatement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::int64_t SqliteStatement::column_int64(int col) const noexcept {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

} // namespace als::store
