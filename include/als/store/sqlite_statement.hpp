#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace als::store {

/**
 * @brief Owns one prepared statement; finalized on destruction
 *
 * Check valid() after construction; sqlite3_errmsg(db) has the reason
 * when it is false.
 *
 * The first failed bind is latched: step() returns its code without
 * executing until reset(), so callers check step() only.
 */
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const char* sql) noexcept;
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    bool valid() const noexcept { return stmt_ != nullptr; }
    sqlite3_stmt* get() const noexcept { return stmt_; }

    int bind_text(int index, const std::string& value) noexcept;
    int bind_int64(int index, std::int64_t value) noexcept;
    int bind_null(int index) noexcept;

    /// SQLITE_ROW, SQLITE_DONE or an error code (including a latched bind error).
    int step() noexcept;
    int reset() noexcept;

    /// "" for NULL columns.
    std::string column_text(int col) const;
    std::int64_t column_int64(int col) const noexcept;

private:
    int track_bind(int rc) noexcept;

    sqlite3_stmt* stmt_ = nullptr;
    int bind_rc_ = SQLITE_OK;
};

} // namespace als::store
