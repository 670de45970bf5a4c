// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "result.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace binauthz {

class SqliteDb;

/**
 * Prepared statement owned for the lifetime of one query.
 *
 * Parameter indices are 1-based, column indices 0-based, as in the C API.
 */
class SqliteStatement {
  public:
    SqliteStatement() = default;
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    Result<void> bind_text(int index, const std::string& value);
    // Absent and empty values bind as NULL so they never equal a stored identifier.
    Result<void> bind_optional_text(int index, const std::optional<std::string>& value);
    Result<void> bind_int64(int index, int64_t value);
    Result<void> bind_null(int index);

    // true while a row is available, false once the statement is done.
    Result<bool> step();
    Result<void> reset();

    [[nodiscard]] std::string column_text(int column) const;
    [[nodiscard]] int64_t column_int64(int column) const;
    [[nodiscard]] bool column_is_null(int column) const;

  private:
    friend class SqliteDb;
    SqliteStatement(sqlite3* db, sqlite3_stmt* stmt, std::string sql);

    Error bind_error(int rc, int index) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

class SqliteDb {
  public:
    SqliteDb() = default;
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;
    SqliteDb(SqliteDb&& other) noexcept;
    SqliteDb& operator=(SqliteDb&& other) noexcept;

    // Opens or creates the file and probes it, so a non-database file fails here.
    Result<void> open(const std::string& path);
    void close();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    Result<void> exec(const std::string& sql);
    Result<SqliteStatement> prepare(const std::string& sql);

    Result<uint32_t> user_version();
    Result<void> set_user_version(uint32_t version);

    // Rows touched by the most recent INSERT, UPDATE or DELETE.
    [[nodiscard]] int64_t changes() const;
    [[nodiscard]] std::string last_error() const;

  private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// Rolls back on destruction unless commit() succeeded.
class SqliteTransaction {
  public:
    explicit SqliteTransaction(SqliteDb& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    Result<void> begin();
    Result<void> commit();
    void rollback();

    [[nodiscard]] bool active() const { return active_; }

  private:
    SqliteDb& db_;
    bool active_ = false;
};

} // namespace binauthz
