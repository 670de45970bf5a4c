// cppcheck-suppress-file missingIncludeSystem
#include "sqlite_db.hpp"

#include <sqlite3.h>

#include <utility>

#include "logging.hpp"

namespace binauthz {

namespace {

Error query_error(sqlite3* db, int rc, const std::string& what)
{
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    detail += " (rc=" + std::to_string(rc) + ")";
    return Error(ErrorCode::DatabaseQueryFailed, what, detail);
}

} // namespace

SqliteStatement::SqliteStatement(sqlite3* db, sqlite3_stmt* stmt, std::string sql)
    : db_(db), stmt_(stmt), sql_(std::move(sql))
{
}

SqliteStatement::~SqliteStatement()
{
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)), sql_(std::move(other.sql_))
{
}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept
{
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
        sql_ = std::move(other.sql_);
    }
    return *this;
}

Error SqliteStatement::bind_error(int rc, int index) const
{
    return query_error(db_, rc, "Failed to bind parameter " + std::to_string(index) + " of '" + sql_ + "'");
}

Result<void> SqliteStatement::bind_text(int index, const std::string& value)
{
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return bind_error(rc, index);
    }
    return {};
}

Result<void> SqliteStatement::bind_optional_text(int index, const std::optional<std::string>& value)
{
    if (!value || value->empty()) {
        return bind_null(index);
    }
    return bind_text(index, *value);
}

Result<void> SqliteStatement::bind_int64(int index, int64_t value)
{
    int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK) {
        return bind_error(rc, index);
    }
    return {};
}

Result<void> SqliteStatement::bind_null(int index)
{
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        return bind_error(rc, index);
    }
    return {};
}

Result<bool> SqliteStatement::step()
{
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return query_error(db_, rc, "Failed to execute '" + sql_ + "'");
}

Result<void> SqliteStatement::reset()
{
    sqlite3_clear_bindings(stmt_);
    int rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
        return query_error(db_, rc, "Failed to reset '" + sql_ + "'");
    }
    return {};
}

std::string SqliteStatement::column_text(int column) const
{
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

int64_t SqliteStatement::column_int64(int column) const
{
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

bool SqliteStatement::column_is_null(int column) const
{
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

SqliteDb::~SqliteDb()
{
    close();
}

SqliteDb::SqliteDb(SqliteDb&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_))
{
}

SqliteDb& SqliteDb::operator=(SqliteDb&& other) noexcept
{
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

Result<void> SqliteDb::open(const std::string& path)
{
    close();

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close(db);
        }
        return Error(ErrorCode::DatabaseOpenFailed, "Failed to open rule database " + path, detail);
    }

    // sqlite3_open_v2 is lazy; touching the schema reports corrupt or foreign files.
    rc = sqlite3_exec(db, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = sqlite3_errmsg(db);
        sqlite3_close(db);
        return Error(ErrorCode::DatabaseOpenFailed, "Rule database is unreadable " + path, detail);
    }

    db_ = db;
    path_ = path;
    return {};
}

void SqliteDb::close()
{
    if (db_) {
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            logger().log(SLOG_WARN("Failed to close rule database cleanly")
                             .field("path", path_)
                             .field("error", std::string(sqlite3_errstr(rc))));
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
}

Result<void> SqliteDb::exec(const std::string& sql)
{
    if (!db_) {
        return Error(ErrorCode::DatabaseUnavailable, "Rule database is not open");
    }
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string detail = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return Error(ErrorCode::DatabaseQueryFailed, "Failed to execute '" + sql + "'", detail);
    }
    return {};
}

Result<SqliteStatement> SqliteDb::prepare(const std::string& sql)
{
    if (!db_) {
        return Error(ErrorCode::DatabaseUnavailable, "Rule database is not open");
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        return query_error(db_, rc, "Failed to prepare '" + sql + "'");
    }
    return SqliteStatement(db_, stmt, sql);
}

Result<uint32_t> SqliteDb::user_version()
{
    auto stmt = prepare("PRAGMA user_version");
    if (!stmt) {
        return stmt.error();
    }
    auto row = stmt->step();
    if (!row) {
        return row.error();
    }
    if (!*row) {
        return 0u;
    }
    return static_cast<uint32_t>(stmt->column_int64(0));
}

Result<void> SqliteDb::set_user_version(uint32_t version)
{
    return exec("PRAGMA user_version = " + std::to_string(version));
}

int64_t SqliteDb::changes() const
{
    return db_ ? static_cast<int64_t>(sqlite3_changes(db_)) : 0;
}

std::string SqliteDb::last_error() const
{
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

SqliteTransaction::SqliteTransaction(SqliteDb& db) : db_(db) {}

SqliteTransaction::~SqliteTransaction()
{
    rollback();
}

Result<void> SqliteTransaction::begin()
{
    TRY(db_.exec("BEGIN IMMEDIATE TRANSACTION"));
    active_ = true;
    return {};
}

Result<void> SqliteTransaction::commit()
{
    if (!active_) {
        return Error(ErrorCode::DatabaseQueryFailed, "No transaction to commit");
    }
    TRY(db_.exec("COMMIT TRANSACTION"));
    active_ = false;
    return {};
}

void SqliteTransaction::rollback()
{
    if (!active_) {
        return;
    }
    active_ = false;
    auto result = db_.exec("ROLLBACK TRANSACTION");
    if (!result) {
        logger().log(SLOG_WARN("Transaction rollback failed").field("error", result.error().to_string()));
    }
}

} // namespace binauthz
