#include "db.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace waterly {

static const int BUSY_TIMEOUT_MS = 10000;

// =========================================
// Database
// =========================================

Database::Database(const std::string &path)
    : path_(path)
{
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("failed to open DB at " + path + ": " + msg);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

    try {
        exec("PRAGMA foreign_keys = ON;");
        if (path != ":memory:") {
            exec("PRAGMA journal_mode = WAL;");
        }
        exec("PRAGMA synchronous = NORMAL;");
    }
    catch (const StorageError &) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Database::~Database()
{
    if (db_ && sqlite3_close(db_) != SQLITE_OK) {
        Logger::error("closing %s: %s", path_.c_str(), sqlite3_errmsg(db_));
    }
}

void Database::exec(const std::string &sql)
{
    char *err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StorageError(message);
    }
}

sqlite3_int64 Database::last_insert_id() const
{
    return sqlite3_last_insert_rowid(db_);
}

std::string Database::errmsg() const
{
    return sqlite3_errmsg(db_);
}

// =========================================
// Statement
// =========================================

Statement::Statement(const Database &db, const char *sql)
    : db_(db)
{
    if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("sqlite prepare failed: ") + db.errmsg());
    }
}

Statement::~Statement()
{
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

int Statement::step_rc()
{
    return sqlite3_step(stmt_);
}

bool Statement::step()
{
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    throw StorageError(std::string("sqlite step failed: ") + db_.errmsg());
}

void Statement::bind_int64(int index, sqlite3_int64 value)
{
    sqlite3_bind_int64(stmt_, index, value);
}

void Statement::bind_double(int index, double value)
{
    sqlite3_bind_double(stmt_, index, value);
}

void Statement::bind_text(int index, const std::string &value)
{
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::bind_opt_int(int index, const std::optional<int> &value)
{
    if (value)
        sqlite3_bind_int(stmt_, index, *value);
    else
        sqlite3_bind_null(stmt_, index);
}

void Statement::bind_opt_double(int index, const std::optional<double> &value)
{
    if (value)
        sqlite3_bind_double(stmt_, index, *value);
    else
        sqlite3_bind_null(stmt_, index);
}

void Statement::bind_opt_text(int index, const std::optional<std::string> &value)
{
    if (value)
        bind_text(index, *value);
    else
        sqlite3_bind_null(stmt_, index);
}

bool Statement::is_null(int col) const
{
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

sqlite3_int64 Statement::column_int64(int col) const
{
    return sqlite3_column_int64(stmt_, col);
}

double Statement::column_double(int col) const
{
    return sqlite3_column_double(stmt_, col);
}

std::string Statement::column_text(int col) const
{
    const unsigned char *text = sqlite3_column_text(stmt_, col);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<int> Statement::column_opt_int(int col) const
{
    if (is_null(col))
        return std::nullopt;
    return sqlite3_column_int(stmt_, col);
}

std::optional<double> Statement::column_opt_double(int col) const
{
    if (is_null(col))
        return std::nullopt;
    return sqlite3_column_double(stmt_, col);
}

std::optional<std::string> Statement::column_opt_text(int col) const
{
    if (is_null(col))
        return std::nullopt;
    return column_text(col);
}

// =========================================
// Transaction
// =========================================

Transaction::Transaction(Database &db)
    : db_(db)
{
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction()
{
    if (done_)
        return;

    char *err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        Logger::error("rollback failed on %s: %s", db_.path().c_str(), err ? err : "unknown");
    }
    sqlite3_free(err);
}

void Transaction::commit()
{
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace waterly
