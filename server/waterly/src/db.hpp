#pragma once

extern "C" {
#include <sqlite3.h>
}

#include <ctime>
#include <optional>
#include <string>

namespace waterly {

// Owns one SQLite connection. Foreign keys are always on; file databases run
// in WAL mode.
class Database {
public:
    explicit Database(const std::string &path);
    ~Database();

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    sqlite3 *handle() const { return db_; }
    const std::string &path() const { return path_; }

    // Runs one or more statements; throws StorageError with SQLite's message.
    void exec(const std::string &sql);

    sqlite3_int64 last_insert_id() const;
    std::string errmsg() const;

private:
    sqlite3    *db_ = nullptr;
    std::string path_;
};

class Statement {
public:
    Statement(const Database &db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const { return stmt_; }

    // true while a row is available, false once done. Any other result code
    // throws StorageError.
    bool step();

    // Raw result of sqlite3_step(), for callers that map constraint codes
    // to their own errors.
    int step_rc();

    void bind_int64(int index, sqlite3_int64 value);
    void bind_double(int index, double value);
    void bind_text(int index, const std::string &value);
    void bind_opt_int(int index, const std::optional<int> &value);
    void bind_opt_double(int index, const std::optional<double> &value);
    void bind_opt_text(int index, const std::optional<std::string> &value);

    bool          is_null(int col) const;
    sqlite3_int64 column_int64(int col) const;
    double        column_double(int col) const;
    std::string   column_text(int col) const;

    std::optional<int>         column_opt_int(int col) const;
    std::optional<double>      column_opt_double(int col) const;
    std::optional<std::string> column_opt_text(int col) const;

private:
    const Database &db_;
    sqlite3_stmt   *stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() was called.
class Transaction {
public:
    explicit Transaction(Database &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:
    Database &db_;
    bool      done_ = false;
};

} // namespace waterly
