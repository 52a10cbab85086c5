#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace netmap {

/*
  Thin RAII wrapper around sqlite3*.

  Opening configures WAL, foreign keys and a busy timeout. Failures to open
  or configure throw StoreUnavailable.
*/
class SqliteDB {
public:
    explicit SqliteDB(std::string path);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    // Execute a SQL string (pragmas, migrations, transaction control)
    void exec(const std::string& sql);

    int user_version();
    void set_user_version(int version);

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void configure();
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/**
 * @brief Prepare a statement; returns null and leaves the error on the
 *        connection if preparation fails
 */
Statement prepare(sqlite3* db, const char* sql);

/*
  BEGIN IMMEDIATE transaction; rolls back on destruction unless committed.
*/
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDB& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteDB& db_;
    bool done_ = false;
};

} // namespace netmap
