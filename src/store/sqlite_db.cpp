#include "store/sqlite_db.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

namespace netmap {

namespace {

void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreUnavailable("cannot open " + path_ + ": " + msg);
    }

    try {
        configure();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDB::~SqliteDB() {
    if (db_) sqlite3_close(db_);
}

void SqliteDB::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw StoreUnavailable(msg);
    }
}

int SqliteDB::user_version() {
    Statement st = prepare(db_, "PRAGMA user_version;");
    if (!st) {
        throw StoreUnavailable(std::string("user_version: ") + sqlite3_errmsg(db_));
    }
    int version = 0;
    if (sqlite3_step(st.get()) == SQLITE_ROW) {
        version = sqlite3_column_int(st.get(), 0);
    }
    return version;
}

void SqliteDB::set_user_version(int version) {
    exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::configure() {
    // WAL lets readers proceed while a writer holds the lock
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");

    // Off by default in sqlite; relationships cascade on entity delete
    exec("PRAGMA foreign_keys=ON;");

    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

    exec("PRAGMA temp_store=MEMORY;");
}

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        if (st) sqlite3_finalize(st);
        return Statement();
    }
    return Statement(st);
}

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        NETMAP_LOG_WARN("sqlite rollback failed", {log::StringField("error", err ? err : "unknown")});
    }
    sqlite3_free(err);
}

void SqliteTransaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace netmap
