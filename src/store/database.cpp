#include "store/database.h"
#include "common/errors.h"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace testsieve {

namespace {

[[noreturn]] void throw_sqlite(sqlite3* db, const std::string& what) {
    throw StoreError(what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

}  // namespace

Statement::Statement(sqlite3* db, const std::string& sql)
    : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw_sqlite(db_, "SQLite prepare failed");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) throw_sqlite(db_, "SQLite bind failed");
    return *this;
}

Statement& Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) throw_sqlite(db_, "SQLite bind failed");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw_sqlite(db_, "SQLite bind failed");
    }
    return *this;
}

Statement& Statement::bind(int index, std::optional<bool> value) {
    if (!value) return bind_null(index);
    return bind(index, static_cast<int64_t>(*value ? 1 : 0));
}

Statement& Statement::bind_blob(int index, std::string_view value) {
    if (sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw_sqlite(db_, "SQLite bind failed");
    }
    return *this;
}

Statement& Statement::bind_null(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) throw_sqlite(db_, "SQLite bind failed");
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, "SQLite step failed");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::column_int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::column_double(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt_, column));
}

std::string Statement::column_blob(int column) const {
    const void* data = sqlite3_column_blob(stmt_, column);
    if (!data) return "";
    return std::string(static_cast<const char*>(data), sqlite3_column_bytes(stmt_, column));
}

std::optional<bool> Statement::column_optional_bool(int column) const {
    if (is_null(column)) return std::nullopt;
    return sqlite3_column_int64(stmt_, column) != 0;
}

Database::Database(const std::string& path)
    : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreConfigError("Cannot open " + path + ": " + message);
    }
    sqlite3_busy_timeout(db_, 60000);
}

Database::~Database() {
    close();
}

void Database::exec(const std::string& sql) {
    if (!db_) throw StoreError("Database " + path_ + " is closed");
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw StoreError("SQLite exec failed: " + message);
    }
}

Statement Database::prepare(const std::string& sql) {
    if (!db_) throw StoreError("Database " + path_ + " is closed");
    return Statement(db_, sql);
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

void Database::close() {
    if (!db_) return;
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, &errmsg) != SQLITE_OK) {
        spdlog::warn("WAL checkpoint of {} failed: {}", path_, errmsg ? errmsg : "unknown error");
        sqlite3_free(errmsg);
    }
    sqlite3_close_v2(db_);
    db_ = nullptr;
}

Transaction::Transaction(Database& db)
    : db_(db) {
    db_.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (done_) return;
    try {
        db_.exec("ROLLBACK");
    } catch (const std::exception& e) {
        spdlog::error("Rollback on {} failed: {}", db_.path(), e.what());
    }
}

void Transaction::commit() {
    db_.exec("COMMIT");
    done_ = true;
}

}  // namespace testsieve
