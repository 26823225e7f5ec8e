#pragma once
#ifndef TESTSIEVE_DATABASE_H
#define TESTSIEVE_DATABASE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace testsieve {

// Prepared statement. Errors throw StoreError.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, std::optional<bool> value);
    Statement& bind_blob(int index, std::string_view value);
    Statement& bind_null(int index);

    // true while a row is available
    bool step();
    // Steps until done, for statements without results.
    void run();
    void reset();

    bool is_null(int column) const;
    int64_t column_int64(int column) const;
    double column_double(int column) const;
    std::string column_text(int column) const;
    std::string column_blob(int column) const;
    std::optional<bool> column_optional_bool(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// One SQLite connection in WAL mode.
class Database {
public:
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);

    int64_t last_insert_rowid() const;
    const std::string& path() const { return path_; }
    bool is_open() const { return db_ != nullptr; }

    // Checkpoints the WAL and closes the handle. Open transactions are lost.
    void close();

private:
    std::string path_;
    sqlite3* db_ = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless committed.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

}  // namespace testsieve

#endif  // TESTSIEVE_DATABASE_H
