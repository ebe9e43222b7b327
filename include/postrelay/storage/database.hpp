#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace postrelay::storage {

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns one SQLite connection. Every store in the process shares it; callers
// serialize access through mutex().
class Database {
public:
    explicit Database(const std::filesystem::path& database_path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Opens the file (creating it if needed) and switches to WAL journaling.
    void open();
    bool is_open() const { return db_ != nullptr; }

    void exec(const std::string& sql);

    sqlite3* handle() const { return db_; }
    std::recursive_mutex& mutex() { return mutex_; }
    const std::filesystem::path& path() const { return db_path_; }

    std::string last_error() const;
    // Rows touched by the most recent INSERT, UPDATE or DELETE.
    int changes() const;

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::recursive_mutex mutex_;
};

class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, int64_t value);
    Statement& bind_null(int index);
    Statement& bind(int index, const std::optional<std::string>& value);

    // True while a row is available; false once the statement is done.
    bool step();
    void execute();

    std::string column_text(int index) const;
    std::optional<std::string> column_optional_text(int index) const;
    int64_t column_int64(int index) const;

private:
    Database& db_;
    sqlite3_stmt* stmt_;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit() ran.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    std::lock_guard<std::recursive_mutex> lock_;
    bool committed_;
};

}
