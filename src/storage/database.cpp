#include "postrelay/storage/database.hpp"
#include "postrelay/core/logger.hpp"
#include <sqlite3.h>

namespace postrelay::storage {

Database::Database(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::open() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        return;
    }

    auto parent = db_path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open database " + db_path_.string() + ": " + message);
    }

    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    LOG_DEBUG("Opened database {}", db_path_.string());
}

void Database::exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        throw StorageError("Database is not open: " + db_path_.string());
    }

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errstr(result);
        sqlite3_free(error_msg);
        throw StorageError("SQL error: " + message);
    }
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database is not open";
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Statement::Statement(Database& db, const std::string& sql)
    : db_(db), stmt_(nullptr) {
    if (!db_.is_open()) {
        throw StorageError("Database is not open: " + db_.path().string());
    }
    int result = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (result != SQLITE_OK) {
        throw StorageError("Failed to prepare statement: " + db_.last_error());
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

Statement& Statement::bind_null(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

bool Statement::step() {
    int result = sqlite3_step(stmt_);
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result == SQLITE_DONE) {
        return false;
    }
    throw StorageError("Failed to execute statement: " + db_.last_error());
}

void Statement::execute() {
    while (step()) {
    }
}

std::string Statement::column_text(int index) const {
    auto text = sqlite3_column_text(stmt_, index);
    if (!text) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

Transaction::Transaction(Database& db)
    : db_(db), lock_(db.mutex()), committed_(false) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (committed_) {
        return;
    }
    try {
        db_.exec("ROLLBACK;");
    } catch (const StorageError& e) {
        LOG_ERROR("Rollback failed: {}", e.what());
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    committed_ = true;
}

}
