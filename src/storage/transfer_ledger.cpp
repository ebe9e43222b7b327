#include "postrelay/storage/transfer_ledger.hpp"
#include "postrelay/core/utils.hpp"

namespace postrelay::storage {

using postrelay::core::utils::TimeUtils;

TransferLedger::TransferLedger(Database& db)
    : db_(db) {
}

void TransferLedger::initialize() {
    db_.exec(R"(
        CREATE TABLE IF NOT EXISTS background_tasks (
            task_id INTEGER PRIMARY KEY,
            temp_file TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
    )");
}

void TransferLedger::record(uint64_t task_id, const std::filesystem::path& temp_file) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "INSERT OR REPLACE INTO background_tasks (task_id, temp_file, created_at) VALUES (?, ?, ?);");
    stmt.bind(1, static_cast<int64_t>(task_id))
        .bind(2, temp_file.string())
        .bind(3, TimeUtils::to_unix_millis(TimeUtils::now()));
    stmt.execute();
}

void TransferLedger::remove(uint64_t task_id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "DELETE FROM background_tasks WHERE task_id = ?;");
    stmt.bind(1, static_cast<int64_t>(task_id));
    stmt.execute();
}

std::vector<LedgerEntry> TransferLedger::list() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT task_id, temp_file, created_at FROM background_tasks ORDER BY task_id;");

    std::vector<LedgerEntry> entries;
    while (stmt.step()) {
        LedgerEntry entry;
        entry.task_id = static_cast<uint64_t>(stmt.column_int64(0));
        entry.temp_file = stmt.column_text(1);
        entry.created_at = TimeUtils::from_unix_millis(stmt.column_int64(2));
        entries.push_back(std::move(entry));
    }
    return entries;
}

uint64_t TransferLedger::max_task_id() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT COALESCE(MAX(task_id), 0) FROM background_tasks;");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<uint64_t>(stmt.column_int64(0));
}

}
