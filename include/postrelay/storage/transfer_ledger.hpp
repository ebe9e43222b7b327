#pragma once

#include "database.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace postrelay::storage {

struct LedgerEntry {
    uint64_t task_id = 0;
    std::filesystem::path temp_file;
    std::chrono::system_clock::time_point created_at;
};

// Outstanding background chunk tasks, so a relaunched process can find the
// temp files that belong to transfers it no longer has in memory.
class TransferLedger {
public:
    explicit TransferLedger(Database& db);

    void initialize();

    void record(uint64_t task_id, const std::filesystem::path& temp_file);
    void remove(uint64_t task_id);
    std::vector<LedgerEntry> list();

    // Zero when the ledger is empty.
    uint64_t max_task_id();

private:
    Database& db_;
};

}
