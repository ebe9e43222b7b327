#pragma once

#include "database.hpp"
#include "upload_job.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace postrelay::storage {

// One row per durable delivery job in the upload_jobs table.
class JobStore {
public:
    explicit JobStore(Database& db);

    void initialize();

    void insert(const UploadJob& job);
    std::optional<UploadJob> find(const std::string& id);

    // Applies mutate to the stored row inside one transaction.
    // Returns false when the job no longer exists.
    bool update(const std::string& id, const std::function<void(UploadJob&)>& mutate);
    bool remove(const std::string& id);

    // Oldest pending or failed job by creation time.
    std::optional<UploadJob> next_eligible();
    // Picks next_eligible() and marks it uploading in the same transaction,
    // so a claimed job can not be taken or removed in between.
    std::optional<UploadJob> claim_next(std::chrono::system_clock::time_point now);

    std::vector<UploadJob> list_all();
    std::vector<UploadJob> list_by_state(UploadJobState state);
    std::vector<UploadJob> list_outstanding();
    size_t count_outstanding();

    // Moves every job in `from` to `to`, refreshing updated_at. Returns the number moved.
    size_t transition_all(UploadJobState from, UploadJobState to,
                          std::chrono::system_clock::time_point now);

private:
    Database& db_;

    void write(const UploadJob& job);
    std::vector<UploadJob> query(const std::string& sql, const std::vector<std::string>& params);
};

}
