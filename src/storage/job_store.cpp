#include "postrelay/storage/job_store.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"

namespace postrelay::storage {

using postrelay::core::utils::TimeUtils;

namespace {

const char* SELECT_COLUMNS =
    "SELECT id, text, created_at, updated_at, attempts, last_error, state FROM upload_jobs";

UploadJob read_row(const Statement& stmt) {
    UploadJob job;
    job.id = stmt.column_text(0);
    job.text = stmt.column_text(1);
    job.created_at = TimeUtils::from_unix_millis(stmt.column_int64(2));
    job.updated_at = TimeUtils::from_unix_millis(stmt.column_int64(3));
    job.attempts = static_cast<int>(stmt.column_int64(4));
    job.last_error = stmt.column_optional_text(5);
    job.state = upload_job_state_from_string(stmt.column_text(6));
    return job;
}

}

const char* to_string(UploadJobState state) {
    switch (state) {
        case UploadJobState::PENDING: return "pending";
        case UploadJobState::UPLOADING: return "uploading";
        case UploadJobState::SUCCEEDED: return "succeeded";
        case UploadJobState::FAILED: return "failed";
    }
    return "pending";
}

UploadJobState upload_job_state_from_string(const std::string& tag) {
    if (tag == "uploading") return UploadJobState::UPLOADING;
    if (tag == "succeeded") return UploadJobState::SUCCEEDED;
    if (tag == "failed") return UploadJobState::FAILED;
    return UploadJobState::PENDING;
}

JobStore::JobStore(Database& db)
    : db_(db) {
}

void JobStore::initialize() {
    db_.exec(R"(
        CREATE TABLE IF NOT EXISTS upload_jobs (
            id TEXT PRIMARY KEY,
            text TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            attempts INTEGER NOT NULL DEFAULT 0,
            last_error TEXT,
            state TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_upload_jobs_state ON upload_jobs(state);
        CREATE INDEX IF NOT EXISTS idx_upload_jobs_created_at ON upload_jobs(created_at);
    )");
}

void JobStore::insert(const UploadJob& job) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, R"(
        INSERT INTO upload_jobs (id, text, created_at, updated_at, attempts, last_error, state)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )");
    stmt.bind(1, job.id)
        .bind(2, job.text)
        .bind(3, TimeUtils::to_unix_millis(job.created_at))
        .bind(4, TimeUtils::to_unix_millis(job.updated_at))
        .bind(5, static_cast<int64_t>(job.attempts))
        .bind(6, job.last_error)
        .bind(7, std::string(to_string(job.state)));
    stmt.execute();
}

std::optional<UploadJob> JobStore::find(const std::string& id) {
    auto jobs = query(std::string(SELECT_COLUMNS) + " WHERE id = ?;", {id});
    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs.front();
}

bool JobStore::update(const std::string& id, const std::function<void(UploadJob&)>& mutate) {
    Transaction tx(db_);
    auto job = find(id);
    if (!job) {
        return false;
    }

    mutate(*job);
    write(*job);
    tx.commit();
    return true;
}

bool JobStore::remove(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "DELETE FROM upload_jobs WHERE id = ?;");
    stmt.bind(1, id);
    stmt.execute();
    return db_.changes() > 0;
}

std::optional<UploadJob> JobStore::next_eligible() {
    auto jobs = query(std::string(SELECT_COLUMNS) +
                      " WHERE state IN (?, ?) ORDER BY created_at ASC, rowid ASC LIMIT 1;",
                      {to_string(UploadJobState::PENDING), to_string(UploadJobState::FAILED)});
    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs.front();
}

std::optional<UploadJob> JobStore::claim_next(std::chrono::system_clock::time_point now) {
    Transaction tx(db_);
    auto job = next_eligible();
    if (!job) {
        return std::nullopt;
    }

    job->state = UploadJobState::UPLOADING;
    job->attempts += 1;
    job->last_error.reset();
    job->updated_at = now;
    write(*job);
    tx.commit();
    return job;
}

std::vector<UploadJob> JobStore::list_all() {
    return query(std::string(SELECT_COLUMNS) + " ORDER BY created_at ASC, rowid ASC;", {});
}

std::vector<UploadJob> JobStore::list_by_state(UploadJobState state) {
    return query(std::string(SELECT_COLUMNS) + " WHERE state = ? ORDER BY created_at ASC, rowid ASC;",
                 {to_string(state)});
}

std::vector<UploadJob> JobStore::list_outstanding() {
    return query(std::string(SELECT_COLUMNS) +
                 " WHERE state <> ? ORDER BY created_at ASC, rowid ASC;",
                 {to_string(UploadJobState::SUCCEEDED)});
}

size_t JobStore::count_outstanding() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT COUNT(*) FROM upload_jobs WHERE state <> ?;");
    stmt.bind(1, std::string(to_string(UploadJobState::SUCCEEDED)));
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.column_int64(0));
}

size_t JobStore::transition_all(UploadJobState from, UploadJobState to,
                                std::chrono::system_clock::time_point now) {
    Transaction tx(db_);
    auto jobs = list_by_state(from);
    for (auto& job : jobs) {
        job.state = to;
        job.updated_at = now;
        write(job);
    }
    tx.commit();
    return jobs.size();
}

void JobStore::write(const UploadJob& job) {
    Statement stmt(db_, R"(
        UPDATE upload_jobs
        SET text = ?, updated_at = ?, attempts = ?, last_error = ?, state = ?
        WHERE id = ?;
    )");
    stmt.bind(1, job.text)
        .bind(2, TimeUtils::to_unix_millis(job.updated_at))
        .bind(3, static_cast<int64_t>(job.attempts))
        .bind(4, job.last_error)
        .bind(5, std::string(to_string(job.state)))
        .bind(6, job.id);
    stmt.execute();
}

std::vector<UploadJob> JobStore::query(const std::string& sql, const std::vector<std::string>& params) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, sql);
    for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }

    std::vector<UploadJob> jobs;
    while (stmt.step()) {
        jobs.push_back(read_row(stmt));
    }
    return jobs;
}

}
