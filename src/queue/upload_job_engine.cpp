#include "postrelay/queue/upload_job_engine.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include "postrelay/crypto/random.hpp"
#include "postrelay/network/wire.hpp"
#include <boost/asio/post.hpp>

namespace postrelay::queue {

using core::utils::TimeUtils;
using storage::UploadJob;
using storage::UploadJobState;

UploadJobEngine::UploadJobEngine(storage::JobStore& store,
                                 network::HttpClient& client,
                                 boost::asio::any_io_executor executor,
                                 delivery::Sleeper sleeper,
                                 std::chrono::milliseconds failure_pause)
    : store_(store)
    , client_(client)
    , executor_(std::move(executor))
    , sleeper_(sleeper ? std::move(sleeper) : delivery::default_sleeper())
    , failure_pause_(failure_pause)
    , processing_(false)
    , stopping_(false) {
}

std::optional<std::string> UploadJobEngine::enqueue(const std::string& text) {
    UploadJob job;
    job.id = crypto::SecureRandom::generate_uuid();
    job.text = text;
    job.created_at = TimeUtils::now();
    job.updated_at = job.created_at;
    job.state = UploadJobState::PENDING;

    std::optional<std::string> id;
    try {
        store_.insert(job);
        id = job.id;
        LOG_INFO("Enqueued durable job {}", job.id);
    } catch (const storage::StorageError& e) {
        LOG_ERROR("Failed to persist durable job: {}", e.what());
    }

    schedule_drain();
    return id;
}

size_t UploadJobEngine::recover_outstanding_jobs() {
    size_t recovered = 0;
    try {
        recovered = store_.transition_all(UploadJobState::UPLOADING, UploadJobState::PENDING, TimeUtils::now());
        LOG_INFO("Recovered {} stuck durable job(s)", recovered);
    } catch (const storage::StorageError& e) {
        LOG_ERROR("Failed to recover durable jobs: {}", e.what());
    }

    schedule_drain();
    return recovered;
}

JobOutcome UploadJobEngine::process_next_job() {
    std::optional<UploadJob> next;
    try {
        next = store_.claim_next(TimeUtils::now());
    } catch (const storage::StorageError& e) {
        LOG_ERROR("Durable queue storage failure: {}", e.what());
        return JobOutcome::IDLE;
    }
    if (!next) {
        return JobOutcome::IDLE;
    }

    std::string failure;
    try {
        client_.post_json("/level4/tweets", network::wire::encode_text_body(next->text));
    } catch (const network::HttpStatusError& e) {
        auto detail = network::wire::error_message_from_body(e.body());
        failure = detail.empty()
            ? e.what()
            : "HTTP " + std::to_string(e.status()) + ": " + detail;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    try {
        if (failure.empty()) {
            store_.remove(next->id);
            LOG_INFO("Durable job completed and removed: {}", next->id);
            return JobOutcome::DELIVERED;
        }

        store_.update(next->id, [&failure](UploadJob& job) {
            job.state = UploadJobState::FAILED;
            job.last_error = failure;
            job.updated_at = TimeUtils::now();
        });
    } catch (const storage::StorageError& e) {
        LOG_ERROR("Failed to record outcome of durable job {}, it stays uploading until the next recovery: {}",
                  next->id, e.what());
        return failure.empty() ? JobOutcome::DELIVERED : JobOutcome::FAILED;
    }

    LOG_WARN("Durable job failed {}: {}", next->id, failure);
    return JobOutcome::FAILED;
}

size_t UploadJobEngine::outstanding_count() {
    try {
        return store_.count_outstanding();
    } catch (const storage::StorageError& e) {
        LOG_ERROR("Failed to count durable jobs: {}", e.what());
        return 0;
    }
}

std::string UploadJobEngine::status_summary() {
    return "Durable queue outstanding jobs: " + std::to_string(outstanding_count());
}

bool UploadJobEngine::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return !processing_.load(); });
}

void UploadJobEngine::stop() {
    stopping_.store(true);
}

void UploadJobEngine::schedule_drain() {
    if (stopping_.load()) {
        return;
    }

    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        return;
    }

    boost::asio::post(executor_, [this]() { drain(); });
}

void UploadJobEngine::drain() {
    while (!stopping_.load()) {
        auto outcome = process_next_job();
        if (outcome == JobOutcome::IDLE) {
            break;
        }
        if (outcome == JobOutcome::FAILED && !stopping_.load()) {
            sleeper_(failure_pause_);
        }
    }

    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        processing_.store(false);
    }
    idle_cv_.notify_all();

    // A job enqueued after the last pass but before the flag cleared would otherwise wait.
    if (!stopping_.load() && has_eligible_job()) {
        schedule_drain();
    }
}

bool UploadJobEngine::has_eligible_job() {
    try {
        return store_.next_eligible().has_value();
    } catch (const storage::StorageError& e) {
        LOG_ERROR("Failed to inspect durable queue: {}", e.what());
        return false;
    }
}

}
