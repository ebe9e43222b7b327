#pragma once

#include "../delivery/delivery_types.hpp"
#include "../network/http_client.hpp"
#include "../storage/job_store.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace postrelay::queue {

enum class JobOutcome {
    IDLE,       // nothing outstanding
    DELIVERED,
    FAILED
};

// Persistent job runner: every post is written to the job store first, then
// delivered by a drain loop running on the engine's executor.
//
// Lifecycle: pending -> uploading -> (deleted) | failed; failed -> uploading on
// the next pass. At most one job is uploading at a time.
class UploadJobEngine {
public:
    static constexpr std::chrono::milliseconds DEFAULT_FAILURE_PAUSE{1500};

    UploadJobEngine(storage::JobStore& store,
                    network::HttpClient& client,
                    boost::asio::any_io_executor executor,
                    delivery::Sleeper sleeper = delivery::default_sleeper(),
                    std::chrono::milliseconds failure_pause = DEFAULT_FAILURE_PAUSE);

    UploadJobEngine(const UploadJobEngine&) = delete;
    UploadJobEngine& operator=(const UploadJobEngine&) = delete;

    // Returns the new job id, or nothing if the job could not be persisted.
    std::optional<std::string> enqueue(const std::string& text);

    // Resets jobs left uploading by a previous run to pending and schedules a drain.
    size_t recover_outstanding_jobs();

    JobOutcome process_next_job();

    size_t outstanding_count();
    std::string status_summary();

    bool is_processing() const { return processing_.load(); }

    // Blocks until no drain is running. Returns false if the timeout expired first.
    bool wait_until_idle(std::chrono::milliseconds timeout);

    // Ends the drain loop at the next iteration boundary; unfinished jobs stay persisted.
    void stop();

private:
    storage::JobStore& store_;
    network::HttpClient& client_;
    boost::asio::any_io_executor executor_;
    delivery::Sleeper sleeper_;
    std::chrono::milliseconds failure_pause_;

    std::atomic<bool> processing_;
    std::atomic<bool> stopping_;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    void schedule_drain();
    void drain();
    bool has_eligible_job();
};

}
