#pragma once

#include "delivery_types.hpp"
#include "../network/http_client.hpp"
#include "../network/wire.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace postrelay::delivery {

// Foreground retries against POST /level2/tweets under one of four disciplines.
//
// The circuit breaker used by CAPPED_RETRIES belongs to this instance and is
// not persisted; a new process starts with it closed.
class RetryDisciplineUploader {
public:
    static constexpr int BACKOFF_MAX_ATTEMPTS = 5;
    static constexpr int CAPPED_MAX_ATTEMPTS = 3;
    static constexpr int IDEMPOTENT_MAX_ATTEMPTS = 4;
    static constexpr int CIRCUIT_FAILURE_THRESHOLD = 2;

    static constexpr std::chrono::milliseconds MIN_SLEEP{50};
    static constexpr std::chrono::milliseconds MAX_BACKOFF_DELAY{8000};
    static constexpr std::chrono::milliseconds CAPPED_RETRY_DELAY{750};
    static constexpr std::chrono::seconds CIRCUIT_OPEN_DURATION{15};
    static constexpr std::chrono::seconds MAX_RETRY_AFTER{3600};

    RetryDisciplineUploader(network::HttpClient& client,
                            Sleeper sleeper = default_sleeper(),
                            SteadyClock clock = default_clock());

    static StrategyProfile profile();

    std::vector<network::ContentItem> fetch_timeline();
    DeliveryResult submit(const SubmitRequest& request, const ProgressCallback& progress = nullptr);

    bool circuit_open() const;

private:
    enum class AttemptKind { SUCCESS, TRANSIENT, TERMINAL };

    struct AttemptOutcome {
        AttemptKind kind = AttemptKind::SUCCESS;
        std::string message;
        std::optional<std::chrono::milliseconds> retry_after;
    };

    network::HttpClient& client_;
    Sleeper sleeper_;
    SteadyClock clock_;

    mutable std::mutex mutex_;
    int consecutive_capped_failures_;
    std::optional<std::chrono::steady_clock::time_point> circuit_open_until_;

    AttemptOutcome attempt(const std::string& text, const std::optional<std::string>& idempotency_key);

    DeliveryResult run_exponential_backoff(const SubmitRequest& request, const ProgressCallback& progress);
    DeliveryResult run_capped_circuit(const SubmitRequest& request, const ProgressCallback& progress);
    DeliveryResult run_manual(const SubmitRequest& request, const ProgressCallback& progress);
    DeliveryResult run_idempotent(const SubmitRequest& request, const ProgressCallback& progress);

    void sleep_for(std::chrono::milliseconds delay);
    static void report(const ProgressCallback& progress, double value);
    static std::optional<std::chrono::milliseconds> parse_retry_after(const std::optional<std::string>& header);
};

}
