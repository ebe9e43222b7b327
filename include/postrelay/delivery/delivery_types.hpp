#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace postrelay::delivery {

enum class DeliveryError {
    SUCCESS = 0,
    VALIDATION,
    TRANSIENT,
    TERMINAL,
    MANUAL_RETRY_REQUESTED
};

enum class RetryStrategy {
    EXPONENTIAL_BACKOFF,
    CAPPED_RETRIES,
    MANUAL_RETRY,
    IDEMPOTENCY_KEY
};

const char* to_string(RetryStrategy strategy);
// Accepts "backoff", "capped", "manual", "idempotent".
std::optional<RetryStrategy> retry_strategy_from_string(const std::string& name);

struct SubmitRequest {
    std::string text;
    std::optional<std::filesystem::path> video_path;
    RetryStrategy strategy = RetryStrategy::EXPONENTIAL_BACKOFF;
};

struct DeliveryResult {
    DeliveryError error;
    std::string message;
    // Set only for MANUAL_RETRY_REQUESTED: resubmit verbatim.
    std::optional<SubmitRequest> retry_payload;

    DeliveryResult(DeliveryError err = DeliveryError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == DeliveryError::SUCCESS; }
    operator bool() const { return success(); }

    static DeliveryResult manual_retry(std::string msg, SubmitRequest payload) {
        DeliveryResult result(DeliveryError::MANUAL_RETRY_REQUESTED, std::move(msg));
        result.retry_payload = std::move(payload);
        return result;
    }
};

struct StrategyProfile {
    std::string title;
    std::string level_tag;
    bool supports_video = false;
    bool shows_retry_selector = false;
};

// Fraction in [0, 1].
using ProgressCallback = std::function<void(double)>;

using Sleeper = std::function<void(std::chrono::milliseconds)>;
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

Sleeper default_sleeper();
SteadyClock default_clock();

}
