#include "postrelay/delivery/retry_discipline_uploader.hpp"
#include "postrelay/delivery/timeline.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include "postrelay/crypto/random.hpp"
#include <algorithm>
#include <cmath>

namespace postrelay::delivery {

RetryDisciplineUploader::RetryDisciplineUploader(network::HttpClient& client, Sleeper sleeper, SteadyClock clock)
    : client_(client)
    , sleeper_(sleeper ? std::move(sleeper) : default_sleeper())
    , clock_(clock ? std::move(clock) : default_clock())
    , consecutive_capped_failures_(0) {
}

StrategyProfile RetryDisciplineUploader::profile() {
    return StrategyProfile{"Retry Discipline", "level2", false, true};
}

std::vector<network::ContentItem> RetryDisciplineUploader::fetch_timeline() {
    return load_timeline(client_);
}

DeliveryResult RetryDisciplineUploader::submit(const SubmitRequest& request, const ProgressCallback& progress) {
    switch (request.strategy) {
        case RetryStrategy::EXPONENTIAL_BACKOFF:
            return run_exponential_backoff(request, progress);
        case RetryStrategy::CAPPED_RETRIES:
            return run_capped_circuit(request, progress);
        case RetryStrategy::MANUAL_RETRY:
            return run_manual(request, progress);
        case RetryStrategy::IDEMPOTENCY_KEY:
            return run_idempotent(request, progress);
    }
    return DeliveryResult(DeliveryError::VALIDATION, "Unknown retry strategy.");
}

bool RetryDisciplineUploader::circuit_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return circuit_open_until_ && *circuit_open_until_ > clock_();
}

RetryDisciplineUploader::AttemptOutcome RetryDisciplineUploader::attempt(
    const std::string& text, const std::optional<std::string>& idempotency_key) {
    network::HeaderMap headers;
    if (idempotency_key) {
        headers["Idempotency-Key"] = *idempotency_key;
    }

    AttemptOutcome outcome;
    try {
        auto response = client_.post_json_raw("/level2/tweets", network::wire::encode_text_body(text), headers);
        if (response.is_success()) {
            return outcome;
        }

        if (response.status >= 500 || response.status == 429) {
            outcome.kind = AttemptKind::TRANSIENT;
            outcome.message = response.body.empty() ? "Server unavailable." : response.body;
            outcome.retry_after = parse_retry_after(response.headers.get("Retry-After"));
        } else {
            outcome.kind = AttemptKind::TERMINAL;
            outcome.message = response.body.empty()
                ? "Request failed with HTTP " + std::to_string(response.status) + "."
                : response.body;
        }
    } catch (const network::TransportError& e) {
        outcome.kind = AttemptKind::TRANSIENT;
        outcome.message = e.what();
    }
    return outcome;
}

DeliveryResult RetryDisciplineUploader::run_exponential_backoff(const SubmitRequest& request,
                                                                const ProgressCallback& progress) {
    for (int attempt_number = 1; attempt_number <= BACKOFF_MAX_ATTEMPTS; ++attempt_number) {
        report(progress, static_cast<double>(attempt_number - 1) / BACKOFF_MAX_ATTEMPTS);

        auto outcome = attempt(request.text, std::nullopt);
        if (outcome.kind == AttemptKind::SUCCESS) {
            report(progress, 1.0);
            LOG_INFO("Automatic backoff succeeded on attempt {}", attempt_number);
            return DeliveryResult();
        }
        if (outcome.kind == AttemptKind::TERMINAL) {
            return DeliveryResult(DeliveryError::TERMINAL, outcome.message);
        }

        LOG_WARN("Transient failure on attempt {}: {}", attempt_number, outcome.message);
        if (attempt_number == BACKOFF_MAX_ATTEMPTS) {
            break;
        }

        auto delay = outcome.retry_after.value_or(std::min(
            MAX_BACKOFF_DELAY, std::chrono::milliseconds(1000LL << (attempt_number - 1))));
        sleep_for(delay);
    }

    return DeliveryResult(DeliveryError::TERMINAL,
                          "Backoff retries exhausted after " + std::to_string(BACKOFF_MAX_ATTEMPTS) + " attempts.");
}

DeliveryResult RetryDisciplineUploader::run_capped_circuit(const SubmitRequest& request,
                                                           const ProgressCallback& progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        if (circuit_open_until_ && *circuit_open_until_ > now) {
            auto remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*circuit_open_until_ - now).count();
            auto remaining = (remaining_ms + 999) / 1000;
            return DeliveryResult(DeliveryError::TERMINAL,
                                  "Circuit breaker is open. Try again in " + std::to_string(remaining) + "s.");
        }
    }

    for (int attempt_number = 1; attempt_number <= CAPPED_MAX_ATTEMPTS; ++attempt_number) {
        report(progress, static_cast<double>(attempt_number - 1) / CAPPED_MAX_ATTEMPTS);

        auto outcome = attempt(request.text, std::nullopt);
        if (outcome.kind == AttemptKind::SUCCESS) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                consecutive_capped_failures_ = 0;
            }
            report(progress, 1.0);
            LOG_INFO("Capped retry strategy succeeded on attempt {}", attempt_number);
            return DeliveryResult();
        }
        if (outcome.kind == AttemptKind::TERMINAL) {
            return DeliveryResult(DeliveryError::TERMINAL, outcome.message);
        }

        LOG_WARN("Capped attempt {} failed: {}", attempt_number, outcome.message);
        if (attempt_number < CAPPED_MAX_ATTEMPTS) {
            sleep_for(CAPPED_RETRY_DELAY);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_capped_failures_++;
    if (consecutive_capped_failures_ >= CIRCUIT_FAILURE_THRESHOLD) {
        circuit_open_until_ = clock_() + CIRCUIT_OPEN_DURATION;
        consecutive_capped_failures_ = 0;
        LOG_WARN("Circuit breaker opened for {}s", CIRCUIT_OPEN_DURATION.count());
        return DeliveryResult(DeliveryError::TERMINAL, "Circuit opened for 15 seconds after repeated failures.");
    }
    return DeliveryResult(DeliveryError::TERMINAL, "Capped retries exhausted.");
}

DeliveryResult RetryDisciplineUploader::run_manual(const SubmitRequest& request, const ProgressCallback& progress) {
    report(progress, 0.1);

    auto outcome = attempt(request.text, std::nullopt);
    if (outcome.kind != AttemptKind::SUCCESS) {
        LOG_WARN("Manual strategy attempt failed: {}", outcome.message);
        return DeliveryResult::manual_retry("Upload failed. Retry manually?", request);
    }

    report(progress, 1.0);
    LOG_INFO("Manual strategy succeeded on first try");
    return DeliveryResult();
}

DeliveryResult RetryDisciplineUploader::run_idempotent(const SubmitRequest& request, const ProgressCallback& progress) {
    auto key = crypto::SecureRandom::generate_uuid();
    LOG_DEBUG("Idempotency key for submission: {}", key);

    for (int attempt_number = 1; attempt_number <= IDEMPOTENT_MAX_ATTEMPTS; ++attempt_number) {
        report(progress, static_cast<double>(attempt_number - 1) / IDEMPOTENT_MAX_ATTEMPTS);

        auto outcome = attempt(request.text, key);
        if (outcome.kind == AttemptKind::SUCCESS) {
            report(progress, 1.0);
            LOG_INFO("Idempotent retry succeeded on attempt {}", attempt_number);
            return DeliveryResult();
        }
        if (outcome.kind == AttemptKind::TERMINAL) {
            return DeliveryResult(DeliveryError::TERMINAL, outcome.message);
        }

        LOG_WARN("Idempotent attempt {} failed: {}", attempt_number, outcome.message);
        if (attempt_number < IDEMPOTENT_MAX_ATTEMPTS) {
            sleep_for(std::chrono::seconds(attempt_number));
        }
    }

    return DeliveryResult(DeliveryError::TERMINAL,
                          "Idempotent retries exhausted after " + std::to_string(IDEMPOTENT_MAX_ATTEMPTS) + " attempts.");
}

void RetryDisciplineUploader::sleep_for(std::chrono::milliseconds delay) {
    sleeper_(std::max(MIN_SLEEP, delay));
}

void RetryDisciplineUploader::report(const ProgressCallback& progress, double value) {
    if (progress) {
        progress(value);
    }
}

std::optional<std::chrono::milliseconds> RetryDisciplineUploader::parse_retry_after(
    const std::optional<std::string>& header) {
    if (!header) {
        return std::nullopt;
    }

    auto text = core::utils::StringUtils::trim(*header);
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double seconds = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(seconds) || seconds < 0) {
            return std::nullopt;
        }
        seconds = std::min(seconds, static_cast<double>(MAX_RETRY_AFTER.count()));
        return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

}
