#include "postrelay/delivery/delivery_types.hpp"
#include "postrelay/core/utils.hpp"
#include <thread>

namespace postrelay::delivery {

const char* to_string(RetryStrategy strategy) {
    switch (strategy) {
        case RetryStrategy::EXPONENTIAL_BACKOFF: return "backoff";
        case RetryStrategy::CAPPED_RETRIES: return "capped";
        case RetryStrategy::MANUAL_RETRY: return "manual";
        case RetryStrategy::IDEMPOTENCY_KEY: return "idempotent";
    }
    return "backoff";
}

std::optional<RetryStrategy> retry_strategy_from_string(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(name));
    if (lower == "backoff") return RetryStrategy::EXPONENTIAL_BACKOFF;
    if (lower == "capped") return RetryStrategy::CAPPED_RETRIES;
    if (lower == "manual") return RetryStrategy::MANUAL_RETRY;
    if (lower == "idempotent") return RetryStrategy::IDEMPOTENCY_KEY;
    return std::nullopt;
}

Sleeper default_sleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

SteadyClock default_clock() {
    return []() { return std::chrono::steady_clock::now(); };
}

}
