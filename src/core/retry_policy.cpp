/**
 * @file retry_policy.cpp
 * @brief Implementation of retry_policy
 */

#include "kcenon/media_upload/core/retry_policy.h"

#include <algorithm>
#include <random>

namespace kcenon::media_upload {

auto retry_policy::validate() const -> result<void> {
    if (initial_delay.count() < 0 || max_delay.count() < 0 || max_jitter.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry delays must not be negative"});
    }
    if (max_delay < initial_delay) {
        return unexpected(error{error_code::invalid_configuration,
                                "max retry delay is shorter than the initial delay"});
    }
    if (backoff_multiplier < 1.0) {
        return unexpected(error{error_code::invalid_configuration,
                                "backoff multiplier must be at least 1.0"});
    }
    return {};
}

auto retry_policy::backoff_delay(std::size_t attempt) const -> std::chrono::milliseconds {
    auto delay = static_cast<double>(initial_delay.count());
    auto cap = static_cast<double>(max_delay.count());

    for (std::size_t i = 0; i < attempt && delay < cap; ++i) {
        delay *= backoff_multiplier;
    }

    delay = std::min(delay, cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto retry_policy::should_retry(std::size_t attempt, error_code code) const
    -> retry_decision {
    if (!is_retryable(code) || attempt >= max_attempts) {
        return {};
    }

    auto delay = backoff_delay(attempt);

    if (max_jitter.count() > 0) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<int64_t> dis(0, max_jitter.count());
        delay += std::chrono::milliseconds(dis(gen));
    }

    return retry_decision{true, delay};
}

}  // namespace kcenon::media_upload
