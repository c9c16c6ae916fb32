/**
 * @file retry_policy.h
 * @brief Bounded exponential backoff for transient failures
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_RETRY_POLICY_H
#define KCENON_MEDIA_UPLOAD_CORE_RETRY_POLICY_H

#include "kcenon/media_upload/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace kcenon::media_upload {

/**
 * @brief Verdict of the retry policy for one failed attempt
 */
struct retry_decision {
    bool retry = false;
    std::chrono::milliseconds delay{0};
};

/**
 * @brief Retry policy for upload requests
 *
 * delay = min(max_delay, initial_delay * backoff_multiplier^attempt) + jitter
 *
 * Only transient transport failures are retried. max_attempts counts the
 * retries issued after the first request.
 */
struct retry_policy {
    /// Maximum number of retries after the first request
    std::size_t max_attempts = 3;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{500};

    /// Upper bound of the exponential part of the delay
    std::chrono::milliseconds max_delay{8000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Upper bound of the uniform jitter added to each delay (0 disables)
    std::chrono::milliseconds max_jitter{250};

    /**
     * @brief Policy that never retries
     */
    [[nodiscard]] static auto no_retry() -> retry_policy {
        retry_policy policy;
        policy.max_attempts = 0;
        return policy;
    }

    /**
     * @brief Validate configuration
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Decide whether a failed attempt is retried
     * @param attempt 0-based index of the attempt that just failed
     * @param code Kind of the failure
     */
    [[nodiscard]] auto should_retry(std::size_t attempt, error_code code) const
        -> retry_decision;

    /**
     * @brief Backoff for an attempt without jitter
     */
    [[nodiscard]] auto backoff_delay(std::size_t attempt) const -> std::chrono::milliseconds;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_RETRY_POLICY_H
