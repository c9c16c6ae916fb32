/**
 * @file timer_service.h
 * @brief Clock and cancellable waits used by upload sessions
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_TIMER_SERVICE_H
#define KCENON_MEDIA_UPLOAD_CORE_TIMER_SERVICE_H

#include "kcenon/media_upload/core/cancellation_token.h"

#include <chrono>
#include <memory>

namespace kcenon::media_upload {

/**
 * @brief Source of time for spacing, backoff, polling and deadlines
 *
 * Sessions never call std::this_thread::sleep_for directly; every wait goes
 * through a timer_service so that it can be cancelled and, in tests,
 * replaced by a virtual clock.
 */
class timer_service {
public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;

    virtual ~timer_service() = default;

    [[nodiscard]] virtual auto now() const -> time_point = 0;

    /**
     * @brief Wait for duration unless token is cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    virtual auto wait_for(std::chrono::milliseconds duration,
                          const cancellation_token& token) -> bool = 0;
};

/**
 * @brief timer_service backed by std::chrono::steady_clock
 */
class steady_timer_service : public timer_service {
public:
    [[nodiscard]] auto now() const -> time_point override;

    auto wait_for(std::chrono::milliseconds duration,
                  const cancellation_token& token) -> bool override;

    /**
     * @brief Process-wide instance
     */
    [[nodiscard]] static auto shared() -> std::shared_ptr<steady_timer_service>;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_TIMER_SERVICE_H
