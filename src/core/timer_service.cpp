/**
 * @file timer_service.cpp
 * @brief Implementation of steady_timer_service
 */

#include "kcenon/media_upload/core/timer_service.h"

namespace kcenon::media_upload {

auto steady_timer_service::now() const -> time_point {
    return clock::now();
}

auto steady_timer_service::wait_for(std::chrono::milliseconds duration,
                                    const cancellation_token& token) -> bool {
    if (token.is_cancelled()) {
        return false;
    }
    if (duration.count() <= 0) {
        return true;
    }
    return !token.wait_for(duration);
}

auto steady_timer_service::shared() -> std::shared_ptr<steady_timer_service> {
    static auto instance = std::make_shared<steady_timer_service>();
    return instance;
}

}  // namespace kcenon::media_upload
