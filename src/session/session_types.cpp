/**
 * @file session_types.cpp
 * @brief Validation of session configuration
 */

#include "kcenon/media_upload/session/session_types.h"

namespace kcenon::media_upload {

auto poller_config::validate() const -> result<void> {
    if (default_check_after.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "default check interval must not be negative"});
    }
    if (min_check_after.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "minimum check interval must not be negative"});
    }
    if (max_wait.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "processing wait ceiling must be positive"});
    }
    return {};
}

auto session_config::validate() const -> result<void> {
    if (upload_url.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "upload endpoint is not set"});
    }
    if (concurrency == 0 || concurrency > max_concurrency) {
        return unexpected(error{error_code::invalid_configuration,
                                "concurrency must be between 1 and " +
                                    std::to_string(max_concurrency)});
    }
    if (chunk_spacing.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "chunk spacing must not be negative"});
    }
    if (call_timeout.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "call timeout must be positive"});
    }
    if (chunk_timeout.count() < 0 || session_timeout.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "timeouts must not be negative"});
    }
    if (default_expiry.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "default session expiry must be positive"});
    }
    if (auto r = retry.validate(); !r) {
        return r;
    }
    return poller.validate();
}

}  // namespace kcenon::media_upload
