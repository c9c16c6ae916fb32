/**
 * @file error_codes.h
 * @brief Error codes for media_upload (-900 to -999 range)
 * @version 0.1.0
 *
 * This file defines all error kinds reported by the chunked media upload
 * engine. Error codes follow the range -900 to -999 as per ecosystem
 * convention.
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_ERROR_CODES_H
#define KCENON_MEDIA_UPLOAD_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::media_upload {

/**
 * @brief Error codes for media upload operations (-900 to -999)
 *
 * Error code ranges:
 * - -900 to -909: Pre-flight Errors (never reach the network)
 * - -910 to -919: Authorization Errors
 * - -920 to -929: Transport Errors
 * - -930 to -939: Session Errors
 * - -940 to -949: Processing Errors
 * - -950 to -959: Server Errors
 * - -990 to -999: Configuration/Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Pre-flight Errors (-900 to -909)
    validation_failed = -900,

    // Authorization Errors (-910 to -919)
    auth_required = -910,

    // Transport Errors (-920 to -929)
    transient_transport = -920,
    payload_too_large = -921,

    // Session Errors (-930 to -939)
    session_expired = -930,
    cancelled = -931,
    chunk_timeout = -932,
    session_timeout = -933,

    // Processing Errors (-940 to -949)
    processing_failed = -940,
    processing_timeout = -941,

    // Server Errors (-950 to -959)
    unknown_server = -950,

    // Configuration/Internal Errors (-990 to -999)
    invalid_configuration = -990,
    invalid_state = -991,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::validation_failed:
            return "media validation failed";
        case error_code::auth_required:
            return "authentication required";
        case error_code::transient_transport:
            return "transient transport failure";
        case error_code::payload_too_large:
            return "payload too large";
        case error_code::session_expired:
            return "upload session expired";
        case error_code::cancelled:
            return "upload cancelled";
        case error_code::chunk_timeout:
            return "chunk transfer timeout";
        case error_code::session_timeout:
            return "upload session timeout";
        case error_code::processing_failed:
            return "media processing failed";
        case error_code::processing_timeout:
            return "media processing timeout";
        case error_code::unknown_server:
            return "unrecognized server response";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_state:
            return "invalid state for operation";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in pre-flight error range
 */
[[nodiscard]] constexpr auto is_preflight_error(int32_t code) noexcept -> bool {
    return code <= -900 && code >= -909;
}

/**
 * @brief Check if error code is in transport error range
 */
[[nodiscard]] constexpr auto is_transport_error(int32_t code) noexcept -> bool {
    return code <= -920 && code >= -929;
}

/**
 * @brief Check if error code is in session error range
 */
[[nodiscard]] constexpr auto is_session_error(int32_t code) noexcept -> bool {
    return code <= -930 && code >= -939;
}

/**
 * @brief Check if error code is in processing error range
 */
[[nodiscard]] constexpr auto is_processing_error(int32_t code) noexcept -> bool {
    return code <= -940 && code >= -949;
}

/**
 * @brief Check if error code is in configuration/internal error range
 */
[[nodiscard]] constexpr auto is_internal_error(int32_t code) noexcept -> bool {
    return code <= -990 && code >= -999;
}

/**
 * @brief Check if the error is retryable
 *
 * Only transient transport failures (network timeout, 5xx) are retried;
 * every other kind short-circuits to failure.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return code == error_code::transient_transport;
}

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_ERROR_CODES_H
