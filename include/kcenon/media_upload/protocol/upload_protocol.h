/**
 * @file upload_protocol.h
 * @brief Wire format of the chunked upload endpoint
 *
 * Builds the INIT / APPEND / FINALIZE / STATUS requests and the metadata
 * document, parses their responses and maps HTTP statuses onto
 * error codes. Everything here is stateless.
 */

#ifndef KCENON_MEDIA_UPLOAD_PROTOCOL_UPLOAD_PROTOCOL_H
#define KCENON_MEDIA_UPLOAD_PROTOCOL_UPLOAD_PROTOCOL_H

#include "kcenon/media_upload/core/media_asset.h"
#include "kcenon/media_upload/core/types.h"
#include "kcenon/media_upload/transport/transport_client.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::media_upload {

/**
 * @brief Server-side processing state of a finalized upload
 */
enum class processing_state {
    not_required,
    pending,
    in_progress,
    succeeded,
    failed
};

[[nodiscard]] constexpr auto to_string(processing_state state) noexcept -> const char* {
    switch (state) {
        case processing_state::not_required: return "not_required";
        case processing_state::pending: return "pending";
        case processing_state::in_progress: return "in_progress";
        case processing_state::succeeded: return "succeeded";
        case processing_state::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_state(processing_state state) noexcept -> bool {
    return state == processing_state::not_required ||
           state == processing_state::succeeded ||
           state == processing_state::failed;
}

/**
 * @brief Parse the wire token of a processing state
 */
[[nodiscard]] auto parse_processing_state(std::string_view token)
    -> std::optional<processing_state>;

/**
 * @brief Latest known processing status of an upload
 */
struct processing_status {
    processing_state state = processing_state::not_required;
    std::optional<double> progress_percent;
    std::optional<uint32_t> check_after_secs;
    std::optional<std::string> error_detail;
};

/**
 * @brief Pixel size reported for image uploads
 */
struct media_dimensions {
    uint32_t width = 0;
    uint32_t height = 0;

    auto operator==(const media_dimensions&) const -> bool = default;
};

struct init_response {
    std::string media_id;
    std::optional<std::chrono::seconds> expires_after;
};

struct finalize_response {
    std::string media_id;
    std::optional<std::string> media_key;
    std::optional<uint64_t> size;
    std::optional<media_dimensions> dimensions;
    std::optional<processing_status> processing;
};

struct status_response {
    /// Absent when the server no longer tracks processing
    std::optional<processing_status> processing;
};

/**
 * @brief Base64 (RFC 4648, padded) of a byte range
 */
[[nodiscard]] auto base64_encode(std::span<const std::byte> data) -> std::string;

/**
 * @brief Request builders and response parsers of the upload protocol
 */
class upload_protocol {
public:
    // ========================================================================
    // Requests
    // ========================================================================

    [[nodiscard]] static auto make_init_fields(const media_asset& asset) -> form_fields;

    [[nodiscard]] static auto make_append_fields(const std::string& media_id,
                                                 uint32_t segment_index,
                                                 std::span<const std::byte> chunk)
        -> form_fields;

    [[nodiscard]] static auto make_finalize_fields(const std::string& media_id)
        -> form_fields;

    [[nodiscard]] static auto make_status_query(const std::string& media_id)
        -> query_params;

    /**
     * @brief JSON body attaching accessibility text to an upload
     */
    [[nodiscard]] static auto make_metadata_body(const std::string& media_id,
                                                 const std::string& alt_text)
        -> std::string;

    // ========================================================================
    // Responses
    // ========================================================================

    /**
     * @brief Error code for an HTTP status (success for 2xx)
     *
     * 401/403 -> auth_required, 413 -> payload_too_large,
     * 408/429/5xx -> transient_transport, anything else -> unknown_server.
     */
    [[nodiscard]] static auto classify_status(int status_code) noexcept -> error_code;

    /**
     * @brief Turn a non-2xx response into an error tagged with phase
     * @param operation Command name used in the message ("INIT", ...)
     */
    [[nodiscard]] static auto check_response(const transport_response& response,
                                             upload_phase phase,
                                             std::string_view operation)
        -> result<void>;

    [[nodiscard]] static auto parse_init(const transport_response& response)
        -> result<init_response>;

    [[nodiscard]] static auto parse_finalize(const transport_response& response)
        -> result<finalize_response>;

    [[nodiscard]] static auto parse_status(const transport_response& response)
        -> result<status_response>;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_PROTOCOL_UPLOAD_PROTOCOL_H
