/**
 * @file upload_session.h
 * @brief State machine driving one chunked upload
 */

#ifndef KCENON_MEDIA_UPLOAD_SESSION_UPLOAD_SESSION_H
#define KCENON_MEDIA_UPLOAD_SESSION_UPLOAD_SESSION_H

#include "kcenon/media_upload/core/cancellation_token.h"
#include "kcenon/media_upload/core/chunk_types.h"
#include "kcenon/media_upload/core/media_asset.h"
#include "kcenon/media_upload/core/timer_service.h"
#include "kcenon/media_upload/core/types.h"
#include "kcenon/media_upload/session/session_types.h"
#include "kcenon/media_upload/transport/transport_client.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::media_upload {

/**
 * @brief Check if a session phase transition is valid
 *
 * idle -> initialized -> appending -> finalizing -> [processing ->]
 * succeeded; any non-terminal phase may fail.
 */
[[nodiscard]] auto is_valid_transition(upload_phase from, upload_phase to) noexcept -> bool;

/**
 * @brief Uploads one media asset through INIT, APPEND*, FINALIZE and STATUS
 *
 * A session is single-use: run() may be called once and the session is
 * never resumed after a failure. The transport may be shared with other
 * sessions; everything else is owned by the session.
 *
 * @code
 * auto transport = std::make_shared<network_transport_client>(headers);
 * upload_session session(asset, transport);
 * auto outcome = session.run();
 * if (outcome) {
 *     std::cout << outcome.value().media_id << "\n";
 * }
 * @endcode
 */
class upload_session {
public:
    upload_session(media_asset asset,
                   std::shared_ptr<transport_client> transport,
                   session_config config = {},
                   std::shared_ptr<progress_observer> observer = nullptr,
                   std::shared_ptr<timer_service> timer = nullptr);

    ~upload_session();

    upload_session(const upload_session&) = delete;
    auto operator=(const upload_session&) -> upload_session& = delete;
    upload_session(upload_session&&) = delete;
    auto operator=(upload_session&&) -> upload_session& = delete;

    /**
     * @brief Run the upload to a terminal phase
     *
     * Blocks until the upload succeeds or fails. Chunk workers are joined
     * before returning.
     */
    [[nodiscard]] auto run() -> result<upload_success>;

    /**
     * @brief Run the upload, aborting when token is cancelled
     */
    [[nodiscard]] auto run(const cancellation_token& token) -> result<upload_success>;

    /**
     * @brief Request cancellation from another thread
     */
    void cancel();

    // ========================================================================
    // Observation
    // ========================================================================

    [[nodiscard]] auto phase() const -> upload_phase;

    /**
     * @brief Server media id; empty before INIT succeeds
     */
    [[nodiscard]] auto media_id() const -> std::string;

    /**
     * @brief Snapshot of the chunk plan with per-chunk status
     */
    [[nodiscard]] auto chunks() const -> chunk_plan;

    [[nodiscard]] auto bytes_acked() const -> uint64_t;

    [[nodiscard]] auto created_at() const -> std::optional<timer_service::time_point>;

    [[nodiscard]] auto expires_at() const -> std::optional<timer_service::time_point>;

    [[nodiscard]] auto last_error() const -> std::optional<error>;

    [[nodiscard]] auto processing() const -> std::optional<processing_status>;

    [[nodiscard]] auto asset() const -> const media_asset&;

    [[nodiscard]] auto config() const -> const session_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_SESSION_UPLOAD_SESSION_H
