/**
 * @file processing_poller.h
 * @brief Drives the STATUS phase of an upload
 */

#ifndef KCENON_MEDIA_UPLOAD_SESSION_PROCESSING_POLLER_H
#define KCENON_MEDIA_UPLOAD_SESSION_PROCESSING_POLLER_H

#include "kcenon/media_upload/core/cancellation_token.h"
#include "kcenon/media_upload/core/timer_service.h"
#include "kcenon/media_upload/protocol/upload_protocol.h"
#include "kcenon/media_upload/session/request_executor.h"
#include "kcenon/media_upload/session/session_types.h"
#include "kcenon/media_upload/transport/transport_client.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::media_upload {

/**
 * @brief Polls STATUS until server-side processing reaches a final state
 *
 * Each round waits check_after_secs (the server's hint, or the configured
 * default), issues one STATUS request and reports the new status. Polling
 * stops on succeeded or failed, when the next wait would cross the
 * processing ceiling (processing_timeout) or the session deadline
 * (session_timeout), or on cancellation.
 */
class processing_poller {
public:
    using tick_callback = std::function<void(const processing_status&)>;

    processing_poller(std::shared_ptr<transport_client> transport,
                      std::shared_ptr<timer_service> timer,
                      const session_config& config,
                      tick_callback on_tick = {});

    /**
     * @brief Give up with session_timeout at this point in time
     */
    void set_session_deadline(std::optional<timer_service::time_point> deadline);

    /**
     * @brief Poll until a terminal processing state
     * @param media_id Upload to poll
     * @param initial Status reported by FINALIZE
     * @return Final status (succeeded), or processing_failed,
     *         processing_timeout, session_timeout, cancelled or a
     *         transport error tagged with the processing phase
     */
    [[nodiscard]] auto poll(const std::string& media_id,
                            const processing_status& initial,
                            const cancellation_token& token) -> result<processing_status>;

    /**
     * @brief STATUS requests issued by the last poll(), retries included
     */
    [[nodiscard]] auto status_requests() const noexcept -> std::size_t {
        return status_requests_;
    }

private:
    [[nodiscard]] auto next_wait(const processing_status& status) const
        -> std::chrono::milliseconds;

    std::shared_ptr<transport_client> transport_;
    std::shared_ptr<timer_service> timer_;
    const session_config& config_;
    tick_callback on_tick_;
    std::optional<timer_service::time_point> session_deadline_;
    std::size_t status_requests_ = 0;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_SESSION_PROCESSING_POLLER_H
