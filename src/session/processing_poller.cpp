/**
 * @file processing_poller.cpp
 * @brief Implementation of processing_poller
 */

#include "kcenon/media_upload/session/processing_poller.h"

#include "kcenon/media_upload/core/logging.h"

#include <algorithm>

namespace kcenon::media_upload {

processing_poller::processing_poller(std::shared_ptr<transport_client> transport,
                                     std::shared_ptr<timer_service> timer,
                                     const session_config& config,
                                     tick_callback on_tick)
    : transport_(std::move(transport)),
      timer_(std::move(timer)),
      config_(config),
      on_tick_(std::move(on_tick)) {}

void processing_poller::set_session_deadline(
    std::optional<timer_service::time_point> deadline) {
    session_deadline_ = deadline;
}

auto processing_poller::next_wait(const processing_status& status) const
    -> std::chrono::milliseconds {
    std::chrono::milliseconds wait = config_.poller.default_check_after;
    if (status.check_after_secs) {
        wait = std::chrono::seconds(*status.check_after_secs);
    }
    return std::max(wait, config_.poller.min_check_after);
}

auto processing_poller::poll(const std::string& media_id,
                             const processing_status& initial,
                             const cancellation_token& token)
    -> result<processing_status> {
    status_requests_ = 0;
    auto status = initial;
    const auto started = timer_->now();

    upload_log_context ctx;
    ctx.media_id = media_id;
    ctx.phase = to_string(upload_phase::processing);

    while (status.state == processing_state::pending ||
           status.state == processing_state::in_progress) {
        auto wait = next_wait(status);
        auto now = timer_->now();

        if (now + wait - started > config_.poller.max_wait) {
            MU_LOG_ERROR_CTX(log_category::poller, "Processing wait ceiling reached", ctx);
            return unexpected(error{
                error_code::processing_timeout, upload_phase::processing,
                "media " + media_id + " still " + to_string(status.state) + " after " +
                    std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                       now - started).count()) + "s"});
        }
        if (session_deadline_ && now + wait >= *session_deadline_) {
            return unexpected(error{error_code::session_timeout, upload_phase::processing,
                                    "session time budget exhausted while processing"});
        }

        ctx.delay_ms = static_cast<uint64_t>(wait.count());
        MU_LOG_DEBUG_CTX(log_category::poller, "Waiting before STATUS", ctx);

        if (!timer_->wait_for(wait, token)) {
            return unexpected(error{error_code::cancelled, upload_phase::processing,
                                    "processing poll cancelled"});
        }

        request_executor exec(config_.retry, *timer_, token, upload_phase::processing,
                              "STATUS");
        if (session_deadline_) {
            exec.with_deadline(request_deadline{*session_deadline_, error_code::session_timeout});
        }

        auto query = upload_protocol::make_status_query(media_id);
        auto response = exec.run([&]() -> result<status_response> {
            ++status_requests_;
            auto sent = transport_->get_json(config_.upload_url, query,
                                             exec.options(config_.call_timeout));
            if (!sent) {
                return unexpected(sent.error());
            }
            if (auto checked = upload_protocol::check_response(
                    sent.value(), upload_phase::processing, "STATUS");
                !checked) {
                return unexpected(checked.error());
            }
            return upload_protocol::parse_status(sent.value());
        });

        if (!response) {
            return unexpected(response.error());
        }

        if (!response.value().processing) {
            // The server stopped tracking processing, which only happens once it is done
            status.state = processing_state::succeeded;
            status.check_after_secs.reset();
        } else {
            status = *response.value().processing;
        }

        ctx.progress_percent = status.progress_percent;
        ctx.delay_ms.reset();
        MU_LOG_DEBUG_CTX(log_category::poller,
                         std::string("STATUS ") + to_string(status.state), ctx);

        if (on_tick_) {
            on_tick_(status);
        }
    }

    if (status.state == processing_state::failed) {
        auto detail = status.error_detail.value_or("media processing failed");
        ctx.error_message = detail;
        MU_LOG_ERROR_CTX(log_category::poller, "Processing failed", ctx);
        return unexpected(error{error_code::processing_failed, upload_phase::processing,
                                "processing failed for " + media_id + ": " + detail});
    }

    return status;
}

}  // namespace kcenon::media_upload
