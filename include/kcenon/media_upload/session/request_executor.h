/**
 * @file request_executor.h
 * @brief Runs one protocol request under the retry policy
 */

#ifndef KCENON_MEDIA_UPLOAD_SESSION_REQUEST_EXECUTOR_H
#define KCENON_MEDIA_UPLOAD_SESSION_REQUEST_EXECUTOR_H

#include "kcenon/media_upload/core/cancellation_token.h"
#include "kcenon/media_upload/core/logging.h"
#include "kcenon/media_upload/core/retry_policy.h"
#include "kcenon/media_upload/core/timer_service.h"
#include "kcenon/media_upload/core/types.h"
#include "kcenon/media_upload/transport/transport_client.h"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::media_upload {

/**
 * @brief Point in time after which a request gives up with a given code
 */
struct request_deadline {
    timer_service::time_point at;
    error_code code;
};

/**
 * @brief Retry loop shared by every request of a session
 *
 * A request is attempted, and on a retryable failure re-attempted after
 * the policy's delay, until it succeeds, the policy gives up, the token is
 * cancelled or a deadline passes. Errors come back tagged with the phase
 * the executor was created for.
 *
 * @code
 * request_executor exec(policy, timer, token, upload_phase::finalizing, "FINALIZE");
 * auto finalized = exec.run([&] {
 *     return transport.post_form(url, fields, exec.options(call_timeout));
 * });
 * @endcode
 */
class request_executor {
public:
    request_executor(const retry_policy& policy,
                     timer_service& timer,
                     cancellation_token token,
                     upload_phase phase,
                     std::string operation)
        : policy_(policy),
          timer_(timer),
          token_(std::move(token)),
          phase_(phase),
          operation_(std::move(operation)) {}

    /**
     * @brief Add a deadline; the earliest one wins
     */
    auto with_deadline(std::optional<request_deadline> deadline) -> request_executor& {
        if (deadline) {
            deadlines_.push_back(*deadline);
        }
        return *this;
    }

    /**
     * @brief Call options bounded by the remaining budget
     */
    [[nodiscard]] auto options(std::chrono::milliseconds call_timeout) const
        -> request_options {
        request_options opts;
        opts.timeout = call_timeout;
        opts.cancellation = token_;

        auto now = timer_.now();
        for (const auto& d : deadlines_) {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(d.at - now);
            opts.timeout = std::max(std::chrono::milliseconds(1),
                                    std::min(opts.timeout, remaining));
        }
        return opts;
    }

    /**
     * @brief Number of attempts made by the last run()
     */
    [[nodiscard]] auto attempts() const noexcept -> std::size_t { return attempts_; }

    /**
     * @brief Run request_func until it succeeds or must give up
     * @param request_func Callable returning result<T>
     * @param on_retry Called before each retry with the failed attempt index
     */
    template <typename RequestFunc, typename RetryFunc>
    [[nodiscard]] auto run(RequestFunc&& request_func, RetryFunc&& on_retry)
        -> decltype(request_func()) {
        attempts_ = 0;

        for (std::size_t attempt = 0;; ++attempt) {
            if (token_.is_cancelled()) {
                return unexpected(cancelled_error());
            }
            if (auto passed = passed_deadline(timer_.now())) {
                return unexpected(*passed);
            }

            ++attempts_;
            auto outcome = request_func();
            if (outcome.has_value()) {
                return outcome;
            }

            auto err = outcome.error();
            if (err.code == error_code::cancelled || token_.is_cancelled()) {
                return unexpected(cancelled_error());
            }

            auto decision = policy_.should_retry(attempt, err.code);
            if (!decision.retry) {
                if (is_retryable(err.code)) {
                    if (auto passed = passed_deadline(timer_.now())) {
                        return unexpected(*passed);
                    }
                }
                return unexpected(err.in_phase(phase_));
            }

            if (auto passed = passed_deadline(timer_.now() + decision.delay)) {
                return unexpected(*passed);
            }

            upload_log_context ctx;
            ctx.phase = to_string(phase_);
            ctx.attempt = static_cast<uint32_t>(attempt + 1);
            ctx.delay_ms = static_cast<uint64_t>(decision.delay.count());
            ctx.error_message = err.message;
            MU_LOG_WARN_CTX(log_category::retry, operation_ + " failed, retrying", ctx);

            on_retry(attempt);

            if (!timer_.wait_for(decision.delay, token_)) {
                return unexpected(cancelled_error());
            }
        }
    }

    template <typename RequestFunc>
    [[nodiscard]] auto run(RequestFunc&& request_func) -> decltype(request_func()) {
        return run(std::forward<RequestFunc>(request_func), [](std::size_t) {});
    }

private:
    [[nodiscard]] auto cancelled_error() const -> error {
        return error{error_code::cancelled, phase_, operation_ + " cancelled"};
    }

    [[nodiscard]] auto passed_deadline(timer_service::time_point when) const
        -> std::optional<error> {
        std::optional<request_deadline> earliest;
        for (const auto& d : deadlines_) {
            if (when >= d.at && (!earliest || d.at < earliest->at)) {
                earliest = d;
            }
        }
        if (!earliest) {
            return std::nullopt;
        }
        return error{earliest->code, phase_,
                     operation_ + " exceeded its time budget (" +
                         std::string(to_string(earliest->code)) + ")"};
    }

    const retry_policy& policy_;
    timer_service& timer_;
    cancellation_token token_;
    upload_phase phase_;
    std::string operation_;
    std::vector<request_deadline> deadlines_;
    std::size_t attempts_ = 0;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_SESSION_REQUEST_EXECUTOR_H
