/**
 * @file media_uploader.h
 * @brief Entry point for uploading media assets
 */

#ifndef KCENON_MEDIA_UPLOAD_CLIENT_MEDIA_UPLOADER_H
#define KCENON_MEDIA_UPLOAD_CLIENT_MEDIA_UPLOADER_H

#include "kcenon/media_upload/core/cancellation_token.h"
#include "kcenon/media_upload/core/media_asset.h"
#include "kcenon/media_upload/core/timer_service.h"
#include "kcenon/media_upload/core/types.h"
#include "kcenon/media_upload/core/validator.h"
#include "kcenon/media_upload/session/session_types.h"
#include "kcenon/media_upload/transport/transport_client.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::media_upload {

/**
 * @brief Uploader configuration
 */
struct uploader_config {
    session_config session;
    validation_rules rules;
};

/**
 * @brief Validates assets and runs one upload session per asset
 *
 * @code
 * auto uploader = media_uploader::builder()
 *     .with_transport(transport)
 *     .with_concurrency(2)
 *     .on_progress([](const progress_event& e) { render(e); })
 *     .build();
 *
 * auto outcome = uploader.value().upload(asset);
 * @endcode
 */
class media_uploader {
public:
    /**
     * @brief Builder for media_uploader
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the transport used by every session (required)
         */
        auto with_transport(std::shared_ptr<transport_client> transport) -> builder&;

        /**
         * @brief Set the clock used for waits and deadlines
         */
        auto with_timer(std::shared_ptr<timer_service> timer) -> builder&;

        auto with_upload_url(std::string url) -> builder&;

        auto with_metadata_url(std::string url) -> builder&;

        /**
         * @brief Set the number of chunks in flight (1 to 4, default 1)
         */
        auto with_concurrency(std::size_t concurrency) -> builder&;

        /**
         * @brief Set the minimum gap between chunk requests (default 100ms)
         */
        auto with_chunk_spacing(std::chrono::milliseconds spacing) -> builder&;

        auto with_retry_policy(const retry_policy& policy) -> builder&;

        auto with_poller_config(const poller_config& config) -> builder&;

        /**
         * @brief Set call, chunk and session timeouts
         */
        auto with_timeouts(std::chrono::milliseconds call,
                           std::chrono::milliseconds chunk,
                           std::chrono::milliseconds session) -> builder&;

        auto with_validation_rules(const validation_rules& rules) -> builder&;

        auto with_session_config(const session_config& config) -> builder&;

        auto with_progress_observer(std::shared_ptr<progress_observer> observer) -> builder&;

        /**
         * @brief Report progress to a callable
         */
        auto on_progress(callback_progress_observer::callback callback) -> builder&;

        /**
         * @brief Build the uploader instance
         * @return Result containing the uploader or an error
         */
        [[nodiscard]] auto build() -> result<media_uploader>;

    private:
        uploader_config config_;
        std::shared_ptr<transport_client> transport_;
        std::shared_ptr<timer_service> timer_;
        std::shared_ptr<progress_observer> observer_;
    };

    ~media_uploader();

    media_uploader(const media_uploader&) = delete;
    auto operator=(const media_uploader&) -> media_uploader& = delete;
    media_uploader(media_uploader&&) noexcept;
    auto operator=(media_uploader&&) noexcept -> media_uploader&;

    /**
     * @brief Validate and upload one asset
     *
     * Validation failures are returned as validation_failed without any
     * network traffic.
     */
    [[nodiscard]] auto upload(const media_asset& asset) -> result<upload_success>;

    [[nodiscard]] auto upload(const media_asset& asset, const cancellation_token& token)
        -> result<upload_success>;

    /**
     * @brief Validate a post's asset set, then upload the assets in order
     *
     * Stops at the first failed upload; the remaining assets are not sent.
     * @return Outcomes in asset order
     */
    [[nodiscard]] auto upload_all(const std::vector<media_asset>& assets)
        -> result<std::vector<upload_success>>;

    [[nodiscard]] auto upload_all(const std::vector<media_asset>& assets,
                                  const cancellation_token& token)
        -> result<std::vector<upload_success>>;

    /**
     * @brief Cancel every upload currently running on this uploader
     */
    void cancel_all();

    [[nodiscard]] auto validator() const -> const media_validator&;

    [[nodiscard]] auto config() const -> const uploader_config&;

private:
    media_uploader(uploader_config config,
                   std::shared_ptr<transport_client> transport,
                   std::shared_ptr<timer_service> timer,
                   std::shared_ptr<progress_observer> observer);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CLIENT_MEDIA_UPLOADER_H
