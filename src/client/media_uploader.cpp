/**
 * @file media_uploader.cpp
 * @brief Implementation of media_uploader
 */

#include "kcenon/media_upload/client/media_uploader.h"

#include "kcenon/media_upload/core/logging.h"
#include "kcenon/media_upload/session/upload_session.h"

#include <mutex>

namespace kcenon::media_upload {

struct media_uploader::impl {
    uploader_config config;
    media_validator validator;
    std::shared_ptr<transport_client> transport;
    std::shared_ptr<timer_service> timer;
    std::shared_ptr<progress_observer> observer;

    std::mutex cancel_mutex;
    cancellation_token cancel_token;

    impl(uploader_config c,
         std::shared_ptr<transport_client> t,
         std::shared_ptr<timer_service> tm,
         std::shared_ptr<progress_observer> o)
        : config(std::move(c)),
          validator(config.rules),
          transport(std::move(t)),
          timer(std::move(tm)),
          observer(std::move(o)) {}

    auto current_cancel_token() -> cancellation_token {
        std::lock_guard lock(cancel_mutex);
        return cancel_token;
    }

    static auto rejected(const validation_result& validation, std::size_t count)
        -> unexpected {
        auto err = validation.to_error();
        upload_log_context ctx;
        ctx.error_message = err.message;
        MU_LOG_WARN_CTX(log_category::validator,
                        "Rejected " + std::to_string(count) + " asset(s) before upload", ctx);
        return unexpected(std::move(err));
    }

    auto run_session(const media_asset& asset, const cancellation_token& token)
        -> result<upload_success> {
        upload_session session(asset, transport, config.session, observer, timer);

        // Either the caller or cancel_all() may stop this run
        cancellation_token run_token;
        cancellation_link caller_link(token, run_token);
        cancellation_link uploader_link(current_cancel_token(), run_token);
        return session.run(run_token);
    }
};

// ============================================================================
// builder
// ============================================================================

media_uploader::builder::builder() = default;

auto media_uploader::builder::with_transport(std::shared_ptr<transport_client> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto media_uploader::builder::with_timer(std::shared_ptr<timer_service> timer) -> builder& {
    timer_ = std::move(timer);
    return *this;
}

auto media_uploader::builder::with_upload_url(std::string url) -> builder& {
    config_.session.upload_url = std::move(url);
    return *this;
}

auto media_uploader::builder::with_metadata_url(std::string url) -> builder& {
    config_.session.metadata_url = std::move(url);
    return *this;
}

auto media_uploader::builder::with_concurrency(std::size_t concurrency) -> builder& {
    config_.session.concurrency = concurrency;
    return *this;
}

auto media_uploader::builder::with_chunk_spacing(std::chrono::milliseconds spacing)
    -> builder& {
    config_.session.chunk_spacing = spacing;
    return *this;
}

auto media_uploader::builder::with_retry_policy(const retry_policy& policy) -> builder& {
    config_.session.retry = policy;
    return *this;
}

auto media_uploader::builder::with_poller_config(const poller_config& config) -> builder& {
    config_.session.poller = config;
    return *this;
}

auto media_uploader::builder::with_timeouts(std::chrono::milliseconds call,
                                            std::chrono::milliseconds chunk,
                                            std::chrono::milliseconds session) -> builder& {
    config_.session.call_timeout = call;
    config_.session.chunk_timeout = chunk;
    config_.session.session_timeout = session;
    return *this;
}

auto media_uploader::builder::with_validation_rules(const validation_rules& rules)
    -> builder& {
    config_.rules = rules;
    return *this;
}

auto media_uploader::builder::with_session_config(const session_config& config)
    -> builder& {
    config_.session = config;
    return *this;
}

auto media_uploader::builder::with_progress_observer(
    std::shared_ptr<progress_observer> observer) -> builder& {
    observer_ = std::move(observer);
    return *this;
}

auto media_uploader::builder::on_progress(callback_progress_observer::callback callback)
    -> builder& {
    observer_ = std::make_shared<callback_progress_observer>(std::move(callback));
    return *this;
}

auto media_uploader::builder::build() -> result<media_uploader> {
    if (!transport_) {
        return unexpected{error{error_code::invalid_configuration,
                               "A transport is required to build a media_uploader"}};
    }

    if (auto valid = config_.session.validate(); !valid) {
        return unexpected{valid.error()};
    }

    if (!timer_) {
        timer_ = steady_timer_service::shared();
    }

    return media_uploader{std::move(config_), std::move(transport_), std::move(timer_),
                          std::move(observer_)};
}

// ============================================================================
// media_uploader
// ============================================================================

media_uploader::media_uploader(uploader_config config,
                               std::shared_ptr<transport_client> transport,
                               std::shared_ptr<timer_service> timer,
                               std::shared_ptr<progress_observer> observer)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport), std::move(timer),
                                   std::move(observer))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

media_uploader::~media_uploader() = default;

media_uploader::media_uploader(media_uploader&&) noexcept = default;
auto media_uploader::operator=(media_uploader&&) noexcept -> media_uploader& = default;

auto media_uploader::upload(const media_asset& asset) -> result<upload_success> {
    return upload(asset, cancellation_token{});
}

auto media_uploader::upload(const media_asset& asset, const cancellation_token& token)
    -> result<upload_success> {
    auto validation = impl_->validator.validate(asset);
    if (!validation.ok) {
        return impl::rejected(validation, 1);
    }
    return impl_->run_session(asset, token);
}

auto media_uploader::upload_all(const std::vector<media_asset>& assets)
    -> result<std::vector<upload_success>> {
    return upload_all(assets, cancellation_token{});
}

auto media_uploader::upload_all(const std::vector<media_asset>& assets,
                                const cancellation_token& token)
    -> result<std::vector<upload_success>> {
    auto validation = impl_->validator.validate_set(assets);
    if (!validation.ok) {
        return impl::rejected(validation, assets.size());
    }

    std::vector<upload_success> uploaded;
    uploaded.reserve(assets.size());

    for (std::size_t i = 0; i < assets.size(); ++i) {
        auto outcome = impl_->run_session(assets[i], token);
        if (!outcome) {
            auto err = outcome.error();
            err.message = "asset " + std::to_string(i) + ": " + err.message;
            return unexpected(std::move(err));
        }
        uploaded.push_back(std::move(outcome.value()));
    }

    MU_LOG_INFO(log_category::uploader,
                "Uploaded " + std::to_string(uploaded.size()) + " asset(s)");
    return uploaded;
}

void media_uploader::cancel_all() {
    cancellation_token cancelled;
    {
        std::lock_guard lock(impl_->cancel_mutex);
        cancelled = impl_->cancel_token;
        impl_->cancel_token = cancellation_token{};
    }
    MU_LOG_INFO(log_category::uploader, "Cancelling running uploads");
    cancelled.cancel();
}

auto media_uploader::validator() const -> const media_validator& {
    return impl_->validator;
}

auto media_uploader::config() const -> const uploader_config& {
    return impl_->config;
}

}  // namespace kcenon::media_upload
