/**
 * @file upload_session.cpp
 * @brief Implementation of upload_session
 */

#include "kcenon/media_upload/session/upload_session.h"

#include "kcenon/media_upload/core/chunk_segmenter.h"
#include "kcenon/media_upload/core/logging.h"
#include "kcenon/media_upload/protocol/upload_protocol.h"
#include "kcenon/media_upload/session/processing_poller.h"
#include "kcenon/media_upload/session/request_executor.h"

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <vector>

namespace kcenon::media_upload {

namespace {

auto elapsed_ms(timer_service::time_point from, timer_service::time_point to) -> uint64_t {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
    return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

}  // namespace

auto is_valid_transition(upload_phase from, upload_phase to) noexcept -> bool {
    // Terminal phases cannot transition
    if (is_terminal_phase(from)) {
        return false;
    }

    // Any non-terminal phase can fail
    if (to == upload_phase::failed) {
        return true;
    }

    switch (from) {
        case upload_phase::idle:
            return to == upload_phase::initialized;
        case upload_phase::initialized:
            return to == upload_phase::appending;
        case upload_phase::appending:
            return to == upload_phase::finalizing;
        case upload_phase::finalizing:
            return to == upload_phase::processing || to == upload_phase::succeeded;
        case upload_phase::processing:
            return to == upload_phase::succeeded;
        default:
            return false;
    }
}

// ============================================================================
// Implementation
// ============================================================================

struct upload_session::impl {
    media_asset asset;
    std::shared_ptr<transport_client> transport;
    session_config config;
    std::shared_ptr<progress_observer> observer;
    std::shared_ptr<timer_service> timer;

    cancellation_token token;
    std::atomic<bool> started{false};

    mutable std::mutex state_mutex;
    upload_phase phase = upload_phase::idle;
    std::string media_id;
    chunk_plan plan;
    uint64_t bytes_acked = 0;
    std::optional<timer_service::time_point> created_at;
    std::optional<timer_service::time_point> expires_at;
    std::optional<timer_service::time_point> session_deadline;
    std::optional<error> last_error;
    std::optional<processing_status> processing;

    // Chunk scheduling, guarded by state_mutex
    std::condition_variable slot_cv;
    std::size_t active_chunks = 0;
    std::optional<timer_service::time_point> last_completion;
    std::optional<error> append_error;

    std::mutex progress_mutex;
    bool terminal = false;

    impl(media_asset a,
         std::shared_ptr<transport_client> t,
         session_config c,
         std::shared_ptr<progress_observer> o,
         std::shared_ptr<timer_service> tm)
        : asset(std::move(a)),
          transport(std::move(t)),
          config(std::move(c)),
          observer(std::move(o)),
          timer(tm ? std::move(tm) : steady_timer_service::shared()) {}

    // ------------------------------------------------------------------------
    // State helpers
    // ------------------------------------------------------------------------

    [[nodiscard]] auto current_phase() const -> upload_phase {
        std::lock_guard lock(state_mutex);
        return phase;
    }

    [[nodiscard]] auto log_context() const -> upload_log_context {
        upload_log_context ctx;
        std::lock_guard lock(state_mutex);
        ctx.media_id = media_id;
        ctx.content_type = asset.content_type();
        ctx.phase = to_string(phase);
        ctx.total_bytes = asset.size();
        ctx.bytes_acked = bytes_acked;
        ctx.total_chunks = static_cast<uint32_t>(plan.size());
        return ctx;
    }

    auto transition(upload_phase to) -> result<void> {
        std::lock_guard lock(state_mutex);
        if (!is_valid_transition(phase, to)) {
            return unexpected(error{error_code::invalid_state, phase,
                                    std::string("invalid phase transition from ") +
                                        to_string(phase) + " to " + to_string(to)});
        }
        phase = to;
        return {};
    }

    [[nodiscard]] auto session_deadline_entry() const -> std::optional<request_deadline> {
        if (!session_deadline) {
            return std::nullopt;
        }
        return request_deadline{*session_deadline, error_code::session_timeout};
    }

    void emit(const progress_event& event) {
        std::lock_guard lock(progress_mutex);
        if (terminal || !observer) {
            return;
        }
        observer->on_progress(event);
    }

    [[nodiscard]] auto phase_event(upload_phase p) const -> progress_event {
        progress_event event;
        event.phase = p;
        event.total_bytes = asset.size();
        std::lock_guard lock(state_mutex);
        event.bytes_transferred = bytes_acked;
        event.total_chunks = static_cast<uint32_t>(plan.size());
        return event;
    }

    auto fail(error err) -> unexpected {
        {
            std::lock_guard lock(progress_mutex);
            terminal = true;
        }
        {
            std::lock_guard lock(state_mutex);
            last_error = err;
            phase = upload_phase::failed;
        }
        token.cancel();

        auto ctx = log_context();
        ctx.phase = to_string(err.phase);
        ctx.error_message = err.message;
        if (created_at) {
            ctx.duration_ms = elapsed_ms(*created_at, timer->now());
        }
        MU_LOG_ERROR_CTX(log_category::session,
                         std::string("Upload failed: ") + std::string(to_string(err.code)), ctx);

        return unexpected(std::move(err));
    }

    auto succeed(upload_success success) -> result<upload_success> {
        {
            std::lock_guard lock(progress_mutex);
            terminal = true;
        }
        if (auto t = transition(upload_phase::succeeded); !t) {
            return fail(t.error());
        }

        auto ctx = log_context();
        if (created_at) {
            ctx.duration_ms = elapsed_ms(*created_at, timer->now());
        }
        MU_LOG_INFO_CTX(log_category::session, "Upload succeeded", ctx);
        return success;
    }

    // ------------------------------------------------------------------------
    // Phases
    // ------------------------------------------------------------------------

    auto execute() -> result<upload_success>;
    auto init_phase() -> result<void>;
    auto append_phase() -> result<void>;
    void send_chunk(std::size_t index);
    auto finalize_phase() -> result<finalize_response>;
    auto await_processing(const std::string& id, const processing_status& initial)
        -> result<void>;
    auto attach_metadata(const std::string& id, upload_phase in_phase) -> result<void>;
};

auto upload_session::impl::execute() -> result<upload_success> {
    if (auto valid = config.validate(); !valid) {
        return fail(valid.error());
    }

    {
        auto now = timer->now();
        std::lock_guard lock(state_mutex);
        created_at = now;
        if (config.session_timeout.count() > 0) {
            session_deadline = now + config.session_timeout;
        }
    }

    auto start_ctx = log_context();
    MU_LOG_INFO_CTX(log_category::session, "Upload started", start_ctx);

    if (!transport || !transport->is_authenticated()) {
        return fail(error{error_code::auth_required, upload_phase::idle,
                          "authentication required for media upload"});
    }

    auto planned = chunk_segmenter::plan(asset.size());
    if (!planned) {
        return fail(error{error_code::validation_failed, upload_phase::idle,
                          planned.error().message});
    }
    {
        std::lock_guard lock(state_mutex);
        plan = std::move(planned.value());
    }

    if (auto r = init_phase(); !r) {
        return fail(r.error());
    }

    if (auto t = transition(upload_phase::appending); !t) {
        return fail(t.error());
    }
    if (auto r = append_phase(); !r) {
        return fail(r.error());
    }

    if (auto t = transition(upload_phase::finalizing); !t) {
        return fail(t.error());
    }
    emit(phase_event(upload_phase::finalizing));

    auto finalized = finalize_phase();
    if (!finalized) {
        return fail(finalized.error());
    }
    auto& fin = finalized.value();

    if (token.is_cancelled()) {
        return fail(error{error_code::cancelled, upload_phase::finalizing, "upload cancelled"});
    }

    if (fin.processing) {
        {
            std::lock_guard lock(state_mutex);
            processing = fin.processing;
        }
        switch (fin.processing->state) {
            case processing_state::failed:
                return fail(error{error_code::processing_failed, upload_phase::finalizing,
                                  "processing failed for " + fin.media_id + ": " +
                                      fin.processing->error_detail.value_or(
                                          "media processing failed")});
            case processing_state::pending:
            case processing_state::in_progress:
                if (auto r = await_processing(fin.media_id, *fin.processing); !r) {
                    return fail(r.error());
                }
                break;
            default:
                break;
        }
    }

    if (asset.alt_text()) {
        if (auto r = attach_metadata(fin.media_id, current_phase()); !r) {
            return fail(r.error());
        }
    }

    upload_success success;
    success.media_id = fin.media_id.empty() ? media_id : fin.media_id;
    success.media_key = fin.media_key;
    success.size = fin.size;
    success.dimensions = fin.dimensions;
    return succeed(std::move(success));
}

auto upload_session::impl::init_phase() -> result<void> {
    request_executor exec(config.retry, *timer, token, upload_phase::idle, "INIT");
    exec.with_deadline(session_deadline_entry());

    auto fields = upload_protocol::make_init_fields(asset);
    auto init = exec.run([&]() -> result<init_response> {
        auto sent = transport->post_form(config.upload_url, fields,
                                         exec.options(config.call_timeout));
        if (!sent) {
            return unexpected(sent.error());
        }
        if (auto checked = upload_protocol::check_response(sent.value(), upload_phase::idle,
                                                           "INIT");
            !checked) {
            return unexpected(checked.error());
        }
        return upload_protocol::parse_init(sent.value());
    });

    if (!init) {
        return unexpected(init.error());
    }

    auto validity = init.value().expires_after.value_or(config.default_expiry);
    {
        std::lock_guard lock(state_mutex);
        media_id = init.value().media_id;
        expires_at = timer->now() + validity;
    }

    if (auto t = transition(upload_phase::initialized); !t) {
        return t;
    }

    auto ctx = log_context();
    ctx.attempt = static_cast<uint32_t>(exec.attempts());
    MU_LOG_INFO_CTX(log_category::session, "Upload session initialized", ctx);
    emit(phase_event(upload_phase::initialized));
    return {};
}

auto upload_session::impl::append_phase() -> result<void> {
    std::size_t total = 0;
    {
        std::lock_guard lock(state_mutex);
        total = plan.size();
    }

    // Wake the scheduler when the upload is cancelled while it waits for a slot
    auto wake = token.register_callback([this] {
        std::lock_guard lock(state_mutex);
        slot_cv.notify_all();
    });

    std::vector<std::future<void>> workers;
    workers.reserve(total);

    for (std::size_t i = 0; i < total; ++i) {
        {
            std::unique_lock lock(state_mutex);
            slot_cv.wait(lock, [this] {
                return active_chunks < config.concurrency || append_error ||
                       token.is_cancelled();
            });
            if (append_error || token.is_cancelled()) {
                break;
            }
        }

        // Keep chunk_spacing between the latest completion and this start
        bool cancelled = false;
        while (true) {
            std::chrono::milliseconds wait{0};
            {
                std::lock_guard lock(state_mutex);
                if (last_completion) {
                    auto ready_at = *last_completion + config.chunk_spacing;
                    auto now = timer->now();
                    if (ready_at > now) {
                        wait = std::chrono::ceil<std::chrono::milliseconds>(ready_at - now);
                    }
                }
            }
            if (wait.count() <= 0) {
                break;
            }
            if (!timer->wait_for(wait, token)) {
                cancelled = true;
                break;
            }
        }
        if (cancelled) {
            break;
        }

        {
            std::lock_guard lock(state_mutex);
            if (append_error || token.is_cancelled()) {
                break;
            }
            ++active_chunks;
        }
        workers.push_back(std::async(std::launch::async, [this, i] { send_chunk(i); }));
    }

    for (auto& worker : workers) {
        worker.get();
    }
    token.unregister_callback(wake);

    std::lock_guard lock(state_mutex);
    if (append_error) {
        return unexpected(*append_error);
    }
    if (token.is_cancelled()) {
        return unexpected(error{error_code::cancelled, upload_phase::appending,
                                "upload cancelled"});
    }
    return {};
}

void upload_session::impl::send_chunk(std::size_t index) {
    chunk_descriptor chunk;
    std::string id;
    std::size_t total_chunks = 0;
    {
        std::lock_guard lock(state_mutex);
        chunk = plan[index];
        id = media_id;
        total_chunks = plan.size();
    }

    request_executor exec(config.retry, *timer, token, upload_phase::appending,
                          "APPEND segment " + std::to_string(chunk.index));
    exec.with_deadline(session_deadline_entry());
    if (config.chunk_timeout.count() > 0) {
        exec.with_deadline(
            request_deadline{timer->now() + config.chunk_timeout, error_code::chunk_timeout});
    }

    auto fields = upload_protocol::make_append_fields(
        id, chunk.index, asset.slice(chunk.offset, chunk.length));

    auto sent = exec.run(
        [&]() -> result<void> {
            {
                std::lock_guard lock(state_mutex);
                if (expires_at && timer->now() >= *expires_at) {
                    return unexpected(error{error_code::session_expired,
                                            upload_phase::appending,
                                            "upload session expired before APPEND of segment " +
                                                std::to_string(chunk.index)});
                }
                plan[index].status = chunk_status::inflight;
                ++plan[index].attempt;
            }
            auto response = transport->post_form(config.upload_url, fields,
                                                 exec.options(config.call_timeout));
            if (!response) {
                return unexpected(response.error());
            }
            return upload_protocol::check_response(response.value(), upload_phase::appending,
                                                   "APPEND");
        },
        [&](std::size_t) {
            std::lock_guard lock(state_mutex);
            plan[index].status = chunk_status::pending;
        });

    progress_event event;
    upload_log_context ctx;
    {
        std::lock_guard lock(state_mutex);
        --active_chunks;
        last_completion = timer->now();

        if (sent) {
            plan[index].status = chunk_status::acked;
            bytes_acked += chunk.length;
        } else {
            plan[index].status = chunk_status::failed;
            if (!append_error) {
                append_error = sent.error();
            }
        }

        event.phase = upload_phase::appending;
        event.chunk_index = chunk.index;
        event.total_chunks = static_cast<uint32_t>(total_chunks);
        event.bytes_transferred = bytes_acked;
        event.total_bytes = asset.size();

        ctx.media_id = id;
        ctx.chunk_index = chunk.index;
        ctx.total_chunks = static_cast<uint32_t>(total_chunks);
        ctx.bytes_acked = bytes_acked;
        ctx.total_bytes = asset.size();
        ctx.attempt = plan[index].attempt;
    }
    slot_cv.notify_all();

    if (!sent) {
        ctx.error_message = sent.error().message;
        MU_LOG_WARN_CTX(log_category::chunk, "Chunk failed", ctx);
        // Stop the chunks still in flight
        token.cancel();
        return;
    }

    MU_LOG_DEBUG_CTX(log_category::chunk, "Chunk acknowledged", ctx);
    emit(event);
}

auto upload_session::impl::finalize_phase() -> result<finalize_response> {
    std::string id;
    {
        std::lock_guard lock(state_mutex);
        id = media_id;
    }

    request_executor exec(config.retry, *timer, token, upload_phase::finalizing, "FINALIZE");
    exec.with_deadline(session_deadline_entry());

    auto fields = upload_protocol::make_finalize_fields(id);
    auto finalized = exec.run([&]() -> result<finalize_response> {
        auto sent = transport->post_form(config.upload_url, fields,
                                         exec.options(config.call_timeout));
        if (!sent) {
            return unexpected(sent.error());
        }
        if (auto checked = upload_protocol::check_response(
                sent.value(), upload_phase::finalizing, "FINALIZE");
            !checked) {
            return unexpected(checked.error());
        }
        return upload_protocol::parse_finalize(sent.value());
    });

    if (finalized) {
        auto ctx = log_context();
        if (finalized.value().processing) {
            ctx.progress_percent = finalized.value().processing->progress_percent;
        }
        MU_LOG_INFO_CTX(log_category::session, "Upload finalized", ctx);
    }
    return finalized;
}

auto upload_session::impl::await_processing(const std::string& id,
                                            const processing_status& initial)
    -> result<void> {
    if (auto t = transition(upload_phase::processing); !t) {
        return t;
    }

    auto event = phase_event(upload_phase::processing);
    event.processing_percent = initial.progress_percent;
    emit(event);

    processing_poller poller(transport, timer, config,
                             [this](const processing_status& status) {
                                 {
                                     std::lock_guard lock(state_mutex);
                                     processing = status;
                                 }
                                 auto tick = phase_event(upload_phase::processing);
                                 tick.processing_percent = status.progress_percent;
                                 emit(tick);
                             });
    poller.set_session_deadline(session_deadline);

    auto polled = poller.poll(id, initial, token);
    if (!polled) {
        return unexpected(polled.error());
    }

    std::lock_guard lock(state_mutex);
    processing = polled.value();
    return {};
}

auto upload_session::impl::attach_metadata(const std::string& id, upload_phase in_phase)
    -> result<void> {
    if (config.metadata_url.empty()) {
        return unexpected(error{error_code::invalid_configuration, in_phase,
                                "metadata endpoint is not set"});
    }

    request_executor exec(config.retry, *timer, token, in_phase, "metadata");
    exec.with_deadline(session_deadline_entry());

    auto body = upload_protocol::make_metadata_body(id, *asset.alt_text());
    auto attached = exec.run([&]() -> result<void> {
        auto sent = transport->post_json(config.metadata_url, body,
                                         exec.options(config.call_timeout));
        if (!sent) {
            return unexpected(sent.error());
        }
        return upload_protocol::check_response(sent.value(), in_phase, "metadata");
    });

    if (attached) {
        auto ctx = log_context();
        MU_LOG_DEBUG_CTX(log_category::session, "Accessibility text attached", ctx);
    }
    return attached;
}

// ============================================================================
// upload_session
// ============================================================================

upload_session::upload_session(media_asset asset,
                               std::shared_ptr<transport_client> transport,
                               session_config config,
                               std::shared_ptr<progress_observer> observer,
                               std::shared_ptr<timer_service> timer)
    : impl_(std::make_unique<impl>(std::move(asset), std::move(transport), std::move(config),
                                   std::move(observer), std::move(timer))) {}

upload_session::~upload_session() = default;

auto upload_session::run() -> result<upload_success> {
    return run(cancellation_token{});
}

auto upload_session::run(const cancellation_token& token) -> result<upload_success> {
    bool expected = false;
    if (!impl_->started.compare_exchange_strong(expected, true)) {
        return unexpected(error{error_code::invalid_state, impl_->current_phase(),
                                "upload session can only be run once"});
    }

    cancellation_link link(token, impl_->token);
    return impl_->execute();
}

void upload_session::cancel() {
    impl_->token.cancel();
}

auto upload_session::phase() const -> upload_phase {
    return impl_->current_phase();
}

auto upload_session::media_id() const -> std::string {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->media_id;
}

auto upload_session::chunks() const -> chunk_plan {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->plan;
}

auto upload_session::bytes_acked() const -> uint64_t {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->bytes_acked;
}

auto upload_session::created_at() const -> std::optional<timer_service::time_point> {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->created_at;
}

auto upload_session::expires_at() const -> std::optional<timer_service::time_point> {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->expires_at;
}

auto upload_session::last_error() const -> std::optional<error> {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->last_error;
}

auto upload_session::processing() const -> std::optional<processing_status> {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->processing;
}

auto upload_session::asset() const -> const media_asset& {
    return impl_->asset;
}

auto upload_session::config() const -> const session_config& {
    return impl_->config;
}

}  // namespace kcenon::media_upload
