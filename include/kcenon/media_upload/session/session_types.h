/**
 * @file session_types.h
 * @brief Session-related type definitions for media_upload
 */

#ifndef KCENON_MEDIA_UPLOAD_SESSION_SESSION_TYPES_H
#define KCENON_MEDIA_UPLOAD_SESSION_SESSION_TYPES_H

#include "kcenon/media_upload/core/retry_policy.h"
#include "kcenon/media_upload/core/types.h"
#include "kcenon/media_upload/protocol/upload_protocol.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::media_upload {

/**
 * @brief STATUS polling configuration
 */
struct poller_config {
    /// Wait before a STATUS call when the server gives no check_after_secs
    std::chrono::seconds default_check_after{5};

    /// Shortest wait between STATUS calls, applied to server hints too
    std::chrono::milliseconds min_check_after{1000};

    /// Total processing wait after which polling gives up
    std::chrono::milliseconds max_wait{std::chrono::minutes(10)};

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Upload session configuration
 */
struct session_config {
    static constexpr std::size_t max_concurrency = 4;

    std::string upload_url = "https://upload.x.com/i/media/upload.json";
    std::string metadata_url = "https://x.com/i/api/1.1/media/metadata/create.json";

    /// Chunks in flight at the same time (1 to max_concurrency)
    std::size_t concurrency = 1;

    /// Minimum gap between one chunk completing and another APPEND starting
    std::chrono::milliseconds chunk_spacing{100};

    /// Timeout of a single network call
    std::chrono::milliseconds call_timeout{30000};

    /// Budget of one chunk including its retries (0 disables)
    std::chrono::milliseconds chunk_timeout{std::chrono::minutes(2)};

    /// Budget of the whole session including polling (0 disables)
    std::chrono::milliseconds session_timeout{std::chrono::minutes(30)};

    /// Validity window assumed when INIT reports none
    std::chrono::seconds default_expiry{std::chrono::minutes(60)};

    retry_policy retry;
    poller_config poller;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Progress notification
 */
struct progress_event {
    upload_phase phase = upload_phase::idle;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    std::optional<double> processing_percent;

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_transferred) /
               static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Receives progress notifications of an upload session
 *
 * Called at least on every chunk acknowledgement and every STATUS poll.
 * Calls are serialized and never happen after the session reaches a
 * terminal phase.
 */
class progress_observer {
public:
    virtual ~progress_observer() = default;

    virtual void on_progress(const progress_event& event) = 0;
};

/**
 * @brief progress_observer that forwards to a callable
 */
class callback_progress_observer : public progress_observer {
public:
    using callback = std::function<void(const progress_event&)>;

    explicit callback_progress_observer(callback cb) : callback_(std::move(cb)) {}

    void on_progress(const progress_event& event) override {
        if (callback_) {
            callback_(event);
        }
    }

private:
    callback callback_;
};

/**
 * @brief Outcome of a successful upload
 */
struct upload_success {
    std::string media_id;
    std::optional<std::string> media_key;
    std::optional<uint64_t> size;
    std::optional<media_dimensions> dimensions;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_SESSION_SESSION_TYPES_H
