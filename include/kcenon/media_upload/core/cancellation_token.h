/**
 * @file cancellation_token.h
 * @brief Cooperative cancellation shared between a caller and an upload
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_CANCELLATION_TOKEN_H
#define KCENON_MEDIA_UPLOAD_CORE_CANCELLATION_TOKEN_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace kcenon::media_upload {

/**
 * @brief Copyable handle to a shared cancellation flag
 *
 * All copies observe the same flag. Cancelling wakes every thread blocked
 * in wait_for() and runs registered callbacks once.
 *
 * @code
 * cancellation_token token;
 * auto worker = std::async(std::launch::async, [&] { return session.run(token); });
 * token.cancel();
 * @endcode
 */
class cancellation_token {
public:
    using callback = std::function<void()>;
    using registration = uint64_t;

    cancellation_token();

    /**
     * @brief Request cancellation (idempotent)
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief Block for up to timeout or until cancelled
     * @return true if cancellation was requested
     */
    auto wait_for(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Run cb on cancellation; runs immediately if already cancelled
     * @return Handle for unregister_callback()
     */
    auto register_callback(callback cb) -> registration;

    /**
     * @brief Remove a callback
     *
     * If another thread is running the callback, blocks until it returns,
     * so state captured by the callback may be destroyed afterwards.
     */
    void unregister_callback(registration id);

private:
    struct state {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        bool cancelled = false;
        registration next_id = 1;
        std::map<registration, callback> callbacks;
        registration running = 0;
        std::thread::id runner;
    };

    std::shared_ptr<state> state_;
};

/**
 * @brief Cancels a target token when a source token is cancelled
 *
 * Unlinks on destruction, so the source never outlives the link.
 */
class cancellation_link {
public:
    cancellation_link(cancellation_token source, cancellation_token target);
    ~cancellation_link();

    cancellation_link(const cancellation_link&) = delete;
    auto operator=(const cancellation_link&) -> cancellation_link& = delete;

private:
    cancellation_token source_;
    cancellation_token::registration id_;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_CANCELLATION_TOKEN_H
