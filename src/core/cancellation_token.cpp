/**
 * @file cancellation_token.cpp
 * @brief Implementation of cancellation_token
 */

#include "kcenon/media_upload/core/cancellation_token.h"

#include <utility>

namespace kcenon::media_upload {

cancellation_token::cancellation_token() : state_(std::make_shared<state>()) {}

void cancellation_token::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        state_->runner = std::this_thread::get_id();
    }
    state_->cv.notify_all();

    // Callbacks run outside the lock so they may touch other tokens
    while (true) {
        callback cb;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->callbacks.empty()) {
                break;
            }
            auto it = state_->callbacks.begin();
            state_->running = it->first;
            cb = std::move(it->second);
            state_->callbacks.erase(it);
        }
        if (cb) {
            cb();
        }
        cb = nullptr;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->running = 0;
        }
        state_->cv.notify_all();
    }
}

auto cancellation_token::is_cancelled() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_token::wait_for(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (timeout.count() <= 0) {
        return state_->cancelled;
    }
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

auto cancellation_token::register_callback(callback cb) -> registration {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(cb));
            return id;
        }
    }
    if (cb) {
        cb();
    }
    return 0;
}

void cancellation_token::unregister_callback(registration id) {
    if (id == 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
    if (state_->runner != std::this_thread::get_id()) {
        state_->cv.wait(lock, [this, id] { return state_->running != id; });
    }
}

// cancellation_link

cancellation_link::cancellation_link(cancellation_token source, cancellation_token target)
    : source_(std::move(source)),
      id_(source_.register_callback([target]() mutable { target.cancel(); })) {}

cancellation_link::~cancellation_link() {
    source_.unregister_callback(id_);
}

}  // namespace kcenon::media_upload
