/**
 * @file types.h
 * @brief Core type definitions for media_upload
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_TYPES_H
#define KCENON_MEDIA_UPLOAD_CORE_TYPES_H

#include "kcenon/media_upload/core/error_codes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::media_upload {

/**
 * @brief Phase of an upload session
 */
enum class upload_phase {
    idle,
    initialized,
    appending,
    finalizing,
    processing,
    succeeded,
    failed
};

/**
 * @brief Convert upload_phase to string
 */
[[nodiscard]] constexpr auto to_string(upload_phase phase) noexcept -> const char* {
    switch (phase) {
        case upload_phase::idle: return "idle";
        case upload_phase::initialized: return "initialized";
        case upload_phase::appending: return "appending";
        case upload_phase::finalizing: return "finalizing";
        case upload_phase::processing: return "processing";
        case upload_phase::succeeded: return "succeeded";
        case upload_phase::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Check if phase is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_phase(upload_phase phase) noexcept -> bool {
    return phase == upload_phase::succeeded || phase == upload_phase::failed;
}

/**
 * @brief Error value: kind, the phase it occurred in, and a detail message
 */
struct error {
    error_code code;
    upload_phase phase;
    std::string message;

    error() : code(error_code::success), phase(upload_phase::idle) {}
    explicit error(error_code c)
        : code(c), phase(upload_phase::idle), message(to_string(c)) {}
    error(error_code c, std::string msg)
        : code(c), phase(upload_phase::idle), message(std::move(msg)) {}
    error(error_code c, upload_phase p, std::string msg)
        : code(c), phase(p), message(std::move(msg)) {}

    /**
     * @brief Copy of this error tagged with a phase
     */
    [[nodiscard]] auto in_phase(upload_phase p) const -> error {
        return error{code, p, message};
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_TYPES_H
