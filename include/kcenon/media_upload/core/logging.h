// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/media_upload/config/feature_flags.h"

// logger_system integration requires common_system
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::media_upload {

/**
 * @brief Log categories for the media upload engine
 */
struct log_category {
    static constexpr std::string_view uploader = "media_upload.uploader";
    static constexpr std::string_view session = "media_upload.session";
    static constexpr std::string_view chunk = "media_upload.chunk";
    static constexpr std::string_view poller = "media_upload.poller";
    static constexpr std::string_view validator = "media_upload.validator";
    static constexpr std::string_view retry = "media_upload.retry";
    static constexpr std::string_view transport = "media_upload.transport";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Media ids identify a user's unpublished uploads and URLs may carry
 * signed query parameters, so both can be hidden from log output.
 */
struct masking_config {
    bool mask_media_ids = false;
    bool mask_urls = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    /**
     * @brief Create config with all masking enabled
     */
    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    /**
     * @brief Create config with no masking
     */
    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks media ids and URL query strings in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask sensitive information in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_media_ids && !config_.mask_urls) {
            return input;
        }

        std::string result = input;

        if (config_.mask_urls) {
            result = mask_url_queries(result);
        }

        if (config_.mask_media_ids) {
            result = mask_long_numbers(result);
        }

        return result;
    }

    /**
     * @brief Mask a media id, keeping its last visible_chars characters
     */
    [[nodiscard]] auto mask_media_id(const std::string& media_id) const -> std::string {
        if (!config_.mask_media_ids || media_id.size() <= config_.visible_chars) {
            return media_id;
        }

        auto hidden = media_id.size() - config_.visible_chars;
        return std::string(hidden, config_.mask_char[0]) + media_id.substr(hidden);
    }

    /**
     * @brief Strip the query string of a URL
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_urls) {
            return url;
        }

        auto query = url.find('?');
        if (query == std::string::npos) {
            return url;
        }
        return url.substr(0, query + 1) + std::string(3, config_.mask_char[0]);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_url_queries(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"(https?://[^\s"]+)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), url_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_url(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    // Media ids are long decimal strings (snowflake ids)
    [[nodiscard]] auto mask_long_numbers(const std::string& input) const -> std::string {
        static const std::regex id_pattern(R"(\b\d{10,}\b)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), id_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_media_id(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string media_id;
    std::string content_type;
    std::optional<std::string> phase;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> bytes_acked;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<uint32_t> attempt;
    std::optional<double> progress_percent;
    std::optional<uint64_t> delay_ms;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> endpoint;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!media_id.empty()) {
            add_field("media_id", masker ? masker->mask_media_id(media_id) : media_id);
        }
        if (!content_type.empty()) add_field("content_type", content_type);
        if (phase) add_field("phase", *phase);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (bytes_acked) add_uint("bytes_acked", *bytes_acked);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (attempt) add_uint("attempt", *attempt);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (delay_ms) add_uint("delay_ms", *delay_ms);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        if (endpoint) {
            add_field("endpoint", masker ? masker->mask_url(*endpoint) : *endpoint);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::session)
 *     .with_message("Chunk acknowledged")
 *     .with_media_id("1830000000000000001")
 *     .with_chunk_index(2)
 *     .with_total_chunks(3)
 *     .build();
 *
 * std::string json = entry.to_json();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_media_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->media_id = std::string(id);
        return *this;
    }

    auto with_content_type(std::string_view type) -> log_entry_builder& {
        ensure_context();
        entry_.context->content_type = std::string(type);
        return *this;
    }

    auto with_phase(std::string_view phase) -> log_entry_builder& {
        ensure_context();
        entry_.context->phase = std::string(phase);
        return *this;
    }

    auto with_total_bytes(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->total_bytes = bytes;
        return *this;
    }

    auto with_bytes_acked(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_acked = bytes;
        return *this;
    }

    auto with_chunk_index(uint32_t index) -> log_entry_builder& {
        ensure_context();
        entry_.context->chunk_index = index;
        return *this;
    }

    auto with_total_chunks(uint32_t total) -> log_entry_builder& {
        ensure_context();
        entry_.context->total_chunks = total;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        return *this;
    }

    auto with_progress_percent(double percent) -> log_entry_builder& {
        ensure_context();
        entry_.context->progress_percent = percent;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const upload_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

    [[nodiscard]] auto build_json_masked(const sensitive_info_masker& masker) const -> std::string {
        return entry_.to_json_with_masking(&masker);
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = upload_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Media upload logging interface
 */
class media_upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    media_upload_logger() = default;
    ~media_upload_logger() = default;

    media_upload_logger(const media_upload_logger&) = delete;
    media_upload_logger& operator=(const media_upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called when an uploader instance is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    /**
     * @brief Set custom log callback
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Set JSON log callback
     */
    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, message, context, file, line, function, current_masker);
        }
    }

    void flush() {
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const upload_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
        }
#else
        output_to_stderr(json_str);
#endif
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const upload_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function,
                  const sensitive_info_masker& masker) {

        std::ostringstream oss;
#if !MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
        }
#else
        output_to_stderr(oss.str());
#endif
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline media_upload_logger& get_logger() {
    static media_upload_logger instance;
    return instance;
}

// Logging macros for convenience
#define MU_LOG(level, category, message) \
    kcenon::media_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define MU_LOG_CTX(level, category, message, context) \
    kcenon::media_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define MU_LOG_TRACE(category, message) \
    MU_LOG(kcenon::media_upload::log_level::trace, category, message)

#define MU_LOG_DEBUG(category, message) \
    MU_LOG(kcenon::media_upload::log_level::debug, category, message)

#define MU_LOG_INFO(category, message) \
    MU_LOG(kcenon::media_upload::log_level::info, category, message)

#define MU_LOG_WARN(category, message) \
    MU_LOG(kcenon::media_upload::log_level::warn, category, message)

#define MU_LOG_ERROR(category, message) \
    MU_LOG(kcenon::media_upload::log_level::error, category, message)

#define MU_LOG_DEBUG_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_upload::log_level::debug, category, message, ctx)

#define MU_LOG_INFO_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_upload::log_level::info, category, message, ctx)

#define MU_LOG_WARN_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_upload::log_level::warn, category, message, ctx)

#define MU_LOG_ERROR_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_upload::log_level::error, category, message, ctx)

}  // namespace kcenon::media_upload
