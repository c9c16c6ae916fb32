/**
 * @file upload_protocol.cpp
 * @brief Implementation of the upload wire format
 */

#include "kcenon/media_upload/protocol/upload_protocol.h"

#include "kcenon/media_upload/core/logging.h"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace kcenon::media_upload {

namespace {

constexpr char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::size_t max_detail_length = 200;

// ============================================================================
// JSON Utilities
// ============================================================================

/**
 * @brief Position of the first character of key's value, or npos
 */
auto find_value_start(const std::string& json, const std::string& key) -> std::size_t {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::string::npos;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + search.length());
    if (pos == std::string::npos || json[pos] != ':') {
        return std::string::npos;
    }

    return json.find_first_not_of(" \t\n\r", pos + 1);
}

auto parse_hex4(std::string_view input, std::size_t pos) -> std::optional<uint32_t> {
    if (pos + 4 > input.size()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (std::size_t i = pos; i < pos + 4; ++i) {
        auto c = static_cast<unsigned char>(input[i]);
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= c - '0';
        } else if (c >= 'a' && c <= 'f') {
            value |= c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            value |= c - 'A' + 10;
        } else {
            return std::nullopt;
        }
    }
    return value;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto unescape_json_string(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.size()) {
            result += input[i];
            continue;
        }
        switch (input[++i]) {
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'u': {
                auto unit = parse_hex4(input, i + 1);
                if (!unit) {
                    result += input[i];
                    break;
                }
                i += 4;
                uint32_t cp = *unit;
                // High surrogate followed by \uDC00-\uDFFF forms one code point
                if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < input.size() &&
                    input[i + 1] == '\\' && input[i + 2] == 'u') {
                    auto low = parse_hex4(input, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                if (cp >= 0xD800 && cp <= 0xDFFF) {
                    cp = 0xFFFD;
                }
                append_utf8(result, cp);
                break;
            }
            default: result += input[i]; break;
        }
    }

    return result;
}

/**
 * @brief Index just past the closing quote of the string opening at pos
 */
auto skip_string(const std::string& json, std::size_t pos) -> std::size_t {
    auto end_pos = pos + 1;
    while (end_pos < json.size()) {
        if (json[end_pos] == '\\') {
            end_pos += 2;
            continue;
        }
        if (json[end_pos] == '"') {
            return end_pos + 1;
        }
        ++end_pos;
    }
    return std::string::npos;
}

auto extract_json_string(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos || json[pos] != '"') {
        return std::nullopt;
    }

    auto end_pos = skip_string(json, pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return unescape_json_string(std::string_view(json).substr(pos + 1, end_pos - pos - 2));
}

/**
 * @brief Raw text of a numeric value
 */
auto extract_json_number(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    auto end_pos = json.find_first_not_of("0123456789+-.eE", pos);
    if (end_pos == pos) {
        return std::nullopt;
    }
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    return json.substr(pos, end_pos - pos);
}

/**
 * @brief Text of a nested object including its braces
 */
auto extract_json_object(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos || json[pos] != '{') {
        return std::nullopt;
    }

    int depth = 0;
    auto i = pos;
    while (i < json.size()) {
        char c = json[i];
        if (c == '"') {
            i = skip_string(json, i);
            if (i == std::string::npos) {
                return std::nullopt;
            }
            continue;
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return json.substr(pos, i - pos + 1);
            }
        }
        ++i;
    }
    return std::nullopt;
}

template <typename T>
auto parse_integer(const std::optional<std::string>& text) -> std::optional<T> {
    if (!text) {
        return std::nullopt;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_double(const std::optional<std::string>& text) -> std::optional<double> {
    if (!text) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text->c_str(), &end);
    if (end != text->c_str() + text->size()) {
        return std::nullopt;
    }
    return value;
}

auto is_json_object(const std::string& body) -> bool {
    auto pos = body.find_first_not_of(" \t\n\r");
    return pos != std::string::npos && body[pos] == '{';
}

/**
 * @brief media_id_string, or the numeric media_id
 */
auto extract_media_id(const std::string& json) -> std::optional<std::string> {
    if (auto id = extract_json_string(json, "media_id_string"); id && !id->empty()) {
        return id;
    }
    if (auto id = extract_json_number(json, "media_id")) {
        return id;
    }
    if (auto id = extract_json_string(json, "media_id"); id && !id->empty()) {
        return id;
    }
    return std::nullopt;
}

auto malformed(upload_phase phase, std::string_view operation, std::string_view what)
    -> unexpected {
    return unexpected(error{error_code::unknown_server, phase,
                            std::string(operation) + " response malformed: " +
                                std::string(what)});
}

auto parse_processing_info(const std::string& object, upload_phase phase,
                           std::string_view operation) -> result<processing_status> {
    auto token = extract_json_string(object, "state");
    if (!token) {
        return malformed(phase, operation, "processing_info without state");
    }
    auto state = parse_processing_state(*token);
    if (!state) {
        return malformed(phase, operation, "unknown processing state '" + *token + "'");
    }

    processing_status status;
    status.state = *state;
    status.progress_percent = parse_double(extract_json_number(object, "progress_percent"));
    status.check_after_secs =
        parse_integer<uint32_t>(extract_json_number(object, "check_after_secs"));

    if (auto err = extract_json_object(object, "error")) {
        status.error_detail = extract_json_string(*err, "message");
        if (!status.error_detail) {
            status.error_detail = extract_json_string(*err, "name");
        }
    }

    return status;
}

auto error_detail(const transport_response& response) -> std::string {
    if (auto message = extract_json_string(response.body, "message")) {
        return *message;
    }
    if (response.body.size() > max_detail_length) {
        return response.body.substr(0, max_detail_length) + "...";
    }
    return response.body;
}

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

auto parse_processing_state(std::string_view token) -> std::optional<processing_state> {
    if (token == "pending") return processing_state::pending;
    if (token == "in_progress") return processing_state::in_progress;
    if (token == "succeeded") return processing_state::succeeded;
    if (token == "failed") return processing_state::failed;
    return std::nullopt;
}

auto base64_encode(std::span<const std::byte> data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

// ============================================================================
// Requests
// ============================================================================

auto upload_protocol::make_init_fields(const media_asset& asset) -> form_fields {
    return {
        {"command", "INIT"},
        {"total_bytes", std::to_string(asset.size())},
        {"media_type", asset.content_type()},
        {"media_category",
         std::string(server_category_token(asset.category(), asset.context()))},
    };
}

auto upload_protocol::make_append_fields(const std::string& media_id,
                                         uint32_t segment_index,
                                         std::span<const std::byte> chunk) -> form_fields {
    return {
        {"command", "APPEND"},
        {"media_id", media_id},
        {"segment_index", std::to_string(segment_index)},
        {"media_data", base64_encode(chunk)},
    };
}

auto upload_protocol::make_finalize_fields(const std::string& media_id) -> form_fields {
    return {
        {"command", "FINALIZE"},
        {"media_id", media_id},
    };
}

auto upload_protocol::make_status_query(const std::string& media_id) -> query_params {
    return {
        {"command", "STATUS"},
        {"media_id", media_id},
    };
}

auto upload_protocol::make_metadata_body(const std::string& media_id,
                                         const std::string& alt_text) -> std::string {
    std::ostringstream oss;
    oss << "{\"media_id\":\"" << detail::escape_json_string(media_id) << "\","
        << "\"alt_text\":{\"text\":\"" << detail::escape_json_string(alt_text) << "\"}}";
    return oss.str();
}

// ============================================================================
// Responses
// ============================================================================

auto upload_protocol::classify_status(int status_code) noexcept -> error_code {
    if (status_code >= 200 && status_code < 300) {
        return error_code::success;
    }
    switch (status_code) {
        case 401:
        case 403:
            return error_code::auth_required;
        case 413:
            return error_code::payload_too_large;
        case 408:
        case 429:
            return error_code::transient_transport;
        default:
            break;
    }
    if (status_code >= 500 && status_code < 600) {
        return error_code::transient_transport;
    }
    return error_code::unknown_server;
}

auto upload_protocol::check_response(const transport_response& response,
                                     upload_phase phase,
                                     std::string_view operation) -> result<void> {
    auto code = classify_status(response.status_code);
    if (code == error_code::success) {
        return {};
    }

    std::string message = std::string(operation) + " failed with HTTP " +
                          std::to_string(response.status_code);
    auto detail = error_detail(response);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return unexpected(error{code, phase, std::move(message)});
}

auto upload_protocol::parse_init(const transport_response& response)
    -> result<init_response> {
    if (!is_json_object(response.body)) {
        return malformed(upload_phase::idle, "INIT", "body is not a JSON object");
    }

    auto media_id = extract_media_id(response.body);
    if (!media_id) {
        return malformed(upload_phase::idle, "INIT", "no media_id_string");
    }

    init_response init;
    init.media_id = std::move(*media_id);
    if (auto secs = parse_integer<int64_t>(
            extract_json_number(response.body, "expires_after_secs"));
        secs && *secs > 0) {
        init.expires_after = std::chrono::seconds(*secs);
    }
    return init;
}

auto upload_protocol::parse_finalize(const transport_response& response)
    -> result<finalize_response> {
    if (!is_json_object(response.body)) {
        return malformed(upload_phase::finalizing, "FINALIZE", "body is not a JSON object");
    }

    // Read processing_info first so that its nested keys are not mistaken
    // for top-level ones below
    std::string top_level = response.body;
    finalize_response finalize;

    if (auto info = extract_json_object(response.body, "processing_info")) {
        auto status = parse_processing_info(*info, upload_phase::finalizing, "FINALIZE");
        if (!status) {
            return unexpected(status.error());
        }
        finalize.processing = std::move(status.value());
        top_level.erase(top_level.find(*info), info->size());
    }

    auto media_id = extract_media_id(top_level);
    if (!media_id) {
        return malformed(upload_phase::finalizing, "FINALIZE", "no media_id");
    }
    finalize.media_id = std::move(*media_id);
    finalize.media_key = extract_json_string(top_level, "media_key");
    finalize.size = parse_integer<uint64_t>(extract_json_number(top_level, "size"));

    if (auto image = extract_json_object(top_level, "image")) {
        auto w = parse_integer<uint32_t>(extract_json_number(*image, "w"));
        auto h = parse_integer<uint32_t>(extract_json_number(*image, "h"));
        if (w && h) {
            finalize.dimensions = media_dimensions{*w, *h};
        }
    }

    return finalize;
}

auto upload_protocol::parse_status(const transport_response& response)
    -> result<status_response> {
    if (!is_json_object(response.body)) {
        return malformed(upload_phase::processing, "STATUS", "body is not a JSON object");
    }

    status_response status;
    if (auto info = extract_json_object(response.body, "processing_info")) {
        auto parsed = parse_processing_info(*info, upload_phase::processing, "STATUS");
        if (!parsed) {
            return unexpected(parsed.error());
        }
        status.processing = std::move(parsed.value());
    }
    return status;
}

}  // namespace kcenon::media_upload
