/**
 * @file transport_client.h
 * @brief Abstract HTTP transport consumed by upload sessions
 *
 * The upload engine never performs HTTP itself. Callers supply a
 * transport_client that carries credentials and talks to the network;
 * sessions only build requests and interpret responses.
 */

#ifndef KCENON_MEDIA_UPLOAD_TRANSPORT_TRANSPORT_CLIENT_H
#define KCENON_MEDIA_UPLOAD_TRANSPORT_TRANSPORT_CLIENT_H

#include "kcenon/media_upload/core/cancellation_token.h"
#include "kcenon/media_upload/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::media_upload {

/**
 * @brief Ordered form fields of a urlencoded POST
 */
using form_fields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Query parameters of a GET request
 */
using query_params = std::map<std::string, std::string>;

/**
 * @brief HTTP response as seen by the protocol layer
 */
struct transport_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Decoded response body
    std::string body;

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };

        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const noexcept -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief Per-call options forwarded to the transport
 */
struct request_options {
    /// Timeout of this single network call
    std::chrono::milliseconds timeout{30000};

    /// Token that aborts the call when cancelled
    std::optional<cancellation_token> cancellation;

    /// Extra request headers
    std::map<std::string, std::string> headers;
};

/**
 * @brief Interface of the HTTP transport
 *
 * Implementations report network failures (timeouts, refused or reset
 * connections) as transient_transport errors, and an aborted call as
 * cancelled. Any HTTP response, whatever its status code, is a value.
 * Implementations must be safe to call from several threads at once.
 */
class transport_client {
public:
    virtual ~transport_client() = default;

    /**
     * @brief POST application/x-www-form-urlencoded fields
     */
    [[nodiscard]] virtual auto post_form(const std::string& url,
                                         const form_fields& fields,
                                         const request_options& options)
        -> result<transport_response> = 0;

    /**
     * @brief POST a JSON document
     */
    [[nodiscard]] virtual auto post_json(const std::string& url,
                                         const std::string& body,
                                         const request_options& options)
        -> result<transport_response> = 0;

    /**
     * @brief GET with query parameters
     */
    [[nodiscard]] virtual auto get_json(const std::string& url,
                                        const query_params& query,
                                        const request_options& options)
        -> result<transport_response> = 0;

    /**
     * @brief Whether the transport carries credentials
     */
    [[nodiscard]] virtual auto is_authenticated() const -> bool { return true; }
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_TRANSPORT_TRANSPORT_CLIENT_H
