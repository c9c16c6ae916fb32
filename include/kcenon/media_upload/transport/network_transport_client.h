/**
 * @file network_transport_client.h
 * @brief transport_client adapter over the network_system HTTP client
 *
 * Available only when built with KCENON_WITH_NETWORK_SYSTEM; otherwise
 * every call fails with a transport error stating that the client is not
 * available.
 */

#ifndef KCENON_MEDIA_UPLOAD_TRANSPORT_NETWORK_TRANSPORT_CLIENT_H
#define KCENON_MEDIA_UPLOAD_TRANSPORT_NETWORK_TRANSPORT_CLIENT_H

#include "kcenon/media_upload/transport/transport_client.h"

#include <chrono>
#include <map>
#include <memory>
#include <string>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::media_upload {

/**
 * @brief HTTP transport backed by kcenon::network::core::http_client
 *
 * Credentials are attached as default headers (for example a cookie and
 * a CSRF token) and sent with every request.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class network_transport_client : public transport_client {
public:
    /**
     * @brief Construct transport
     * @param default_headers Headers sent with every request
     * @param timeout Default request timeout of the underlying client
     */
    explicit network_transport_client(
        std::map<std::string, std::string> default_headers = {},
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_transport_client() override;

    network_transport_client(const network_transport_client&) = delete;
    auto operator=(const network_transport_client&) -> network_transport_client& = delete;
    network_transport_client(network_transport_client&&) noexcept;
    auto operator=(network_transport_client&&) noexcept -> network_transport_client&;

    [[nodiscard]] auto post_form(const std::string& url,
                                 const form_fields& fields,
                                 const request_options& options)
        -> result<transport_response> override;

    [[nodiscard]] auto post_json(const std::string& url,
                                 const std::string& body,
                                 const request_options& options)
        -> result<transport_response> override;

    [[nodiscard]] auto get_json(const std::string& url,
                                const query_params& query,
                                const request_options& options)
        -> result<transport_response> override;

    /**
     * @brief True when default headers carry a cookie or authorization
     */
    [[nodiscard]] auto is_authenticated() const -> bool override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network system is available, false otherwise
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

    /**
     * @brief Timeout a request with these options is sent with
     *
     * options.timeout when positive, the constructor timeout otherwise.
     */
    [[nodiscard]] auto effective_timeout(const request_options& options) const
        -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Encode fields as application/x-www-form-urlencoded
 */
[[nodiscard]] auto encode_form(const form_fields& fields) -> std::string;

/**
 * @brief URL encode a string (RFC 3986 unreserved characters kept)
 */
[[nodiscard]] auto url_encode(const std::string& value) -> std::string;

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_TRANSPORT_NETWORK_TRANSPORT_CLIENT_H
