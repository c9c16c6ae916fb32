/**
 * @file network_transport_client.cpp
 * @brief network_system backed transport implementation
 */

#include "kcenon/media_upload/transport/network_transport_client.h"

#include "kcenon/media_upload/config/feature_flags.h"
#include "kcenon/media_upload/core/logging.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <unordered_map>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::media_upload {

namespace {

auto lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

[[maybe_unused]] auto merge_headers(const std::map<std::string, std::string>& defaults,
                   const std::map<std::string, std::string>& extra)
    -> std::map<std::string, std::string> {
    auto merged = defaults;
    for (const auto& [k, v] : extra) {
        merged[k] = v;
    }
    return merged;
}

auto cancelled_before_send(const request_options& options) -> bool {
    return options.cancellation && options.cancellation->is_cancelled();
}

}  // namespace

auto url_encode(const std::string& value) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto encode_form(const form_fields& fields) -> std::string {
    std::string body;
    for (const auto& [name, value] : fields) {
        if (!body.empty()) {
            body += '&';
        }
        body += url_encode(name);
        body += '=';
        body += url_encode(value);
    }
    return body;
}

// ============================================================================
// Implementation
// ============================================================================

struct network_transport_client::impl {
    /// Clients kept for timeouts other than the default one
    static constexpr std::size_t max_cached_clients = 16;

#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
    std::unordered_map<int64_t, std::shared_ptr<kcenon::network::core::http_client>>
        clients_by_timeout;
    std::mutex clients_mutex;
#endif
    std::map<std::string, std::string> default_headers;
    std::chrono::milliseconds default_timeout;
    bool available = false;

    impl(std::map<std::string, std::string> headers, std::chrono::milliseconds timeout)
        : default_headers(std::move(headers)), default_timeout(timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    // The HTTP client takes its timeout at construction, so each distinct
    // per-call timeout gets its own client
    auto client_for(std::chrono::milliseconds timeout)
        -> std::shared_ptr<kcenon::network::core::http_client> {
        if (timeout == default_timeout) {
            return client;
        }

        std::lock_guard lock(clients_mutex);
        auto it = clients_by_timeout.find(timeout.count());
        if (it != clients_by_timeout.end()) {
            return it->second;
        }
        if (clients_by_timeout.size() >= max_cached_clients) {
            clients_by_timeout.clear();
        }
        auto created = std::make_shared<kcenon::network::core::http_client>(timeout);
        clients_by_timeout.emplace(timeout.count(), created);
        return created;
    }
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> transport_response {
        transport_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::string(resp.body.begin(), resp.body.end());
        return result;
    }
#endif

    static auto not_available() -> unexpected {
        return unexpected{error{error_code::transient_transport,
            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
    }

    static auto cancelled() -> unexpected {
        return unexpected{error{error_code::cancelled, "request cancelled"}};
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_transport_client::network_transport_client(
    std::map<std::string, std::string> default_headers,
    std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(std::move(default_headers), timeout)) {}

network_transport_client::~network_transport_client() = default;

network_transport_client::network_transport_client(network_transport_client&&) noexcept =
    default;
auto network_transport_client::operator=(network_transport_client&&) noexcept
    -> network_transport_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_transport_client::post_form(const std::string& url,
                                         const form_fields& fields,
                                         const request_options& options)
    -> result<transport_response> {
    if (cancelled_before_send(options)) {
        return impl::cancelled();
    }
#if KCENON_WITH_NETWORK_SYSTEM
    auto headers = merge_headers(impl_->default_headers, options.headers);
    headers["Content-Type"] = "application/x-www-form-urlencoded";

    auto client = impl_->client_for(effective_timeout(options));
    auto response = client->post(url, encode_form(fields), headers);
    if (response.is_err()) {
        MU_LOG_WARN(log_category::transport, "HTTP POST request failed: " + url);
        return unexpected{error{error_code::transient_transport,
            "HTTP POST request failed"}};
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)fields;
    return impl::not_available();
#endif
}

auto network_transport_client::post_json(const std::string& url,
                                         const std::string& body,
                                         const request_options& options)
    -> result<transport_response> {
    if (cancelled_before_send(options)) {
        return impl::cancelled();
    }
#if KCENON_WITH_NETWORK_SYSTEM
    auto headers = merge_headers(impl_->default_headers, options.headers);
    headers["Content-Type"] = "application/json";

    auto client = impl_->client_for(effective_timeout(options));
    auto response = client->post(url, body, headers);
    if (response.is_err()) {
        MU_LOG_WARN(log_category::transport, "HTTP POST request failed: " + url);
        return unexpected{error{error_code::transient_transport,
            "HTTP POST request failed"}};
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)body;
    return impl::not_available();
#endif
}

auto network_transport_client::get_json(const std::string& url,
                                        const query_params& query,
                                        const request_options& options)
    -> result<transport_response> {
    if (cancelled_before_send(options)) {
        return impl::cancelled();
    }
#if KCENON_WITH_NETWORK_SYSTEM
    auto headers = merge_headers(impl_->default_headers, options.headers);

    auto client = impl_->client_for(effective_timeout(options));
    auto response = client->get(url, query, headers);
    if (response.is_err()) {
        MU_LOG_WARN(log_category::transport, "HTTP GET request failed: " + url);
        return unexpected{error{error_code::transient_transport,
            "HTTP GET request failed"}};
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)query;
    return impl::not_available();
#endif
}

auto network_transport_client::is_authenticated() const -> bool {
    for (const auto& [k, v] : impl_->default_headers) {
        auto key = lower(k);
        if ((key == "cookie" || key == "authorization") && !v.empty()) {
            return true;
        }
    }
    return false;
}

auto network_transport_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto network_transport_client::effective_timeout(const request_options& options) const
    -> std::chrono::milliseconds {
    if (options.timeout.count() > 0) {
        return options.timeout;
    }
    return impl_->default_timeout;
}

}  // namespace kcenon::media_upload
