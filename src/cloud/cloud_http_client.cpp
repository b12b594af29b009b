/**
 * @file cloud_http_client.cpp
 * @brief network_system HTTP client adapter
 * @version 0.1.0
 */

#include "kcenon/stylize/cloud/cloud_http_client.h"
#include "kcenon/stylize/core/logging.h"

#include "kcenon/stylize/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::stylize {

namespace {
constexpr const char* unavailable_message =
    "HTTP client not available (built without network_system)";
}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct cloud_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
        STYLIZE_LOG_WARN(log_category::transport, unavailable_message);
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response_base {
        http_response_base result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    static auto request_failed(const char* method, const std::string& url)
        -> unexpected {
        return unexpected{error{error_code::connection_failed,
            std::string("HTTP ") + method + " request failed: " + url}};
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

cloud_http_client::cloud_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

cloud_http_client::~cloud_http_client() = default;

cloud_http_client::cloud_http_client(cloud_http_client&&) noexcept = default;
auto cloud_http_client::operator=(cloud_http_client&&) noexcept
    -> cloud_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto cloud_http_client::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response_base> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(url, {}, headers);
    if (response.is_err()) {
        return impl::request_failed("GET", url);
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return unexpected{error{error_code::not_available, unavailable_message}};
#endif
}

auto cloud_http_client::put(
    const std::string& url,
    const std::vector<uint8_t>& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response_base> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string body_str(body.begin(), body.end());
    auto response = impl_->client->put(url, body_str, headers);
    if (response.is_err()) {
        return impl::request_failed("PUT", url);
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{error{error_code::not_available, unavailable_message}};
#endif
}

auto cloud_http_client::head(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response_base> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->head(url, headers);
    if (response.is_err()) {
        return impl::request_failed("HEAD", url);
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return unexpected{error{error_code::not_available, unavailable_message}};
#endif
}

auto cloud_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_cloud_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<cloud_http_client> {
    return std::make_shared<cloud_http_client>(timeout);
}

}  // namespace kcenon::stylize
