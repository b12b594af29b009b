/**
 * @file cloud_http_client.h
 * @brief HTTP client abstraction used by the S3 transport
 * @version 0.1.0
 *
 * The transport talks to S3 through http_client_interface_base so tests can
 * substitute a scripted client. cloud_http_client is the production adapter
 * over the network_system HTTP client.
 */

#ifndef KCENON_STYLIZE_CLOUD_CLOUD_HTTP_CLIENT_H
#define KCENON_STYLIZE_CLOUD_CLOUD_HTTP_CLIENT_H

#include "kcenon/stylize/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::stylize {

// ============================================================================
// HTTP Response
// ============================================================================

/**
 * @brief HTTP response as seen by the transport
 */
struct http_response_base {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    /**
     * @brief Get body as string
     */
    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

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
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };

        std::string lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }

        return std::nullopt;
    }

    /**
     * @brief Check if response indicates success (2xx)
     */
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

// ============================================================================
// HTTP Client Interface
// ============================================================================

/**
 * @brief HTTP operations needed by the S3 transport
 *
 * Implementations return an error only when no HTTP response was obtained.
 * Any response, including 4xx and 5xx, is returned as a value.
 */
class http_client_interface_base {
public:
    virtual ~http_client_interface_base() = default;

    /**
     * @brief Execute GET request
     */
    virtual auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> = 0;

    /**
     * @brief Execute PUT request with binary body
     */
    virtual auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> = 0;

    /**
     * @brief Execute HEAD request
     */
    virtual auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> = 0;
};

// ============================================================================
// Production client
// ============================================================================

/**
 * @brief HTTP client backed by network_system
 *
 * Available only when built with BUILD_WITH_NETWORK_SYSTEM; otherwise every
 * call fails with error_code::not_available.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class cloud_http_client : public http_client_interface_base {
public:
    /**
     * @brief Construct HTTP client with timeout
     * @param timeout Request timeout duration
     */
    explicit cloud_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~cloud_http_client() override;

    cloud_http_client(const cloud_http_client&) = delete;
    auto operator=(const cloud_http_client&) -> cloud_http_client& = delete;
    cloud_http_client(cloud_http_client&&) noexcept;
    auto operator=(cloud_http_client&&) noexcept -> cloud_http_client&;

    [[nodiscard]] auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> override;

    [[nodiscard]] auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> override;

    [[nodiscard]] auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response_base> override;

    /**
     * @brief Check if the underlying network client is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the production HTTP client
 */
[[nodiscard]] auto make_cloud_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<cloud_http_client>;

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CLOUD_CLOUD_HTTP_CLIENT_H
