/**
 * @file cloud_error.h
 * @brief Classification of S3 failures (-800 to -899 range)
 * @version 0.1.0
 *
 * Transport failures surface as error_code::transport_error with the HTTP
 * status attached. The categories below give those statuses a readable name
 * for log messages and let callers branch on the failure class.
 */

#ifndef KCENON_STYLIZE_CLOUD_CLOUD_ERROR_H
#define KCENON_STYLIZE_CLOUD_CLOUD_ERROR_H

#include <cstdint>
#include <string_view>

namespace kcenon::stylize {

/**
 * @brief Error categories for object storage operations (-800 to -899)
 *
 * Error code ranges:
 * - -800 to -809: Authentication Errors
 * - -810 to -819: Authorization Errors
 * - -820 to -829: Connection/Network Errors
 * - -830 to -839: Bucket Errors
 * - -840 to -849: Object Errors
 * - -870 to -879: Provider-specific Errors
 */
enum class cloud_error_code : int32_t {
    success = 0,

    // Authentication Errors (-800 to -809)
    auth_failed = -800,              ///< Signature or credentials rejected
    auth_expired = -801,             ///< Session token or request time expired

    // Authorization Errors (-810 to -819)
    access_denied = -810,            ///< Access denied to resource

    // Connection/Network Errors (-820 to -829)
    connection_failed = -820,        ///< No HTTP response was received
    connection_timeout = -821,       ///< Request timed out
    service_unavailable = -826,      ///< Service temporarily unavailable
    rate_limited = -827,             ///< Request rate limited

    // Bucket Errors (-830 to -839)
    bucket_not_found = -830,         ///< Bucket not found

    // Object Errors (-840 to -849)
    object_not_found = -840,         ///< Object not found
    precondition_failed = -848,      ///< Conditional request failed

    // Provider-specific Errors (-870 to -879)
    s3_error = -871,                 ///< Any other S3 error response
};

/**
 * @brief Convert cloud_error_code to string
 */
[[nodiscard]] constexpr auto to_string(cloud_error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case cloud_error_code::success:
            return "success";
        case cloud_error_code::auth_failed:
            return "authentication failed";
        case cloud_error_code::auth_expired:
            return "authentication token expired";
        case cloud_error_code::access_denied:
            return "access denied to resource";
        case cloud_error_code::connection_failed:
            return "failed to connect to storage service";
        case cloud_error_code::connection_timeout:
            return "connection timeout";
        case cloud_error_code::service_unavailable:
            return "storage service temporarily unavailable";
        case cloud_error_code::rate_limited:
            return "request rate limited";
        case cloud_error_code::bucket_not_found:
            return "bucket not found";
        case cloud_error_code::object_not_found:
            return "object not found";
        case cloud_error_code::precondition_failed:
            return "precondition failed";
        case cloud_error_code::s3_error:
            return "S3 error";
        default:
            return "unknown cloud error";
    }
}

/**
 * @brief Map an HTTP status returned by S3 to an error category
 *
 * 2xx maps to success. 404 maps to object_not_found, which the polling loop
 * treats as "not ready yet" rather than a failure.
 */
[[nodiscard]] constexpr auto classify_http_status(int status_code) noexcept
    -> cloud_error_code {
    if (status_code >= 200 && status_code < 300) {
        return cloud_error_code::success;
    }
    switch (status_code) {
        case 401:
            return cloud_error_code::auth_failed;
        case 403:
            return cloud_error_code::access_denied;
        case 404:
            return cloud_error_code::object_not_found;
        case 408:
            return cloud_error_code::connection_timeout;
        case 412:
            return cloud_error_code::precondition_failed;
        case 429:
            return cloud_error_code::rate_limited;
        case 503:
            return cloud_error_code::service_unavailable;
        default:
            return cloud_error_code::s3_error;
    }
}

/**
 * @brief Check if error code is in authentication or authorization range
 */
[[nodiscard]] constexpr auto is_auth_error(int32_t code) noexcept -> bool {
    return code <= -800 && code >= -819;
}

/**
 * @brief Check if error code is in connection/network error range
 */
[[nodiscard]] constexpr auto is_cloud_connection_error(int32_t code) noexcept -> bool {
    return code <= -820 && code >= -829;
}

/**
 * @brief Check if error is a server-side issue
 */
[[nodiscard]] constexpr auto is_cloud_server_error(int32_t code) noexcept -> bool {
    return code == static_cast<int32_t>(cloud_error_code::service_unavailable) ||
           code == static_cast<int32_t>(cloud_error_code::rate_limited);
}

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CLOUD_CLOUD_ERROR_H
