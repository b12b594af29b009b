/**
 * @file s3_transport.h
 * @brief Signed PUT/HEAD/GET against the S3 object API
 * @version 0.1.0
 */

#ifndef KCENON_STYLIZE_CLOUD_S3_TRANSPORT_H
#define KCENON_STYLIZE_CLOUD_S3_TRANSPORT_H

#include "cloud_config.h"
#include "cloud_credentials.h"
#include "cloud_error.h"
#include "cloud_http_client.h"
#include "request_signer.h"
#include "kcenon/stylize/core/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::stylize {

/**
 * @brief Result of a successful PUT
 */
struct put_object_result {
    int status_code = 0;
    std::optional<std::string> etag;
};

/**
 * @brief Result of a successful HEAD
 */
struct head_object_result {
    int status_code = 0;
    std::optional<std::string> content_type;
    std::optional<uint64_t> content_length;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Result of a successful GET
 */
struct get_object_result {
    int status_code = 0;
    std::vector<uint8_t> body;
    std::optional<std::string> content_type;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Executes signed object requests
 *
 * Every call signs a fresh request with the current time from the injected
 * clock. Errors:
 * - no HTTP response: error_code::connection_failed, no http_status
 * - 404: error_code::object_not_found, http_status 404
 * - any other non-2xx: error_code::transport_error with http_status
 */
class s3_transport {
public:
    using clock_function = std::function<std::chrono::system_clock::time_point()>;

    s3_transport(credentials creds,
                 std::shared_ptr<http_client_interface_base> http_client,
                 s3_endpoint_config endpoint = {},
                 clock_function clock = nullptr);

    [[nodiscard]] auto put(const request_descriptor& desc) -> result<put_object_result>;
    [[nodiscard]] auto head(const request_descriptor& desc) -> result<head_object_result>;
    [[nodiscard]] auto get(const request_descriptor& desc) -> result<get_object_result>;

    /**
     * @brief Upload bytes with a content type and user metadata
     * @param metadata Names without the "x-amz-meta-" prefix
     */
    [[nodiscard]] auto put_object(const std::string& bucket,
                                  const std::string& key,
                                  std::vector<uint8_t> body,
                                  const std::string& content_type,
                                  const std::map<std::string, std::string>& metadata = {})
        -> result<put_object_result>;

    [[nodiscard]] auto head_object(const std::string& bucket, const std::string& key)
        -> result<head_object_result>;

    [[nodiscard]] auto get_object(const std::string& bucket, const std::string& key)
        -> result<get_object_result>;

    [[nodiscard]] auto signer() const -> const request_signer& { return signer_; }

private:
    [[nodiscard]] auto execute(const request_descriptor& desc) -> result<http_response_base>;

    request_signer signer_;
    std::shared_ptr<http_client_interface_base> http_client_;
    clock_function clock_;
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CLOUD_S3_TRANSPORT_H
