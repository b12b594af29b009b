/**
 * @file request_signer.h
 * @brief AWS Signature Version 4 signing for S3 object requests
 * @version 0.1.0
 */

#ifndef KCENON_STYLIZE_CLOUD_REQUEST_SIGNER_H
#define KCENON_STYLIZE_CLOUD_REQUEST_SIGNER_H

#include "cloud_config.h"
#include "cloud_credentials.h"
#include "kcenon/stylize/core/types.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::stylize {

/**
 * @brief HTTP methods used against the object API
 */
enum class http_method {
    get,
    put,
    head
};

[[nodiscard]] constexpr auto to_string(http_method method) noexcept -> std::string_view {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::head: return "HEAD";
        default: return "GET";
    }
}

/**
 * @brief Unsigned description of one object request
 */
struct request_descriptor {
    http_method method = http_method::get;
    std::string bucket;
    /// Object key; never begins with '/'
    std::string key;
    /// Additional headers; names are lower-cased during signing
    std::map<std::string, std::string> headers;
    std::optional<std::vector<uint8_t>> body;
};

/**
 * @brief Request ready to be sent
 *
 * Header names are lower-case except "Authorization". A signed request is
 * valid for one send only.
 */
struct signed_request {
    http_method method = http_method::get;
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::vector<uint8_t>> body;
};

/**
 * @brief Intermediate products of one signature computation
 */
struct signing_details {
    std::string amz_date;
    std::string date_stamp;
    std::string payload_hash;
    std::string credential_scope;
    std::map<std::string, std::string> canonical_headers;
    std::string signed_headers;
    std::string canonical_request;
    std::string string_to_sign;
    std::string signature;
    std::string authorization;
};

/**
 * @brief Stateless SigV4 signer bound to one set of credentials
 *
 * The signing time is an explicit argument so that a signature can be
 * reproduced from its inputs.
 */
class request_signer {
public:
    static constexpr std::string_view algorithm = "AWS4-HMAC-SHA256";
    static constexpr std::string_view terminator = "aws4_request";

    request_signer(credentials creds, s3_endpoint_config endpoint = {});

    /**
     * @brief Sign a request at the given instant
     * @return Signed request, or a validation error for blank credentials,
     *         a blank bucket, or a key that is empty or starts with '/'
     */
    [[nodiscard]] auto sign(const request_descriptor& desc,
                            std::chrono::system_clock::time_point when) const
        -> result<signed_request>;

    /**
     * @brief Compute every intermediate signing product without building a request
     */
    [[nodiscard]] auto compute(const request_descriptor& desc,
                               std::chrono::system_clock::time_point when) const
        -> result<signing_details>;

    /**
     * @brief Virtual-hosted URL for bucket and key
     */
    [[nodiscard]] auto object_url(const std::string& bucket, const std::string& key) const
        -> std::string;

    [[nodiscard]] auto region() const -> const std::string& { return creds_.region; }

    // ------------------------------------------------------------------------
    // Signing steps
    // ------------------------------------------------------------------------

    /**
     * @brief "name:value\n" lines for lower-cased names in byte order
     */
    [[nodiscard]] static auto canonical_header_block(
        const std::map<std::string, std::string>& headers) -> std::string;

    /**
     * @brief Lower-cased header names in byte order joined by ';'
     */
    [[nodiscard]] static auto signed_header_list(
        const std::map<std::string, std::string>& headers) -> std::string;

    [[nodiscard]] static auto canonical_request(std::string_view method,
                                                const std::string& encoded_path,
                                                const std::string& header_block,
                                                const std::string& signed_headers,
                                                const std::string& payload_hash)
        -> std::string;

    [[nodiscard]] static auto credential_scope(const std::string& date_stamp,
                                               const std::string& region,
                                               const std::string& service)
        -> std::string;

    [[nodiscard]] static auto string_to_sign(const std::string& amz_date,
                                             const std::string& scope,
                                             const std::string& canonical_request)
        -> std::string;

    /**
     * @brief HMAC chain "AWS4"+secret -> date -> region -> service -> aws4_request
     */
    [[nodiscard]] static auto derive_signing_key(const std::string& secret_access_key,
                                                 const std::string& date_stamp,
                                                 const std::string& region,
                                                 const std::string& service)
        -> std::vector<uint8_t>;

private:
    [[nodiscard]] auto validate(const request_descriptor& desc) const -> result<void>;
    [[nodiscard]] auto host_for(const std::string& bucket) const -> std::string;

    credentials creds_;
    s3_endpoint_config endpoint_;
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CLOUD_REQUEST_SIGNER_H
