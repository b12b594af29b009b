/**
 * @file request_signer.cpp
 * @brief AWS Signature Version 4 implementation
 * @version 0.1.0
 */

#include "kcenon/stylize/cloud/request_signer.h"
#include "kcenon/stylize/cloud/cloud_utils.h"
#include "kcenon/stylize/core/logging.h"

#include <sstream>

namespace kcenon::stylize {

using namespace cloud_utils;

request_signer::request_signer(credentials creds, s3_endpoint_config endpoint)
    : creds_(creds.trimmed()), endpoint_(std::move(endpoint)) {}

auto request_signer::validate(const request_descriptor& desc) const -> result<void> {
    if (!creds_.is_complete()) {
        return unexpected{error{error_code::missing_credentials,
            "Region, access key ID and secret access key are required"}};
    }
    if (trim(desc.bucket).empty()) {
        return unexpected{error{error_code::validation_failed,
            "Bucket name is required"}};
    }
    if (desc.key.empty() || desc.key.front() == '/') {
        return unexpected{error{error_code::invalid_object_key,
            "Object key must be non-empty and must not start with '/': " + desc.key}};
    }
    return {};
}

auto request_signer::host_for(const std::string& bucket) const -> std::string {
    return trim(bucket) + "." + endpoint_.host_for_region(creds_.region);
}

auto request_signer::object_url(const std::string& bucket, const std::string& key) const
    -> std::string {
    return endpoint_.scheme + "://" + host_for(bucket) + "/" + encode_object_key(key);
}

auto request_signer::compute(const request_descriptor& desc,
                             std::chrono::system_clock::time_point when) const
    -> result<signing_details> {
    auto valid = validate(desc);
    if (!valid) {
        return unexpected{valid.error()};
    }

    signing_details details;
    details.amz_date = format_amz_date(when);
    details.date_stamp = format_date_stamp(when);
    details.payload_hash = desc.body && !desc.body->empty()
        ? sha256_hex(std::span<const uint8_t>(*desc.body))
        : std::string(EMPTY_PAYLOAD_SHA256);

    // Caller headers first, then the mandatory ones overwrite same-named entries
    for (const auto& [name, value] : desc.headers) {
        details.canonical_headers[to_lower(trim(name))] = trim(value);
    }
    details.canonical_headers["host"] = host_for(desc.bucket);
    details.canonical_headers["x-amz-content-sha256"] = details.payload_hash;
    details.canonical_headers["x-amz-date"] = details.amz_date;
    if (creds_.session_token) {
        details.canonical_headers["x-amz-security-token"] = *creds_.session_token;
    }

    details.signed_headers = signed_header_list(details.canonical_headers);
    details.canonical_request = canonical_request(
        to_string(desc.method),
        "/" + encode_object_key(desc.key),
        canonical_header_block(details.canonical_headers),
        details.signed_headers,
        details.payload_hash);

    details.credential_scope =
        credential_scope(details.date_stamp, creds_.region, endpoint_.service);
    details.string_to_sign = string_to_sign(
        details.amz_date, details.credential_scope, details.canonical_request);

    auto signing_key = derive_signing_key(
        creds_.secret_access_key, details.date_stamp, creds_.region, endpoint_.service);
    details.signature = bytes_to_hex(hmac_sha256(signing_key, details.string_to_sign));

    std::ostringstream auth_header;
    auth_header << algorithm << " ";
    auth_header << "Credential=" << creds_.access_key_id << "/" << details.credential_scope << ", ";
    auth_header << "SignedHeaders=" << details.signed_headers << ", ";
    auth_header << "Signature=" << details.signature;
    details.authorization = auth_header.str();

    return details;
}

auto request_signer::sign(const request_descriptor& desc,
                          std::chrono::system_clock::time_point when) const
    -> result<signed_request> {
    auto details = compute(desc, when);
    if (!details) {
        STYLIZE_LOG_WARN(log_category::signer,
                         "Refusing to sign request: " + details.error().message);
        return unexpected{details.error()};
    }

    signed_request request;
    request.method = desc.method;
    request.url = object_url(desc.bucket, desc.key);
    request.headers = std::move(details.value().canonical_headers);
    request.headers["Authorization"] = std::move(details.value().authorization);
    request.body = desc.body;

    if (get_logger().is_enabled(log_level::trace)) {
        workflow_log_context ctx;
        ctx.bucket = trim(desc.bucket);
        ctx.object_key = desc.key;
        ctx.method = std::string(to_string(desc.method));
        STYLIZE_LOG_CTX(log_level::trace, log_category::signer,
                        "Signed request at " + details.value().amz_date, ctx);
    }

    return request;
}

// ============================================================================
// Signing steps
// ============================================================================

auto request_signer::canonical_header_block(
    const std::map<std::string, std::string>& headers) -> std::string {
    std::ostringstream block;
    for (const auto& [name, value] : headers) {
        block << name << ":" << value << "\n";
    }
    return block.str();
}

auto request_signer::signed_header_list(
    const std::map<std::string, std::string>& headers) -> std::string {
    std::ostringstream list;
    bool first = true;
    for (const auto& [name, value] : headers) {
        if (!first) list << ";";
        list << name;
        first = false;
    }
    return list.str();
}

auto request_signer::canonical_request(std::string_view method,
                                       const std::string& encoded_path,
                                       const std::string& header_block,
                                       const std::string& signed_headers,
                                       const std::string& payload_hash) -> std::string {
    std::ostringstream canonical;
    canonical << method << "\n";
    canonical << encoded_path << "\n";
    canonical << "\n";  // no query string
    canonical << header_block << "\n";
    canonical << signed_headers << "\n";
    canonical << payload_hash;
    return canonical.str();
}

auto request_signer::credential_scope(const std::string& date_stamp,
                                      const std::string& region,
                                      const std::string& service) -> std::string {
    return date_stamp + "/" + region + "/" + service + "/" + std::string(terminator);
}

auto request_signer::string_to_sign(const std::string& amz_date,
                                    const std::string& scope,
                                    const std::string& canonical_request) -> std::string {
    std::ostringstream to_sign;
    to_sign << algorithm << "\n";
    to_sign << amz_date << "\n";
    to_sign << scope << "\n";
    to_sign << sha256_hex(canonical_request);
    return to_sign.str();
}

auto request_signer::derive_signing_key(const std::string& secret_access_key,
                                        const std::string& date_stamp,
                                        const std::string& region,
                                        const std::string& service)
    -> std::vector<uint8_t> {
    auto k_date = hmac_sha256("AWS4" + secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, region);
    auto k_service = hmac_sha256(k_region, service);
    return hmac_sha256(k_service, std::string(terminator));
}

}  // namespace kcenon::stylize
