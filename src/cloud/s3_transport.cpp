/**
 * @file s3_transport.cpp
 * @brief Signed S3 object requests
 * @version 0.1.0
 */

#include "kcenon/stylize/cloud/s3_transport.h"
#include "kcenon/stylize/cloud/cloud_utils.h"
#include "kcenon/stylize/core/logging.h"

#include <algorithm>
#include <cctype>

namespace kcenon::stylize {

namespace {

auto parse_content_length(const std::optional<std::string>& value)
    -> std::optional<uint64_t> {
    if (!value || value->empty() || value->size() > 19 ||
        !std::all_of(value->begin(), value->end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoull(*value);
}

auto non_empty(std::optional<std::string> value) -> std::optional<std::string> {
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

s3_transport::s3_transport(credentials creds,
                           std::shared_ptr<http_client_interface_base> http_client,
                           s3_endpoint_config endpoint,
                           clock_function clock)
    : signer_(std::move(creds), std::move(endpoint)),
      http_client_(std::move(http_client)),
      clock_(clock ? std::move(clock)
                   : clock_function([] { return std::chrono::system_clock::now(); })) {}

auto s3_transport::execute(const request_descriptor& desc) -> result<http_response_base> {
    if (!http_client_) {
        return unexpected{error{error_code::not_initialized, "HTTP client not configured"}};
    }

    auto signed_req = signer_.sign(desc, clock_());
    if (!signed_req) {
        return unexpected{signed_req.error()};
    }
    const auto& req = signed_req.value();

    workflow_log_context ctx;
    ctx.bucket = cloud_utils::trim(desc.bucket);
    ctx.object_key = desc.key;
    ctx.method = std::string(to_string(desc.method));
    if (desc.body) {
        ctx.bytes = desc.body->size();
    }

    auto started = std::chrono::steady_clock::now();
    result<http_response_base> response = [&]() -> result<http_response_base> {
        switch (desc.method) {
            case http_method::put:
                return http_client_->put(req.url, req.body.value_or(std::vector<uint8_t>{}),
                                         req.headers);
            case http_method::head:
                return http_client_->head(req.url, req.headers);
            case http_method::get:
            default:
                return http_client_->get(req.url, req.headers);
        }
    }();
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());

    if (!response) {
        ctx.error_message = response.error().message;
        STYLIZE_LOG_WARN_CTX(log_category::transport, "S3 request got no response", ctx);
        auto err = response.error();
        if (err.code != error_code::not_available) {
            err.code = error_code::connection_failed;
        }
        return unexpected{std::move(err)};
    }

    auto status = response.value().status_code;
    ctx.status_code = status;

    if (!response.value().is_success()) {
        auto category = classify_http_status(status);
        auto code = category == cloud_error_code::object_not_found
            ? error_code::object_not_found
            : error_code::transport_error;
        std::string message = "S3 request failed with status " + std::to_string(status);
        if (category != cloud_error_code::s3_error) {
            message += " (" + std::string(to_string(category)) + ")";
        }
        ctx.error_message = message;
        if (code == error_code::object_not_found) {
            STYLIZE_LOG_DEBUG_CTX(log_category::transport, "S3 object not found", ctx);
        } else {
            STYLIZE_LOG_WARN_CTX(log_category::transport, "S3 request failed", ctx);
        }
        return unexpected{error{code, std::move(message), status}};
    }

    STYLIZE_LOG_DEBUG_CTX(log_category::transport, "S3 request completed", ctx);
    return response;
}

auto s3_transport::put(const request_descriptor& desc) -> result<put_object_result> {
    request_descriptor put_desc = desc;
    put_desc.method = http_method::put;
    if (!put_desc.body) {
        put_desc.body = std::vector<uint8_t>{};
    }

    auto response = execute(put_desc);
    if (!response) {
        return unexpected{response.error()};
    }

    put_object_result out;
    out.status_code = response.value().status_code;
    out.etag = non_empty(response.value().get_header("ETag"));
    return out;
}

auto s3_transport::head(const request_descriptor& desc) -> result<head_object_result> {
    request_descriptor head_desc = desc;
    head_desc.method = http_method::head;
    head_desc.body.reset();

    auto response = execute(head_desc);
    if (!response) {
        return unexpected{response.error()};
    }

    head_object_result out;
    out.status_code = response.value().status_code;
    out.content_type = non_empty(response.value().get_header("Content-Type"));
    out.content_length = parse_content_length(response.value().get_header("Content-Length"));
    out.headers = std::move(response.value().headers);
    return out;
}

auto s3_transport::get(const request_descriptor& desc) -> result<get_object_result> {
    request_descriptor get_desc = desc;
    get_desc.method = http_method::get;
    get_desc.body.reset();

    auto response = execute(get_desc);
    if (!response) {
        return unexpected{response.error()};
    }

    get_object_result out;
    out.status_code = response.value().status_code;
    out.content_type = non_empty(response.value().get_header("Content-Type"));
    out.body = std::move(response.value().body);
    out.headers = std::move(response.value().headers);
    return out;
}

auto s3_transport::put_object(const std::string& bucket,
                              const std::string& key,
                              std::vector<uint8_t> body,
                              const std::string& content_type,
                              const std::map<std::string, std::string>& metadata)
    -> result<put_object_result> {
    request_descriptor desc;
    desc.method = http_method::put;
    desc.bucket = bucket;
    desc.key = key;
    desc.body = std::move(body);
    if (!content_type.empty()) {
        desc.headers["content-type"] = content_type;
    }
    for (const auto& [name, value] : metadata) {
        desc.headers["x-amz-meta-" + cloud_utils::to_lower(name)] = value;
    }
    return put(desc);
}

auto s3_transport::head_object(const std::string& bucket, const std::string& key)
    -> result<head_object_result> {
    request_descriptor desc;
    desc.method = http_method::head;
    desc.bucket = bucket;
    desc.key = key;
    return head(desc);
}

auto s3_transport::get_object(const std::string& bucket, const std::string& key)
    -> result<get_object_result> {
    request_descriptor desc;
    desc.method = http_method::get;
    desc.bucket = bucket;
    desc.key = key;
    return get(desc);
}

}  // namespace kcenon::stylize
