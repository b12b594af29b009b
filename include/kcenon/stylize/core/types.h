/**
 * @file types.h
 * @brief Core type definitions for stylize_client
 */

#ifndef KCENON_STYLIZE_CORE_TYPES_H
#define KCENON_STYLIZE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::stylize {

/**
 * @brief Error codes for stylize operations
 */
enum class error_code {
    success = 0,

    // Validation errors (-100 to -119)
    validation_failed = -100,
    missing_file = -101,
    missing_credentials = -102,
    missing_source_bucket = -103,
    missing_destination_bucket = -104,
    invalid_object_key = -105,

    // File errors (-120 to -139)
    file_not_found = -120,
    file_read_error = -121,
    file_write_error = -122,

    // Transport errors (-160 to -179)
    connection_failed = -160,
    transport_error = -161,
    object_not_found = -162,
    not_available = -163,

    // Workflow errors (-180 to -199)
    poll_timeout = -180,
    operation_cancelled = -181,
    invalid_state = -182,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::validation_failed:
            return "validation failed";
        case error_code::missing_file:
            return "missing file";
        case error_code::missing_credentials:
            return "missing credentials";
        case error_code::missing_source_bucket:
            return "missing source bucket";
        case error_code::missing_destination_bucket:
            return "missing destination bucket";
        case error_code::invalid_object_key:
            return "invalid object key";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::transport_error:
            return "transport error";
        case error_code::object_not_found:
            return "object not found";
        case error_code::not_available:
            return "not available";
        case error_code::poll_timeout:
            return "poll timeout";
        case error_code::operation_cancelled:
            return "operation cancelled";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code belongs to the validation range
 */
[[nodiscard]] constexpr auto is_validation_error(error_code code) -> bool {
    return static_cast<int>(code) <= -100 && static_cast<int>(code) >= -119;
}

/**
 * @brief Error type with code, message and the HTTP status when one exists
 */
struct error {
    error_code code;
    std::string message;
    std::optional<int> http_status;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), http_status(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CORE_TYPES_H
