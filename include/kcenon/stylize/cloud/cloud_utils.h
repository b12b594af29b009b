/**
 * @file cloud_utils.h
 * @brief Hashing, encoding and time helpers for S3 request signing
 * @version 0.1.0
 */

#ifndef KCENON_STYLIZE_CLOUD_CLOUD_UTILS_H
#define KCENON_STYLIZE_CLOUD_CLOUD_UTILS_H

#include "kcenon/stylize/core/types.h"

#include <chrono>
#include <cstdint>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::stylize::cloud_utils {

/// SHA-256 of the empty string, used as payload hash for body-less requests
inline constexpr std::string_view EMPTY_PAYLOAD_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to hexadecimal string
 * @param bytes Vector of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief URL encode a string (RFC 3986 unreserved set kept literal)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Encode an object key for the request path
 *
 * Each '/'-separated segment is percent-encoded on its own and the
 * separators stay literal: "a b/c#d" becomes "a%20b/c%23d".
 */
auto encode_object_key(const std::string& key) -> std::string;

/**
 * @brief Trim ASCII whitespace from both ends
 */
auto trim(std::string_view value) -> std::string;

/**
 * @brief Lower-case ASCII letters
 */
auto to_lower(std::string_view value) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief SHA256 hash function
 * @param data String to hash
 * @return SHA256 hash bytes (32 bytes)
 */
auto sha256(const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief SHA256 hash of bytes
 */
auto sha256_bytes(std::span<const uint8_t> data) -> std::vector<uint8_t>;

/**
 * @brief Lowercase hex SHA256 of a string
 */
auto sha256_hex(const std::string& data) -> std::string;

/**
 * @brief Lowercase hex SHA256 of a byte buffer
 */
auto sha256_hex(std::span<const uint8_t> data) -> std::string;

/**
 * @brief Lowercase hex SHA256 of a whole stream
 *
 * The stream is consumed to its end. A read error before end of stream is
 * reported as error_code::file_read_error.
 */
auto sha256_hex(std::istream& stream) -> result<std::string>;

/**
 * @brief HMAC-SHA256
 * @param key Key bytes
 * @param data Data to sign
 * @return HMAC-SHA256 result (32 bytes)
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256 with string key
 */
auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief UTC time as "YYYYMMDD'T'HHMMSS'Z'"
 */
auto format_amz_date(std::chrono::system_clock::time_point when) -> std::string;

/**
 * @brief UTC date as "YYYYMMDD"
 */
auto format_date_stamp(std::chrono::system_clock::time_point when) -> std::string;

/**
 * @brief Parse "YYYYMMDD'T'HHMMSS'Z'" back into a time point
 * @return Time point, or invalid_state error when malformed
 */
auto parse_amz_date(const std::string& value)
    -> result<std::chrono::system_clock::time_point>;

// ============================================================================
// Random Utilities
// ============================================================================

/**
 * @brief Generate an RFC 4122 version 4 UUID string
 */
auto generate_uuid() -> std::string;

// ============================================================================
// Content Type Detection
// ============================================================================

/**
 * @brief Detect MIME content type from file extension
 * @param key File name or key
 * @return MIME type string (defaults to "application/octet-stream")
 */
auto detect_content_type(const std::string& key) -> std::string;

}  // namespace kcenon::stylize::cloud_utils

#endif  // KCENON_STYLIZE_CLOUD_CLOUD_UTILS_H
