/**
 * @file cloud_utils.cpp
 * @brief Hashing, encoding and time helpers for S3 request signing
 * @version 0.1.0
 */

#include "kcenon/stylize/cloud/cloud_utils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <unordered_map>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace kcenon::stylize::cloud_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto encode_object_key(const std::string& key) -> std::string {
    std::string encoded;
    encoded.reserve(key.size() + 8);

    std::size_t start = 0;
    while (true) {
        auto slash = key.find('/', start);
        if (slash == std::string::npos) {
            encoded += url_encode(key.substr(start));
            break;
        }
        encoded += url_encode(key.substr(start, slash - start));
        encoded += '/';
        start = slash + 1;
    }

    return encoded;
}

auto trim(std::string_view value) -> std::string {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(value.begin(), value.end(), is_space);
    auto last = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

auto to_lower(std::string_view value) -> std::string {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
}

auto sha256_bytes(std::span<const uint8_t> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(data.data(), data.size(), hash.data());
    return hash;
}

auto sha256_hex(const std::string& data) -> std::string {
    return bytes_to_hex(sha256(data));
}

auto sha256_hex(std::span<const uint8_t> data) -> std::string {
    return bytes_to_hex(sha256_bytes(data));
}

auto sha256_hex(std::istream& stream) -> result<std::string> {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return unexpected{error{error_code::internal_error,
            "Failed to initialize SHA-256 digest"}};
    }

    std::array<char, 64 * 1024> buffer{};
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = stream.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            return unexpected{error{error_code::internal_error,
                "Failed to update SHA-256 digest"}};
        }
    }

    if (stream.bad()) {
        return unexpected{error{error_code::file_read_error,
            "Failed to read payload stream"}};
    }

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &len) != 1) {
        return unexpected{error{error_code::internal_error,
            "Failed to finalize SHA-256 digest"}};
    }
    hash.resize(len);
    return bytes_to_hex(hash);
}

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> key_bytes(key.begin(), key.end());
    return hmac_sha256(key_bytes, data);
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {
auto to_utc_tm(std::chrono::system_clock::time_point when) -> std::tm {
    auto time_t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    return tm;
}
}  // namespace

auto format_amz_date(std::chrono::system_clock::time_point when) -> std::string {
    auto tm = to_utc_tm(when);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

auto format_date_stamp(std::chrono::system_clock::time_point when) -> std::string {
    auto tm = to_utc_tm(when);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d");
    return oss.str();
}

auto parse_amz_date(const std::string& value)
    -> result<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream iss(value);
    iss >> std::get_time(&tm, "%Y%m%dT%H%M%SZ");
    if (iss.fail() || value.size() != 16) {
        return unexpected{error{error_code::invalid_state,
            "Malformed x-amz-date value: " + value}};
    }
#ifdef _WIN32
    auto seconds = _mkgmtime(&tm);
#else
    auto seconds = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(seconds);
}

// ============================================================================
// Random Utilities
// ============================================================================

auto generate_uuid() -> std::string {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    std::array<uint8_t, 16> bytes{};
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

// ============================================================================
// Content Type Detection
// ============================================================================

auto detect_content_type(const std::string& key) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".heic", "image/heic"},
        {".ico", "image/x-icon"},
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
    };

    auto dot_pos = key.rfind('.');
    if (dot_pos == std::string::npos) {
        return "application/octet-stream";
    }

    std::string ext = to_lower(key.substr(dot_pos));

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

}  // namespace kcenon::stylize::cloud_utils
