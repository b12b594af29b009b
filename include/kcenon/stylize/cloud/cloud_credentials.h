/**
 * @file cloud_credentials.h
 * @brief Short-lived AWS credentials used to sign requests
 * @version 0.1.0
 */

#ifndef KCENON_STYLIZE_CLOUD_CLOUD_CREDENTIALS_H
#define KCENON_STYLIZE_CLOUD_CLOUD_CREDENTIALS_H

#include <optional>
#include <string>

namespace kcenon::stylize {

/**
 * @brief Temporary AWS credentials for one workflow run
 *
 * Held in memory only. The secret key and session token are never written to
 * disk or passed to the logger.
 */
struct credentials {
    /// AWS region, e.g. "us-east-1"
    std::string region;

    /// Access key ID
    std::string access_key_id;

    /// Secret access key
    std::string secret_access_key;

    /// Session token for STS-issued credentials
    std::optional<std::string> session_token;

    /**
     * @brief All required fields are non-blank
     */
    [[nodiscard]] auto is_complete() const -> bool;

    /**
     * @brief Copy with surrounding whitespace removed from every field
     *
     * An all-whitespace session token becomes nullopt.
     */
    [[nodiscard]] auto trimmed() const -> credentials;
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CLOUD_CLOUD_CREDENTIALS_H
