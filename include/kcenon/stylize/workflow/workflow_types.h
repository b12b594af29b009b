/**
 * @file workflow_types.h
 * @brief States, requests and configuration for the stylize workflow
 * @version 0.1.0
 */

#ifndef KCENON_STYLIZE_WORKFLOW_WORKFLOW_TYPES_H
#define KCENON_STYLIZE_WORKFLOW_WORKFLOW_TYPES_H

#include "kcenon/stylize/cloud/cloud_credentials.h"
#include "kcenon/stylize/core/types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::stylize {

/**
 * @brief Workflow state
 */
enum class workflow_state {
    idle,         ///< No active run
    preparing,    ///< Validating inputs
    uploading,    ///< PUT of the source object in progress
    waiting,      ///< Polling for the derived object
    downloading,  ///< GET of the derived object in progress
    complete,     ///< Result materialized
    error         ///< Run failed; see activity log
};

/**
 * @brief Convert workflow_state to string
 */
[[nodiscard]] constexpr auto to_string(workflow_state state) noexcept -> std::string_view {
    switch (state) {
        case workflow_state::idle: return "idle";
        case workflow_state::preparing: return "preparing";
        case workflow_state::uploading: return "uploading";
        case workflow_state::waiting: return "waiting";
        case workflow_state::downloading: return "downloading";
        case workflow_state::complete: return "complete";
        case workflow_state::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Human-readable status line for a state
 */
[[nodiscard]] constexpr auto status_message(workflow_state state) noexcept
    -> std::string_view {
    switch (state) {
        case workflow_state::idle: return "Idle";
        case workflow_state::preparing: return "Preparing upload";
        case workflow_state::uploading: return "Uploading source image";
        case workflow_state::waiting: return "Waiting for Lambda to finish";
        case workflow_state::downloading: return "Downloading stylized image";
        case workflow_state::complete: return "Complete";
        case workflow_state::error: return "Error";
        default: return "Unknown";
    }
}

/**
 * @brief Check if a run is in progress in this state
 */
[[nodiscard]] constexpr auto is_busy(workflow_state state) noexcept -> bool {
    return state == workflow_state::preparing ||
           state == workflow_state::uploading ||
           state == workflow_state::waiting ||
           state == workflow_state::downloading;
}

/**
 * @brief Requested transformation, forwarded to the backend as metadata
 */
enum class transformation_preference {
    automatic,
    cartoon,
    colorize
};

[[nodiscard]] constexpr auto to_string(transformation_preference pref) noexcept
    -> std::string_view {
    switch (pref) {
        case transformation_preference::automatic: return "auto";
        case transformation_preference::cartoon: return "cartoon";
        case transformation_preference::colorize: return "colorize";
        default: return "auto";
    }
}

/**
 * @brief Parse "auto", "cartoon" or "colorize" (case-insensitive)
 */
[[nodiscard]] auto parse_transformation_preference(std::string_view value)
    -> std::optional<transformation_preference>;

/// Object metadata name carrying the preference (sent as x-amz-meta-stylize-preference)
inline constexpr std::string_view preference_metadata_key = "stylize-preference";

/**
 * @brief Local file chosen for upload
 */
struct source_file {
    std::string name;
    std::optional<std::string> content_type;
    std::vector<uint8_t> bytes;

    /**
     * @brief Declared content type, else detected from name, else octet-stream
     */
    [[nodiscard]] auto effective_content_type() const -> std::string;

    /**
     * @brief Read a file from disk; the name is the path's filename part
     */
    [[nodiscard]] static auto from_path(const std::filesystem::path& path)
        -> result<source_file>;
};

/**
 * @brief Inputs of one workflow run
 */
struct stylize_request {
    std::optional<source_file> file;
    credentials creds;
    std::string input_bucket;
    std::string output_bucket;
    transformation_preference preference = transformation_preference::automatic;
    /// Upload prefix; nullopt uses workflow_config::input_prefix
    std::optional<std::string> input_prefix;
    /// Derived-object prefix; nullopt uses workflow_config::output_prefix
    std::optional<std::string> output_prefix;
};

/**
 * @brief Engine configuration
 */
struct workflow_config {
    std::string input_prefix = "uploads/";
    std::string output_prefix = "stylized/";
    std::chrono::milliseconds poll_interval{5000};
    uint32_t max_poll_attempts = 24;
    /// Content type used when neither GET nor HEAD declares one
    std::string fallback_content_type = "image/jpeg";

    /**
     * @brief Check that the configuration can drive a run
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

// ============================================================================
// Key derivation
// ============================================================================

/**
 * @brief Normalize a key prefix
 *
 * Surrounding whitespace is trimmed and leading '/' removed. A non-empty
 * result always ends in '/'; an empty prefix stays empty.
 */
[[nodiscard]] auto normalize_prefix(std::string_view prefix) -> std::string;

/**
 * @brief Pick the prefix a run uses
 *
 * An unset or empty requested prefix falls back to the configured one.
 * A whitespace-only prefix is kept and normalizes to empty.
 */
[[nodiscard]] auto resolve_prefix(const std::optional<std::string>& requested,
                                  const std::string& fallback) -> std::string;

/**
 * @brief Replace every character outside [A-Za-z0-9._-] with '_'
 */
[[nodiscard]] auto sanitize_filename(std::string_view name) -> std::string;

/**
 * @brief `<normalized input prefix><unique id>-<sanitized name>`
 */
[[nodiscard]] auto derive_object_key(std::string_view input_prefix,
                                     std::string_view unique_id,
                                     std::string_view filename) -> std::string;

/**
 * @brief `<normalized output prefix><uploaded key>`
 */
[[nodiscard]] auto derive_output_key(std::string_view output_prefix,
                                     std::string_view object_key) -> std::string;

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_WORKFLOW_WORKFLOW_TYPES_H
