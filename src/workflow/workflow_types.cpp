/**
 * @file workflow_types.cpp
 * @brief Key derivation and request helpers
 * @version 0.1.0
 */

#include "kcenon/stylize/workflow/workflow_types.h"
#include "kcenon/stylize/cloud/cloud_utils.h"

#include <cctype>
#include <fstream>
#include <iterator>

namespace kcenon::stylize {

auto parse_transformation_preference(std::string_view value)
    -> std::optional<transformation_preference> {
    auto lower = cloud_utils::to_lower(cloud_utils::trim(value));
    if (lower.empty() || lower == "auto") {
        return transformation_preference::automatic;
    }
    if (lower == "cartoon") {
        return transformation_preference::cartoon;
    }
    if (lower == "colorize") {
        return transformation_preference::colorize;
    }
    return std::nullopt;
}

auto source_file::effective_content_type() const -> std::string {
    if (content_type && !cloud_utils::trim(*content_type).empty()) {
        return cloud_utils::trim(*content_type);
    }
    return cloud_utils::detect_content_type(name);
}

auto source_file::from_path(const std::filesystem::path& path) -> result<source_file> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "File not found: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
            "Failed to open file: " + path.string()}};
    }

    source_file out;
    out.name = path.filename().string();
    out.bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
            "Failed to read file: " + path.string()}};
    }
    out.content_type = cloud_utils::detect_content_type(out.name);
    return out;
}

auto workflow_config::validate() const -> result<void> {
    if (max_poll_attempts == 0) {
        return unexpected{error{error_code::validation_failed,
            "max_poll_attempts must be at least 1"}};
    }
    if (poll_interval.count() < 0) {
        return unexpected{error{error_code::validation_failed,
            "poll_interval must not be negative"}};
    }
    return {};
}

auto normalize_prefix(std::string_view prefix) -> std::string {
    auto trimmed = cloud_utils::trim(prefix);
    auto first = trimmed.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    trimmed.erase(0, first);
    if (trimmed.back() != '/') {
        trimmed += '/';
    }
    return trimmed;
}

auto resolve_prefix(const std::optional<std::string>& requested,
                    const std::string& fallback) -> std::string {
    if (!requested || requested->empty()) {
        return fallback;
    }
    return *requested;
}

auto sanitize_filename(std::string_view name) -> std::string {
    std::string out(name);
    for (auto& c : out) {
        auto uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || c == '.' || c == '_' || c == '-') || uc >= 0x80) {
            c = '_';
        }
    }
    return out;
}

auto derive_object_key(std::string_view input_prefix,
                       std::string_view unique_id,
                       std::string_view filename) -> std::string {
    return normalize_prefix(input_prefix) + std::string(unique_id) + "-" +
           sanitize_filename(filename);
}

auto derive_output_key(std::string_view output_prefix, std::string_view object_key)
    -> std::string {
    return normalize_prefix(output_prefix) + std::string(object_key);
}

}  // namespace kcenon::stylize
