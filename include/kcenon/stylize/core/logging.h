// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/stylize/config/feature_flags.h"

#if STYLIZE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::stylize {

/**
 * @brief Log categories for stylize_client
 */
struct log_category {
    static constexpr std::string_view workflow = "stylize.workflow";
    static constexpr std::string_view signer = "stylize.signer";
    static constexpr std::string_view transport = "stylize.transport";
    static constexpr std::string_view scheduler = "stylize.scheduler";
    static constexpr std::string_view resource = "stylize.resource";
};

/**
 * @brief Log levels for stylize_client
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_access_keys = true;
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    /**
     * @brief Create config with all masking enabled
     */
    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    /**
     * @brief Create config with no masking
     */
    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks credential identifiers and local paths in log messages
 *
 * Secret keys and session tokens are never handed to the logger; access key
 * ids may appear inside error messages returned by S3 and are masked here.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_access_keys && !config_.mask_paths) {
            return input;
        }

        std::string result = input;

        if (config_.mask_access_keys) {
            result = mask_access_key_ids(result);
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask an access key id, keeping its first visible_chars characters
     */
    [[nodiscard]] auto mask_access_key(const std::string& key_id) const -> std::string {
        if (!config_.mask_access_keys || key_id.size() <= config_.visible_chars) {
            return key_id;
        }
        return key_id.substr(0, config_.visible_chars) +
               std::string(key_id.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Mask the directory part of a local path
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + "/" + path.substr(last_sep + 1);
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_access_key_ids(const std::string& input) const -> std::string {
        // Long-term (AKIA) and temporary (ASIA) AWS access key ids
        static const std::regex key_pattern(R"(\b(?:AKIA|ASIA)[A-Z0-9]{12,}\b)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), key_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_access_key(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:^|\s)((?:\/[a-zA-Z0-9._-]+){2,}))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            auto pos = static_cast<size_t>(it->position(1));
            result += input.substr(last_pos, pos - last_pos);
            result += mask_path(it->str(1));
            last_pos = pos + static_cast<size_t>(it->length(1));
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured log context for workflow runs and S3 requests
 */
struct workflow_log_context {
    std::string run_id;
    std::string bucket;
    std::string object_key;
    std::optional<std::string> method;
    std::optional<std::string> state;
    std::optional<uint32_t> attempt;
    std::optional<uint32_t> max_attempts;
    std::optional<int> status_code;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!run_id.empty()) add_field("run_id", run_id);
        if (!bucket.empty()) add_field("bucket", bucket);
        if (!object_key.empty()) add_field("key", object_key);
        if (method) add_field("method", *method);
        if (state) add_field("state", *state);
        if (attempt) add_int("attempt", *attempt);
        if (max_attempts) add_int("max_attempts", *max_attempts);
        if (status_code) add_int("status_code", *status_code);
        if (bytes) add_int("bytes", static_cast<int64_t>(*bytes));
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<workflow_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            std::string file = *source_file;
            if (masker) {
                file = masker->mask_path(file);
            }
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

namespace detail {

/**
 * @brief Millisecond time stamp
 *
 * UTC renders as ISO 8601 ("2024-01-01T12:00:00.000Z"); local time renders
 * as "2024-01-01 12:00:00.000".
 */
inline auto format_time(std::chrono::system_clock::time_point when, bool utc) -> std::string {
    auto seconds = std::chrono::system_clock::to_time_t(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;

    std::tm parts{};
#if defined(_WIN32)
    if (utc) {
        gmtime_s(&parts, &seconds);
    } else {
        localtime_s(&parts, &seconds);
    }
#else
    if (utc) {
        gmtime_r(&seconds, &parts);
    } else {
        localtime_r(&seconds, &parts);
    }
#endif

    std::ostringstream oss;
    oss << std::put_time(&parts, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

}  // namespace detail

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Process-wide diagnostic logger for stylize_client
 */
class stylize_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const workflow_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    stylize_logger() = default;
    ~stylize_logger() = default;

    stylize_logger(const stylize_logger&) = delete;
    stylize_logger& operator=(const stylize_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if STYLIZE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if STYLIZE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    void set_level(log_level level) {
        min_level_.store(level);
#if STYLIZE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    /**
     * @brief Suppress stderr output (callbacks still fire)
     */
    void set_console_output(bool enabled) {
        console_output_.store(enabled);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const workflow_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked_message = current_masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked_message, context);
            }
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, masked_message, context, file, line, function,
                     current_masker);
        }
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const workflow_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {
        structured_log_entry entry;
        entry.timestamp = detail::format_time(std::chrono::system_clock::now(), true);
        entry.level = level;
        entry.category = std::string(category);
        entry.message = std::string(message);
        if (context) {
            entry.context = *context;
        }
        if (file) {
            entry.source_file = file;
        }
        if (line > 0) {
            entry.source_line = line;
        }
        if (function) {
            entry.function_name = function;
        }

        auto json = entry.to_json_with_masking(&masker);
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json);
            }
        }
        emit(level, json, file, line, function);
    }

    void log_text(log_level level,
                  std::string_view category,
                  const std::string& message,
                  const workflow_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {
        std::ostringstream body;
        body << "[" << category << "] " << message;
        if (context) {
            body << " " << context->to_json_with_masking(&masker);
        }

#if STYLIZE_USE_LOGGER_SYSTEM
        if (logger_) {
            emit(level, body.str(), file, line, function);
            return;
        }
#endif
        emit(level,
             detail::format_time(std::chrono::system_clock::now(), false) + " [" +
                 std::string(log_level_to_string(level)) + "] " + body.str(),
             file, line, function);
    }

    /**
     * @brief Route a formatted line to logger_system when attached, else stderr
     */
    void emit(log_level level,
              const std::string& formatted,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if STYLIZE_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#else
        (void)level;
#endif
        if (!console_output_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << formatted << "\n";
    }

#if STYLIZE_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline stylize_logger& get_logger() {
    static stylize_logger instance;
    return instance;
}

// Logging macros for convenience
#define STYLIZE_LOG(level, category, message) \
    kcenon::stylize::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define STYLIZE_LOG_CTX(level, category, message, context) \
    kcenon::stylize::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define STYLIZE_LOG_TRACE(category, message) \
    STYLIZE_LOG(kcenon::stylize::log_level::trace, category, message)

#define STYLIZE_LOG_DEBUG(category, message) \
    STYLIZE_LOG(kcenon::stylize::log_level::debug, category, message)

#define STYLIZE_LOG_INFO(category, message) \
    STYLIZE_LOG(kcenon::stylize::log_level::info, category, message)

#define STYLIZE_LOG_WARN(category, message) \
    STYLIZE_LOG(kcenon::stylize::log_level::warn, category, message)

#define STYLIZE_LOG_ERROR(category, message) \
    STYLIZE_LOG(kcenon::stylize::log_level::error, category, message)

#define STYLIZE_LOG_FATAL(category, message) \
    STYLIZE_LOG(kcenon::stylize::log_level::fatal, category, message)

#define STYLIZE_LOG_DEBUG_CTX(category, message, ctx) \
    STYLIZE_LOG_CTX(kcenon::stylize::log_level::debug, category, message, ctx)

#define STYLIZE_LOG_INFO_CTX(category, message, ctx) \
    STYLIZE_LOG_CTX(kcenon::stylize::log_level::info, category, message, ctx)

#define STYLIZE_LOG_WARN_CTX(category, message, ctx) \
    STYLIZE_LOG_CTX(kcenon::stylize::log_level::warn, category, message, ctx)

#define STYLIZE_LOG_ERROR_CTX(category, message, ctx) \
    STYLIZE_LOG_CTX(kcenon::stylize::log_level::error, category, message, ctx)

} // namespace kcenon::stylize
