/**
 * @file activity_log.h
 * @brief Append-only, user-facing activity log for workflow runs
 */

#ifndef KCENON_STYLIZE_CORE_ACTIVITY_LOG_H
#define KCENON_STYLIZE_CORE_ACTIVITY_LOG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::stylize {

/**
 * @brief Single user-visible log line
 */
struct log_entry {
    uint64_t id = 0;
    std::string timestamp;  ///< Local wall-clock time, "HH:MM:SS"
    std::string message;
};

/**
 * @brief Ordered record of progress messages for one workflow run
 *
 * Entries are kept in insertion order and carry ids that are unique for the
 * lifetime of the log, including across clear(). The log is cleared only by
 * the workflow engine when a run is reset or superseded.
 */
class activity_log {
public:
    activity_log() = default;

    activity_log(const activity_log&) = delete;
    auto operator=(const activity_log&) -> activity_log& = delete;

    /**
     * @brief Append a message stamped with the current local time
     * @return The stored entry
     */
    auto append(std::string message) -> log_entry;

    /**
     * @brief Append a message with an explicit time stamp
     */
    auto append(std::string message, std::chrono::system_clock::time_point when)
        -> log_entry;

    /**
     * @brief Snapshot of all entries in display order
     */
    [[nodiscard]] auto entries() const -> std::vector<log_entry>;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;

    /**
     * @brief Message of the most recent entry, or empty string
     */
    [[nodiscard]] auto last_message() const -> std::string;

    void clear();

    /**
     * @brief Format a time point as local "HH:MM:SS"
     */
    [[nodiscard]] static auto format_local_time(
        std::chrono::system_clock::time_point when) -> std::string;

private:
    mutable std::mutex mutex_;
    std::vector<log_entry> entries_;
    uint64_t next_id_ = 1;
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CORE_ACTIVITY_LOG_H
