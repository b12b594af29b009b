/**
 * @file activity_log.cpp
 * @brief Implementation of the workflow activity log
 */

#include "kcenon/stylize/core/activity_log.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace kcenon::stylize {

auto activity_log::append(std::string message) -> log_entry {
    return append(std::move(message), std::chrono::system_clock::now());
}

auto activity_log::append(std::string message,
                          std::chrono::system_clock::time_point when) -> log_entry {
    log_entry entry;
    entry.timestamp = format_local_time(when);
    entry.message = std::move(message);

    std::lock_guard<std::mutex> lock(mutex_);
    entry.id = next_id_++;
    entries_.push_back(entry);
    return entry;
}

auto activity_log::entries() const -> std::vector<log_entry> {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

auto activity_log::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

auto activity_log::empty() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

auto activity_log::last_message() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return {};
    }
    return entries_.back().message;
}

void activity_log::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

auto activity_log::format_local_time(std::chrono::system_clock::time_point when)
    -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_val);
#else
    localtime_r(&time_t_val, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S");
    return oss.str();
}

}  // namespace kcenon::stylize
