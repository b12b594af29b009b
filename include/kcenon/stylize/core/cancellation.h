/**
 * @file cancellation.h
 * @brief Cooperative cancellation for scheduled workflow steps
 */

#ifndef KCENON_STYLIZE_CORE_CANCELLATION_H
#define KCENON_STYLIZE_CORE_CANCELLATION_H

#include <atomic>
#include <memory>

namespace kcenon::stylize {

/**
 * @brief Read-only view of a cancellation flag
 *
 * Tokens are cheap to copy and are captured by every step a run schedules.
 * A default-constructed token is never cancelled.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    [[nodiscard]] auto can_be_cancelled() const noexcept -> bool {
        return static_cast<bool>(flag_);
    }

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Owner side of a cancellation flag
 */
class cancellation_source {
public:
    cancellation_source()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] auto token() const -> cancellation_token {
        return cancellation_token(flag_);
    }

    /**
     * @brief Request cancellation; idempotent
     */
    void cancel() noexcept {
        flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CORE_CANCELLATION_H
