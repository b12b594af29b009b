// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file scheduler.cpp
 * @brief Event loop and virtual-time scheduler implementations
 */

#include "kcenon/stylize/core/scheduler.h"
#include "kcenon/stylize/core/logging.h"

#include <exception>
#include <string>

namespace kcenon::stylize {

// ============================================================================
// event_loop_scheduler
// ============================================================================

event_loop_scheduler::event_loop_scheduler()
    : state_(std::make_shared<loop_state>()) {
    // The worker shares ownership of the queue so a stop() issued from inside
    // a task can detach without leaving the loop on freed memory
    worker_ = std::thread([state = state_] { run(state); });
}

event_loop_scheduler::~event_loop_scheduler() {
    stop();
}

void event_loop_scheduler::post(task fn) {
    enqueue(std::move(fn), std::chrono::steady_clock::now());
}

void event_loop_scheduler::post_delayed(task fn, std::chrono::milliseconds delay) {
    enqueue(std::move(fn), std::chrono::steady_clock::now() + delay);
}

void event_loop_scheduler::enqueue(task fn, std::chrono::steady_clock::time_point due) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            STYLIZE_LOG_DEBUG(log_category::scheduler,
                              "Task dropped: scheduler is stopping");
            return;
        }
        state_->queue.push(detail::timed_task{due, state_->next_sequence++, std::move(fn)});
    }
    state_->cv.notify_one();
}

void event_loop_scheduler::stop() {
    detail::timed_task_queue discarded;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        std::swap(discarded, state_->queue);
    }
    state_->cv.notify_all();

    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

auto event_loop_scheduler::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->stopping;
}

auto event_loop_scheduler::pending_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

void event_loop_scheduler::run(const std::shared_ptr<loop_state>& state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->stopping) {
        if (state->queue.empty()) {
            state->cv.wait(lock, [&state] { return state->stopping || !state->queue.empty(); });
            continue;
        }

        auto due = state->queue.top().due;
        if (std::chrono::steady_clock::now() < due) {
            state->cv.wait_until(lock, due);
            continue;
        }

        auto fn = std::move(const_cast<detail::timed_task&>(state->queue.top()).fn);
        state->queue.pop();

        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            STYLIZE_LOG_ERROR(log_category::scheduler,
                              std::string("Unhandled exception in scheduled task: ") + e.what());
        }
        fn = nullptr;
        lock.lock();
    }
}

// ============================================================================
// virtual_time_scheduler
// ============================================================================

void virtual_time_scheduler::post(task fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(detail::timed_task{now_, next_sequence_++, std::move(fn)});
}

void virtual_time_scheduler::post_delayed(task fn, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(detail::timed_task{now_ + delay, next_sequence_++, std::move(fn)});
}

auto virtual_time_scheduler::now() const -> std::chrono::milliseconds {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(now_.time_since_epoch());
}

auto virtual_time_scheduler::pop_due(clock::time_point limit, detail::timed_task& out)
    -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty() || queue_.top().due > limit) {
        return false;
    }
    out = std::move(const_cast<detail::timed_task&>(queue_.top()));
    queue_.pop();
    if (out.due > now_) {
        now_ = out.due;
    }
    return true;
}

auto virtual_time_scheduler::run_ready() -> std::size_t {
    clock::time_point limit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limit = now_;
    }

    std::size_t executed = 0;
    detail::timed_task next;
    while (pop_due(limit, next)) {
        next.fn();
        ++executed;
    }
    return executed;
}

auto virtual_time_scheduler::advance(std::chrono::milliseconds duration) -> std::size_t {
    clock::time_point limit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limit = now_ + duration;
    }

    std::size_t executed = 0;
    detail::timed_task next;
    while (pop_due(limit, next)) {
        next.fn();
        ++executed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    now_ = limit;
    return executed;
}

auto virtual_time_scheduler::run_until_idle(std::size_t max_tasks) -> std::size_t {
    std::size_t executed = 0;
    detail::timed_task next;
    while (executed < max_tasks && pop_due(clock::time_point::max(), next)) {
        next.fn();
        ++executed;
    }
    return executed;
}

auto virtual_time_scheduler::pending_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

auto virtual_time_scheduler::next_delay() const -> std::chrono::milliseconds {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty() || queue_.top().due <= now_) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(queue_.top().due - now_);
}

}  // namespace kcenon::stylize
