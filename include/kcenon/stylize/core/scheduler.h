// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file scheduler.h
 * @brief Task scheduling for the workflow event loop
 *
 * The workflow engine never blocks a thread while it waits between polls.
 * Each step is posted to a scheduler, and the fixed poll interval is a
 * delayed post. Two implementations are provided:
 * - event_loop_scheduler: one background thread with a timer queue
 * - virtual_time_scheduler: deterministic, manually driven clock for tests
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kcenon::stylize {

/**
 * @brief Interface for posting workflow steps
 */
class scheduler {
public:
    using task = std::function<void()>;

    virtual ~scheduler() = default;

    /**
     * @brief Run a task as soon as possible, after already-queued tasks
     */
    virtual void post(task fn) = 0;

    /**
     * @brief Run a task once the delay has elapsed
     */
    virtual void post_delayed(task fn, std::chrono::milliseconds delay) = 0;
};

namespace detail {

struct timed_task {
    std::chrono::steady_clock::time_point due;
    uint64_t sequence = 0;
    scheduler::task fn;
};

// Earliest due first; FIFO among equal due times
struct timed_task_later {
    auto operator()(const timed_task& a, const timed_task& b) const -> bool {
        if (a.due != b.due) {
            return a.due > b.due;
        }
        return a.sequence > b.sequence;
    }
};

using timed_task_queue =
    std::priority_queue<timed_task, std::vector<timed_task>, timed_task_later>;

}  // namespace detail

/**
 * @brief Single-threaded event loop with a timer queue
 *
 * Tasks run one at a time on a dedicated thread, so workflow steps never
 * interleave. stop() discards pending tasks and joins the thread.
 */
class event_loop_scheduler : public scheduler {
public:
    event_loop_scheduler();
    ~event_loop_scheduler() override;

    event_loop_scheduler(const event_loop_scheduler&) = delete;
    auto operator=(const event_loop_scheduler&) -> event_loop_scheduler& = delete;

    void post(task fn) override;
    void post_delayed(task fn, std::chrono::milliseconds delay) override;

    void stop();

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto pending_count() const -> std::size_t;

private:
    struct loop_state {
        mutable std::mutex mutex;
        std::condition_variable cv;
        detail::timed_task_queue queue;
        uint64_t next_sequence = 0;
        bool stopping = false;
    };

    void enqueue(task fn, std::chrono::steady_clock::time_point due);
    static void run(const std::shared_ptr<loop_state>& state);

    std::shared_ptr<loop_state> state_;
    std::thread worker_;
};

/**
 * @brief Manually driven scheduler with a virtual clock
 *
 * Nothing runs until the owner calls run_ready(), advance() or
 * run_until_idle(). Delayed tasks become due when virtual time reaches
 * their deadline, so long polling sequences complete instantly in tests.
 */
class virtual_time_scheduler : public scheduler {
public:
    using clock = std::chrono::steady_clock;

    virtual_time_scheduler() = default;

    void post(task fn) override;
    void post_delayed(task fn, std::chrono::milliseconds delay) override;

    /**
     * @brief Current virtual time, as an offset from construction
     */
    [[nodiscard]] auto now() const -> std::chrono::milliseconds;

    /**
     * @brief Run every task already due at the current virtual time
     * @return Number of tasks executed
     */
    auto run_ready() -> std::size_t;

    /**
     * @brief Move virtual time forward, running tasks as they fall due
     * @return Number of tasks executed
     */
    auto advance(std::chrono::milliseconds duration) -> std::size_t;

    /**
     * @brief Run tasks, jumping the clock to each deadline, until none remain
     * @param max_tasks Upper bound on executed tasks
     * @return Number of tasks executed
     */
    auto run_until_idle(std::size_t max_tasks = 10000) -> std::size_t;

    [[nodiscard]] auto pending_count() const -> std::size_t;

    /**
     * @brief Delay until the next pending task is due, if any
     */
    [[nodiscard]] auto next_delay() const -> std::chrono::milliseconds;

private:
    auto pop_due(clock::time_point limit, detail::timed_task& out) -> bool;

    mutable std::mutex mutex_;
    detail::timed_task_queue queue_;
    clock::time_point now_{};
    uint64_t next_sequence_ = 0;
};

}  // namespace kcenon::stylize
