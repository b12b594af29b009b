/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_STYLIZE_TEST_FIXTURES_H
#define KCENON_STYLIZE_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/stylize/stylize.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>

namespace kcenon::stylize::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("stylize_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        results_dir_ = test_dir_ / "results";
        std::filesystem::create_directories(results_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path results_dir_;
};

/**
 * @brief Blocks until a workflow reaches a state that ends a run
 */
class terminal_state_waiter {
public:
    void attach(stylize_workflow& workflow) {
        workflow.on_state_changed([this](workflow_state state) {
            if (state == workflow_state::complete || state == workflow_state::error ||
                state == workflow_state::idle) {
                std::lock_guard<std::mutex> lock(mutex_);
                last_ = state;
                done_ = true;
                cv_.notify_all();
            }
        });
    }

    auto wait(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return done_; });
    }

    void rearm() {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = false;
    }

    auto last() const -> workflow_state {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    workflow_state last_ = workflow_state::idle;
};

}  // namespace kcenon::stylize::test

#endif  // KCENON_STYLIZE_TEST_FIXTURES_H
