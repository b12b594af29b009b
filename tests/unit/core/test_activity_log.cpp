/**
 * @file test_activity_log.cpp
 * @brief Unit tests for the workflow activity log
 */

#include <gtest/gtest.h>

#include <kcenon/stylize/core/activity_log.h>

#include <regex>
#include <set>
#include <thread>
#include <vector>

namespace kcenon::stylize::test {

class ActivityLogTest : public ::testing::Test {
protected:
    activity_log log_;
};

TEST_F(ActivityLogTest, StartsEmpty) {
    EXPECT_TRUE(log_.empty());
    EXPECT_EQ(log_.size(), 0u);
    EXPECT_EQ(log_.last_message(), "");
}

TEST_F(ActivityLogTest, KeepsInsertionOrder) {
    log_.append("first");
    log_.append("second");
    log_.append("third");

    auto entries = log_.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "first");
    EXPECT_EQ(entries[1].message, "second");
    EXPECT_EQ(entries[2].message, "third");
    EXPECT_EQ(log_.last_message(), "third");
}

TEST_F(ActivityLogTest, IdsIncreaseAcrossClear) {
    auto a = log_.append("a");
    auto b = log_.append("b");
    EXPECT_LT(a.id, b.id);

    log_.clear();
    EXPECT_TRUE(log_.empty());

    auto c = log_.append("c");
    EXPECT_GT(c.id, b.id);
    ASSERT_EQ(log_.size(), 1u);
}

TEST_F(ActivityLogTest, TimestampIsClockTime) {
    static const std::regex hhmmss("^[0-2][0-9]:[0-5][0-9]:[0-6][0-9]$");
    auto entry = log_.append("tick");
    EXPECT_TRUE(std::regex_match(entry.timestamp, hhmmss)) << entry.timestamp;
}

TEST_F(ActivityLogTest, ExplicitTimeIsFormattedLocally) {
    auto when = std::chrono::system_clock::from_time_t(1704110400);
    auto entry = log_.append("at noon UTC", when);
    EXPECT_EQ(entry.timestamp, activity_log::format_local_time(when));
}

TEST_F(ActivityLogTest, ConcurrentAppendsGetUniqueIds) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 100; ++i) {
                log_.append("entry");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto entries = log_.entries();
    ASSERT_EQ(entries.size(), 400u);
    std::set<uint64_t> ids;
    for (const auto& e : entries) {
        ids.insert(e.id);
    }
    EXPECT_EQ(ids.size(), 400u);
}

}  // namespace kcenon::stylize::test
