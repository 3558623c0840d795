#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>
#include "grocery/task_registry.hpp"

using namespace grocery;
using namespace std::chrono_literals;

namespace {

RobotTaskResult result_from(const std::string& robot_id) {
    RobotTaskResult result;
    result.set_robot_id(robot_id);
    result.set_code(OK);
    return result;
}

TaskRegistry::Clock::time_point in(std::chrono::milliseconds delay) {
    return TaskRegistry::Clock::now() + delay;
}

} // anonymous namespace

// =============================================================================
// Task Id Tests
// =============================================================================

TEST(TaskRegistryTest, NextTaskId_ShouldStartAtOneAndIncrease) {
    TaskRegistry registry(5);

    EXPECT_EQ(registry.next_task_id(), 1u);
    EXPECT_EQ(registry.next_task_id(), 2u);
    EXPECT_EQ(registry.next_task_id(), 3u);
}

TEST(TaskRegistryTest, NextTaskId_FromManyThreads_ShouldNeverRepeat) {
    TaskRegistry registry(5);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;
    std::vector<std::vector<TaskId>> issued(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) issued[t].push_back(registry.next_task_id());
        });
    }
    for (auto& thread : threads) thread.join();

    std::set<TaskId> unique;
    for (const auto& ids : issued) {
        // Within one caller ids are strictly increasing
        EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
        unique.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*unique.rbegin(), static_cast<TaskId>(kThreads * kPerThread));
}

// =============================================================================
// Create Tests
// =============================================================================

TEST(TaskRegistryTest, Create_DuplicateId_ShouldBeRejected) {
    TaskRegistry registry(5);

    EXPECT_TRUE(registry.create(1, FETCH, {{"milk", 1}}, in(1s)));
    EXPECT_FALSE(registry.create(1, RESTOCK, {}, in(1s)));
    EXPECT_EQ(registry.size(), 1u);
}

// =============================================================================
// Record Result Tests
// =============================================================================

TEST(TaskRegistryTest, RecordResult_UnknownTask_ShouldNotRecord) {
    TaskRegistry registry(5);

    auto outcome = registry.record_result(42, FETCH, result_from("robot_bread"));

    EXPECT_FALSE(outcome.recorded);
    EXPECT_FALSE(outcome.first_to_complete);
}

TEST(TaskRegistryTest, RecordResult_ReachingExpectedCount_ShouldFlagOnlyLastResponder) {
    TaskRegistry registry(3);
    registry.create(1, FETCH, {}, in(1s));

    auto first = registry.record_result(1, FETCH, result_from("a"));
    auto second = registry.record_result(1, FETCH, result_from("b"));
    auto third = registry.record_result(1, FETCH, result_from("c"));

    EXPECT_TRUE(first.recorded);
    EXPECT_FALSE(first.first_to_complete);
    EXPECT_FALSE(second.first_to_complete);
    EXPECT_TRUE(third.recorded);
    EXPECT_TRUE(third.first_to_complete);
}

TEST(TaskRegistryTest, RecordResult_AfterCompletion_ShouldBeIgnored) {
    TaskRegistry registry(1);
    registry.create(1, FETCH, {}, in(1s));
    registry.record_result(1, FETCH, result_from("a"));

    auto extra = registry.record_result(1, FETCH, result_from("a"));

    EXPECT_FALSE(extra.recorded);
    EXPECT_FALSE(extra.first_to_complete);
    EXPECT_EQ(registry.finalize_and_remove(1)->responded(), 1);
}

TEST(TaskRegistryTest, RecordResult_RacingResponders_ShouldCompleteExactlyOnce) {
    constexpr int kRobots = 16;
    TaskRegistry registry(kRobots);
    registry.create(1, RESTOCK, {}, in(5s));
    std::atomic<int> completions{0};
    std::atomic<int> recorded{0};

    std::vector<std::thread> robots;
    for (int i = 0; i < kRobots * 2; ++i) {
        robots.emplace_back([&, i] {
            auto outcome = registry.record_result(1, RESTOCK, result_from("robot_" + std::to_string(i)));
            if (outcome.recorded) ++recorded;
            if (outcome.first_to_complete) ++completions;
        });
    }
    for (auto& robot : robots) robot.join();

    EXPECT_EQ(completions.load(), 1);
    EXPECT_EQ(recorded.load(), kRobots);
}

TEST(TaskRegistryTest, RecordResult_OtherTaskType_ShouldNotRecord) {
    // Given a FETCH task 1 in flight
    TaskRegistry registry(2);
    registry.create(1, FETCH, {}, in(1s));

    // When a result addressed to restock_1 arrives
    auto foreign = registry.record_result(1, RESTOCK, result_from("robot_dairy"));

    // Then the FETCH task is untouched
    EXPECT_FALSE(foreign.recorded);
    EXPECT_EQ(registry.finalize_and_remove(1)->responded(), 0);
}

// =============================================================================
// Wait Tests
// =============================================================================

TEST(TaskRegistryTest, WaitForCompletion_AllResponded_ShouldReturnTrueBeforeDeadline) {
    TaskRegistry registry(2);
    registry.create(1, FETCH, {}, in(5s));

    std::thread robots([&] {
        std::this_thread::sleep_for(20ms);
        registry.record_result(1, FETCH, result_from("a"));
        registry.record_result(1, FETCH, result_from("b"));
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(registry.wait_for_completion(1));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    robots.join();
}

TEST(TaskRegistryTest, WaitForCompletion_MissingResponses_ShouldTimeOutAtDeadline) {
    TaskRegistry registry(2);
    registry.create(1, FETCH, {}, in(100ms));
    registry.record_result(1, FETCH, result_from("a"));

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(registry.wait_for_completion(1));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
}

TEST(TaskRegistryTest, RecordResult_AfterTimeout_ShouldKeepOutcomePartial) {
    TaskRegistry registry(2);
    registry.create(1, FETCH, {}, in(50ms));
    registry.record_result(1, FETCH, result_from("a"));
    ASSERT_FALSE(registry.wait_for_completion(1));

    // The last robot answers between the timeout and finalization
    auto straggler = registry.record_result(1, FETCH, result_from("b"));

    EXPECT_FALSE(straggler.recorded);
    EXPECT_FALSE(straggler.first_to_complete);
    auto outcome = registry.finalize_and_remove(1);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->all_responded);
    EXPECT_EQ(outcome->responded(), 1);
}

TEST(TaskRegistryTest, WaitForCompletion_AlreadyComplete_ShouldReturnImmediately) {
    TaskRegistry registry(1);
    registry.create(1, FETCH, {}, in(5s));
    registry.record_result(1, FETCH, result_from("a"));

    EXPECT_TRUE(registry.wait_for_completion(1));
}

TEST(TaskRegistryTest, WaitForCompletion_UnknownTask_ShouldReturnFalse) {
    TaskRegistry registry(1);

    EXPECT_FALSE(registry.wait_for_completion(7));
}

// =============================================================================
// Finalize Tests
// =============================================================================

TEST(TaskRegistryTest, FinalizeAndRemove_ShouldSnapshotAndForgetTask) {
    TaskRegistry registry(2);
    registry.create(1, RESTOCK, {{"milk", 4}}, in(1s));
    registry.record_result(1, RESTOCK, result_from("robot_dairy"));

    auto outcome = registry.finalize_and_remove(1);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->task_type, RESTOCK);
    ASSERT_EQ(outcome->items.size(), 1u);
    EXPECT_EQ(outcome->items[0], (LineItem{"milk", 4}));
    EXPECT_EQ(outcome->responded(), 1);
    EXPECT_EQ(outcome->expected_responses, 2);
    EXPECT_FALSE(outcome->all_responded);
    EXPECT_FALSE(registry.contains(1));
    EXPECT_FALSE(registry.finalize_and_remove(1).has_value());
}

TEST(TaskRegistryTest, RecordResult_AfterFinalize_ShouldBeDiscarded) {
    TaskRegistry registry(2);
    registry.create(1, FETCH, {}, in(1s));
    registry.finalize_and_remove(1);

    auto late = registry.record_result(1, FETCH, result_from("robot_meat"));

    EXPECT_FALSE(late.recorded);
    EXPECT_EQ(registry.size(), 0u);
}
