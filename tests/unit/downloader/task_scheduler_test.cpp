#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <bunkget/downloader/task_scheduler.hpp>

#include "support/mock_http_adapter.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace bunkget::downloader;
using namespace std::chrono_literals;
using bunkget::test_support::RecordingTiming;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

TEST(SequentialSchedulerTest, RunsInOrderWithDelaysBetweenItems) {
    RecordingTiming timing;
    timing.fraction = 0.5;
    SequentialScheduler scheduler(timing.timing(), 500ms, 2000ms);

    std::vector<int> order;
    std::vector<ITaskScheduler::Task> tasks;
    for (int i = 0; i < 3; ++i)
        tasks.emplace_back([&order, i] { order.push_back(i); });
    scheduler.runAll(std::move(tasks));

    EXPECT_THAT(order, ElementsAre(0, 1, 2));
    EXPECT_THAT(timing.sleeps, ElementsAre(1250ms, 1250ms));
    ASSERT_EQ(timing.uniformCalls.size(), 2u);
    EXPECT_DOUBLE_EQ(timing.uniformCalls[0].first, 500.0);
    EXPECT_DOUBLE_EQ(timing.uniformCalls[0].second, 2000.0);
}

TEST(SequentialSchedulerTest, SingleTaskDoesNotSleep) {
    RecordingTiming timing;
    SequentialScheduler scheduler(timing.timing(), 500ms, 2000ms);
    int runs = 0;
    scheduler.runAll({[&runs] { ++runs; }});
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(timing.sleeps.empty());
}

TEST(SequentialSchedulerTest, ThrowingTaskDoesNotStopOthers) {
    RecordingTiming timing;
    SequentialScheduler scheduler(timing.timing(), 0ms, 0ms);
    int runs = 0;
    scheduler.runAll({[] { throw std::runtime_error("boom"); }, [&runs] { ++runs; }});
    EXPECT_EQ(runs, 1);
}

TEST(ThreadPoolSchedulerTest, RunsEveryTask) {
    ThreadPoolScheduler scheduler(4);
    std::mutex mutex;
    std::vector<int> seen;
    std::vector<ITaskScheduler::Task> tasks;
    for (int i = 0; i < 10; ++i) {
        tasks.emplace_back([&, i] {
            std::lock_guard lk(mutex);
            seen.push_back(i);
        });
    }
    scheduler.runAll(std::move(tasks));
    EXPECT_EQ(seen.size(), 10u);
}

TEST(ThreadPoolSchedulerTest, RunsTasksConcurrently) {
    ThreadPoolScheduler scheduler(2);
    std::atomic<int> arrived{0};
    std::atomic<bool> bothSeen{false};
    auto task = [&] {
        ++arrived;
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (arrived.load() < 2 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(1ms);
        if (arrived.load() == 2)
            bothSeen = true;
    };
    scheduler.runAll({task, task});
    EXPECT_TRUE(bothSeen.load());
}

TEST(ThreadPoolSchedulerTest, ThrowingTaskDoesNotStopOthers) {
    ThreadPoolScheduler scheduler(3);
    std::mutex mutex;
    std::vector<int> seen;
    auto record = [&](int v) {
        return [&, v] {
            std::lock_guard lk(mutex);
            seen.push_back(v);
        };
    };
    scheduler.runAll({record(1), [] { throw std::runtime_error("boom"); }, record(2)});
    EXPECT_THAT(seen, UnorderedElementsAre(1, 2));
}

TEST(ThreadPoolSchedulerTest, EmptyBatchReturnsImmediately) {
    ThreadPoolScheduler scheduler(4);
    scheduler.runAll({});
    SUCCEED();
}
