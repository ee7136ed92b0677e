#include <bunkget/downloader/task_scheduler.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>

namespace bunkget::downloader {

namespace {

void runGuarded(const ITaskScheduler::Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("Batch task failed: {}", e.what());
    }
}

} // namespace

SequentialScheduler::SequentialScheduler(Timing timing, std::chrono::milliseconds minDelay,
                                         std::chrono::milliseconds maxDelay)
    : timing_(std::move(timing)), minDelay_(minDelay), maxDelay_(std::max(minDelay, maxDelay)) {
    auto defaults = makeDefaultTiming();
    if (!timing_.sleep)
        timing_.sleep = std::move(defaults.sleep);
    if (!timing_.uniform)
        timing_.uniform = std::move(defaults.uniform);
}

void SequentialScheduler::runAll(std::vector<Task> tasks) {
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (i > 0) {
            const double ms = timing_.uniform(static_cast<double>(minDelay_.count()),
                                              static_cast<double>(maxDelay_.count()));
            timing_.sleep(std::chrono::milliseconds(static_cast<std::int64_t>(ms)));
        }
        runGuarded(tasks[i]);
    }
}

ThreadPoolScheduler::ThreadPoolScheduler(std::size_t threads)
    : threads_(std::max<std::size_t>(1, threads)) {}

void ThreadPoolScheduler::runAll(std::vector<Task> tasks) {
    if (tasks.empty())
        return;

    boost::asio::thread_pool pool{std::min(threads_, tasks.size())};
    for (auto& task : tasks) {
        boost::asio::post(pool, [t = std::move(task)]() { runGuarded(t); });
    }
    pool.join();
}

} // namespace bunkget::downloader
