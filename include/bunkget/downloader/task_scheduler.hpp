#pragma once

#include <bunkget/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace bunkget::downloader {

/**
 * Runs a batch of independent tasks and returns when all of them have finished.
 * Tasks are expected to contain their own failures; one task never stops the others.
 */
class ITaskScheduler {
public:
    using Task = std::function<void()>;

    virtual ~ITaskScheduler() = default;
    virtual void runAll(std::vector<Task> tasks) = 0;
};

// In order on the calling thread, with a random pause between consecutive tasks.
class SequentialScheduler final : public ITaskScheduler {
public:
    SequentialScheduler(Timing timing, std::chrono::milliseconds minDelay,
                        std::chrono::milliseconds maxDelay);

    void runAll(std::vector<Task> tasks) override;

private:
    Timing timing_;
    std::chrono::milliseconds minDelay_;
    std::chrono::milliseconds maxDelay_;
};

// Posts every task to a boost::asio::thread_pool of `threads` workers and joins it.
class ThreadPoolScheduler final : public ITaskScheduler {
public:
    explicit ThreadPoolScheduler(std::size_t threads);

    void runAll(std::vector<Task> tasks) override;

private:
    std::size_t threads_;
};

} // namespace bunkget::downloader
