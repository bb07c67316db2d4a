#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

// Fixed-size worker pool. One pool is created per pipeline phase so each phase
// gets its own concurrency ceiling.
class ThreadPool
{
public:
    explicit ThreadPool(size_t ThreadCount);
    ~ThreadPool();

    // Non-copyable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Submit(std::function<void()> Job);

    // Blocks until every submitted job has finished running.
    void Join();

    size_t GetThreadCount() const;

private:
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;

    std::mutex ThreadPoolMutex;
    std::condition_variable ThreadPool_CV;
    std::condition_variable ThreadPoolIdle_CV;
    bool ThreadPoolStop;
    size_t ThreadPoolPendingJobs;

    void WorkerThread();
};
