#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <exception>

ThreadPool::ThreadPool(size_t ThreadCount): ThreadPoolStop(false), ThreadPoolPendingJobs(0)
{
    if (ThreadCount == 0)
    {
        ThreadCount = 1;
    }
    for (size_t i = 0; i < ThreadCount; ++i)
    {
        Workers.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        ThreadPoolStop = true;
    }
    ThreadPool_CV.notify_all();
    for (std::thread& Worker : Workers)
    {
        if (Worker.joinable())
        {
            Worker.join();
        }
    }
}

size_t ThreadPool::GetThreadCount() const
{
    return Workers.size();
}

void ThreadPool::Submit(std::function<void()> Job)
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        Jobs.push(std::move(Job));
        ++ThreadPoolPendingJobs;
    }
    ThreadPool_CV.notify_one();
}

void ThreadPool::Join()
{
    std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
    ThreadPoolIdle_CV.wait(Lock, [this] { return ThreadPoolPendingJobs == 0; });
}

void ThreadPool::WorkerThread()
{
    while (true)
    {
        std::function<void()> Job;
        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            ThreadPool_CV.wait(Lock, [this] { return ThreadPoolStop || !Jobs.empty(); });
            if (ThreadPoolStop && Jobs.empty())
            {
                return;
            }
            Job = std::move(Jobs.front());
            Jobs.pop();
        }

        try
        {
            Job();
        }
        catch (const std::exception& e)
        {
            Log.Error(std::string("[ThreadPool] Job threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> Lock(ThreadPoolMutex);
            --ThreadPoolPendingJobs;
            if (ThreadPoolPendingJobs == 0)
            {
                ThreadPoolIdle_CV.notify_all();
            }
        }
    }
}
