#include <exception>

#include <spdlog/spdlog.h>

#include "aux/ThreadPool.hpp"

ThreadPool::ThreadPool(size_t nThreads)
    : _stopping(false)
{
    if (nThreads == 0)
    {
        nThreads = 1;
    }

    _workers.reserve(nThreads);
    while (_workers.size() < nThreads)
    {
        _workers.emplace_back(&ThreadPool::runWorker, this);
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping)
        {
            spdlog::warn("ThreadPool: job submitted after shutdown was dropped");
            return false;
        }
        _jobs.push(std::move(job));
    }

    _wake.notify_one();
    return true;
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
    }

    _wake.notify_all();

    // Workers finish the queued jobs before they exit
    for (auto &worker : _workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

// Pulls jobs until the pool is stopping and the queue is drained
void ThreadPool::runWorker()
{
    while (true)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _wake.wait(lock, [this] { return _stopping || !_jobs.empty(); });

            if (_stopping && _jobs.empty())
            {
                return;
            }

            job = std::move(_jobs.front());
            _jobs.pop();
        }

        // A failing job must never take its worker (or the process) down
        try
        {
            job();
        }
        catch (const std::exception &e)
        {
            spdlog::error("ThreadPool: job failed: {}", e.what());
        }
    }
}
