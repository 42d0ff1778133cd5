#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

// Fixed set of workers running transfer jobs in submission order
class ThreadPool
{
public:
    explicit ThreadPool(size_t nThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    // False if the pool is already shutting down and the job was dropped
    bool enqueue(std::function<void()> job);

    // Runs the remaining queued jobs, then joins the workers. Idempotent.
    void shutdown();

private:
    void runWorker();

    std::vector<std::thread> _workers;
    std::queue<std::function<void()>> _jobs;
    std::mutex _mutex;
    std::condition_variable _wake;
    bool _stopping;
};

#endif
