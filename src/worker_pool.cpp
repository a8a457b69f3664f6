#include "worker_pool.hpp"

#include <stdexcept>
#include <system_error>

WorkerPool::WorkerPool(size_t workers)
{
    if (workers == 0)
    {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }

    threads_.reserve(workers);
    try
    {
        for (size_t i = 0; i < workers; ++i)
        {
            threads_.emplace_back(&WorkerPool::workerLoop, this);
        }
    }
    catch (const std::system_error &)
    {
        stop();
        throw;
    }
}

WorkerPool::~WorkerPool()
{
    stop();
}

void WorkerPool::stop()
{
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_ = true;
    }
    jobAvailable_.notify_all();

    for (auto &thread : threads_)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
}

void WorkerPool::enqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdown_)
        {
            throw std::runtime_error("Cannot submit to a stopped WorkerPool");
        }
        jobs_.push(std::move(job));
    }
    jobAvailable_.notify_one();
}

void WorkerPool::workerLoop()
{
    while (true)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this]()
                               { return shutdown_ || !jobs_.empty(); });

            // Drain the queue before honoring shutdown
            if (jobs_.empty())
            {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }

        // packaged_task stores exceptions in its future
        job();
    }
}
