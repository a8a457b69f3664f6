#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * Fixed-size pool of worker threads draining a FIFO task queue.
 * The destructor finishes every queued task before joining.
 */
class WorkerPool
{
public:
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;
    WorkerPool(WorkerPool &&) = delete;
    WorkerPool &operator=(WorkerPool &&) = delete;

    /**
     * Queue a callable and get a future for its result.
     * An exception thrown by the callable is stored in the future.
     *
     * @throws std::runtime_error if the pool is shutting down
     */
    template <typename Fn>
    auto submit(Fn &&fn) -> std::future<std::invoke_result_t<Fn>>
    {
        using Result = std::invoke_result_t<Fn>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        enqueue([task]()
                { (*task)(); });
        return future;
    }

    size_t workerCount() const { return threads_.size(); }

private:
    void enqueue(std::function<void()> job);
    void stop();
    void workerLoop();

    std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<std::function<void()>> jobs_;
    bool shutdown_ = false;

    std::vector<std::thread> threads_;
};
