#ifndef CASEPATH_THREAD_POOL_HPP
#define CASEPATH_THREAD_POOL_HPP

#include "common.hpp"
#include "logger.hpp"

// Fixed set of worker threads draining a shared FIFO task queue.
// Resolution blocks on filesystem I/O, so callers hand batches of paths to
// the pool instead of resolving them on their own thread.
class ThreadPool
{
private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queueMutex;
    std::condition_variable condition;
    bool stopping{false};

    void workerThread(size_t id);

public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    // throws std::runtime_error once the pool is stopping
    template <typename F, typename... Args>
    auto enqueue(F &&f, Args &&...args)
        -> std::future<typename std::invoke_result_t<F, Args...>>;

    // finish queued tasks and join the workers
    void stop();

    [[nodiscard]] size_t size() const { return workers.size(); }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
};

#include "thread_pool.inl"

#endif // CASEPATH_THREAD_POOL_HPP
