#include "thread_pool.hpp"

ThreadPool::ThreadPool(size_t numThreads)
{
    if (numThreads == 0)
    {
        throw std::invalid_argument("Thread pool needs at least one thread");
    }

    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; i++)
    {
        workers.emplace_back([this, i]
                             { workerThread(i); });
    }

    Logger::getInstance()->debug("Thread pool initialized with " +
                                 std::to_string(numThreads) + " threads");
}

void ThreadPool::workerThread(size_t id)
{
    pthread_setname_np(pthread_self(), ("resolver-" + std::to_string(id)).c_str());

    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this]
                           { return stopping || !tasks.empty(); });

            if (stopping && tasks.empty())
            {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
        }
        // packaged_task stores any exception in its future
        task();
    }
}

void ThreadPool::stop()
{
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        if (stopping)
        {
            return;
        }
        stopping = true;
    }
    condition.notify_all();

    for (auto &worker : workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

ThreadPool::~ThreadPool()
{
    stop();
}
