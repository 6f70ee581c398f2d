#ifndef CASEPATH_THREAD_POOL_INL
#define CASEPATH_THREAD_POOL_INL

#ifdef CASEPATH_THREAD_POOL_HPP

template <typename F, typename... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result_t<F, Args...>>
{
    using return_type = typename std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [f = std::forward<F>(f), ... args = std::forward<Args>(args)]() mutable
        {
            return f(std::move(args)...);
        });

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        if (stopping)
        {
            throw std::runtime_error("cannot enqueue on stopped thread pool");
        }
        tasks.emplace([task]()
                      { (*task)(); });
    }

    condition.notify_one();
    return res;
}

#endif // CASEPATH_THREAD_POOL_HPP
#endif // CASEPATH_THREAD_POOL_INL
