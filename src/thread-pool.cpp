#include <stdexcept>
#include "../include/thread-pool.hpp"

ThreadPool::ThreadPool(size_t threads, size_t queue_capacity) : tasks(queue_capacity)
{
    if (threads == 0)
        threads = default_threads();

    workers.reserve(threads);
    for (size_t i = 0; i < threads; i++)
        workers.emplace_back([this]
                             { worker_loop(); });
}

ThreadPool::~ThreadPool()
{
    tasks.close();

    for (auto &worker : workers)
        if (worker.joinable())
            worker.join();
}

void ThreadPool::post(std::function<void()> task)
{
    if (!tasks.push(std::move(task)))
        throw std::logic_error("task posted to a stopped thread pool");
}

size_t ThreadPool::size() const
{
    return workers.size();
}

size_t ThreadPool::default_threads()
{
    const unsigned int hardware = std::thread::hardware_concurrency();
    return hardware ? hardware : 2;
}

void ThreadPool::worker_loop()
{
    while (auto task = tasks.pop())
        (*task)();
}
