#pragma once
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>
#include "bounded-queue.hpp"

// fixed set of workers fed through a bounded queue, submitting blocks while the queue is full
class ThreadPool
{
public:
    ThreadPool(size_t threads, size_t queue_capacity);
    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    // runs every queued task, then joins the workers
    ~ThreadPool();

    // the task must not throw
    void post(std::function<void()> task);

    // exceptions thrown by the task surface through the future
    template <typename F>
    auto submit(F &&task) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;

        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        std::future<R> result = packaged->get_future();

        post([packaged]
             { (*packaged)(); });

        return result;
    }

    size_t size() const;

    static size_t default_threads();

private:
    BoundedQueue<std::function<void()>> tasks;
    std::vector<std::thread> workers;

    void worker_loop();
};
