#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// fifo with a fixed capacity, push blocks while it is full
template <typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(size_t capacity) : capacity(capacity ? capacity : 1) {}

    // false once the queue got closed
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mtx);
        not_full.wait(lock, [this]
                      { return closed || items.size() < capacity; });

        if (closed)
            return false;

        items.push_back(std::move(item));
        not_empty.notify_one();
        return true;
    }

    // nullopt when closed and drained
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(mtx);
        not_empty.wait(lock, [this]
                       { return closed || !items.empty(); });

        if (items.empty())
            return std::nullopt;

        T item = std::move(items.front());
        items.pop_front();
        not_full.notify_one();
        return item;
    }

    // pending items are still handed out by pop
    void close()
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
        not_empty.notify_all();
        not_full.notify_all();
    }

private:
    std::mutex mtx;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<T> items;
    const size_t capacity;
    bool closed = false;
};
