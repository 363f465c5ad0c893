#pragma once
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

// collects results pushed in any order and hands them out by ascending sequence number
template <typename T>
class OrderedQueue
{
public:
    void push(uint64_t sequence, T item)
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending.emplace(sequence, std::move(item));
        ready.notify_all();
    }

    // blocks until the item with the next sequence number arrives
    T pop_next()
    {
        std::unique_lock<std::mutex> lock(mtx);
        ready.wait(lock, [this]
                   { return !pending.empty() && pending.begin()->first == next_sequence; });

        return take_front();
    }

    std::optional<T> try_pop_next()
    {
        std::lock_guard<std::mutex> lock(mtx);

        if (pending.empty() || pending.begin()->first != next_sequence)
            return std::nullopt;

        return take_front();
    }

private:
    std::mutex mtx;
    std::condition_variable ready;
    std::map<uint64_t, T> pending;
    uint64_t next_sequence = 0;

    T take_front()
    {
        auto node = pending.extract(pending.begin());
        next_sequence++;
        return std::move(node.mapped());
    }
};
