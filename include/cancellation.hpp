#pragma once
#include <atomic>
#include "errors.hpp"

// set from a signal handler or another thread, polled by the pipelines
class CancellationToken
{
public:
    void cancel() { cancelled.store(true, std::memory_order_relaxed); }

    bool is_cancelled() const { return cancelled.load(std::memory_order_relaxed); }

    void throw_if_cancelled() const
    {
        if (is_cancelled())
            throw CancelledError();
    }

private:
    std::atomic<bool> cancelled{false};
};
