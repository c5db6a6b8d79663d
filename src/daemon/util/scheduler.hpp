#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// Delayed one-shot tasks. Tasks with equal deadlines run in submission order.
class Scheduler {
public:
    using TimerId = uint64_t;
    static constexpr TimerId kNoTimer = 0;

    virtual ~Scheduler() = default;
    virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;
    // No effect if the task already ran or is running.
    virtual void cancel(TimerId id) = 0;
};
