#pragma once

#include "util/scheduler.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

// Scheduler backed by one thread. Tasks run on that thread, one at a time,
// so it doubles as a serial queue for work posted with a zero delay.
class TimerThread : public Scheduler {
public:
    TimerThread();
    ~TimerThread() override;

    TimerThread(const TimerThread&) = delete;
    TimerThread& operator=(const TimerThread&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(TimerId id) override;

    // Joins the thread; pending tasks are dropped.
    void stop();

private:
    using Clock = std::chrono::steady_clock;
    // Ordered by deadline, then id, so equal deadlines keep submission order.
    using Key = std::pair<Clock::time_point, TimerId>;

    void run(std::stop_token st);

    std::mutex mu_;
    std::condition_variable_any cv_;
    std::map<Key, std::function<void()>> tasks_;
    std::map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_ = 1;
    std::jthread thread_;
};
