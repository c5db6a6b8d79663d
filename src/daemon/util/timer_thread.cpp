#include "util/timer_thread.hpp"

TimerThread::TimerThread()
    : thread_([this](std::stop_token st) { run(st); }) {}

TimerThread::~TimerThread() {
    stop();
}

Scheduler::TimerId TimerThread::schedule(std::chrono::milliseconds delay,
                                         std::function<void()> task) {
    TimerId id;
    {
        std::lock_guard lock(mu_);
        id = next_id_++;
        auto deadline = Clock::now() + delay;
        tasks_.emplace(Key{deadline, id}, std::move(task));
        deadlines_.emplace(id, deadline);
    }
    cv_.notify_one();
    return id;
}

void TimerThread::cancel(TimerId id) {
    std::lock_guard lock(mu_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) return;
    tasks_.erase(Key{it->second, id});
    deadlines_.erase(it);
}

void TimerThread::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        cv_.notify_all();
        thread_.join();
    }
    std::lock_guard lock(mu_);
    tasks_.clear();
    deadlines_.clear();
}

void TimerThread::run(std::stop_token st) {
    std::unique_lock lock(mu_);
    while (!st.stop_requested()) {
        if (tasks_.empty()) {
            cv_.wait(lock, st, [this] { return !tasks_.empty(); });
            continue;
        }

        auto deadline = tasks_.begin()->first.first;
        if (Clock::now() < deadline) {
            // Wakes early when a sooner task is scheduled or the stop is requested.
            cv_.wait_until(lock, st, deadline, [this, deadline] {
                return !tasks_.empty() && tasks_.begin()->first.first < deadline;
            });
            continue;
        }

        auto node = tasks_.extract(tasks_.begin());
        deadlines_.erase(node.key().second);

        lock.unlock();
        node.mapped()();
        lock.lock();
    }
}
