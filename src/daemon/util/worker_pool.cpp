#include "util/worker_pool.hpp"

#include <algorithm>
#include <print>

WorkerPool::WorkerPool(size_t threads) {
    threads = std::max<size_t>(threads, 1);
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { run(st); });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard lock(mu_);
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::stop() {
    for (auto& w : workers_) w.request_stop();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();

    std::lock_guard lock(mu_);
    if (!queue_.empty()) {
        std::println(stderr, "workers: dropping {} queued task(s) on shutdown", queue_.size());
        queue_.clear();
    }
}

size_t WorkerPool::queued() const {
    std::lock_guard lock(mu_);
    return queue_.size();
}

void WorkerPool::run(std::stop_token st) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mu_);
            // wait() still reports a non-empty queue after a stop request.
            if (!cv_.wait(lock, st, [this] { return !queue_.empty(); }) || st.stop_requested()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}
