#pragma once

#include "util/executor.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

// Fixed number of worker threads draining a FIFO queue.
class WorkerPool : public Executor {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void post(std::function<void()> task) override;

    // Lets running tasks finish, discards queued ones and joins the workers.
    void stop();

    size_t queued() const;

private:
    void run(std::stop_token st);

    mutable std::mutex mu_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> queue_;
    std::vector<std::jthread> workers_;
};
