#pragma once

#include <functional>

// Runs submitted tasks asynchronously. Implementations bound their own concurrency.
class Executor {
public:
    virtual ~Executor() = default;
    virtual void post(std::function<void()> task) = 0;
};
