#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rehost {

std::size_t computeWorkerCount(std::size_t requested);

// Fixed-size pool draining a FIFO of independent work items.
// Items must not throw; callers capture their own failures.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t workerCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void enqueue(std::function<void()> task);

    // Blocks until the queue is empty and no item is running.
    void wait();

    void shutdown();

private:
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::queue<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
    std::size_t running_ = 0;
    bool stopping_ = false;
};

} // namespace rehost
