#include "core/worker_pool.hpp"

#include <utility>

namespace rehost
{

    std::size_t computeWorkerCount(std::size_t requested)
    {
        if (requested > 0)
        {
            return requested;
        }
        unsigned int cpu = std::thread::hardware_concurrency();
        if (cpu == 0)
        {
            return 4;
        }
        if (cpu < 2)
        {
            return 2;
        }
        if (cpu > 8)
        {
            return 8;
        }
        return static_cast<std::size_t>(cpu);
    }

    WorkerPool::WorkerPool(std::size_t workerCount)
    {
        if (workerCount == 0)
        {
            workerCount = 1;
        }
        workers_.reserve(workerCount);
        for (std::size_t i = 0; i < workerCount; ++i)
        {
            workers_.emplace_back([this]()
                                  { workerLoop(); });
        }
    }

    WorkerPool::~WorkerPool()
    {
        shutdown();
    }

    void WorkerPool::enqueue(std::function<void()> task)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            return;
        }
        queue_.push(std::move(task));
        cv_.notify_one();
    }

    void WorkerPool::wait()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idleCv_.wait(lock, [this]()
                     { return queue_.empty() && running_ == 0; });
    }

    void WorkerPool::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
            cv_.notify_all();
        }

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void WorkerPool::workerLoop()
    {
        for (;;)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]()
                         { return stopping_ || !queue_.empty(); });

                if (stopping_ && queue_.empty())
                {
                    return;
                }

                task = std::move(queue_.front());
                queue_.pop();
                ++running_;
            }

            if (task)
            {
                task();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --running_;
                if (queue_.empty() && running_ == 0)
                {
                    idleCv_.notify_all();
                }
            }
        }
    }

} // namespace rehost
