#include "WorkerPool.hpp"

#include "Logger.hpp"

#include <pthread.h>

#define MODULE "WorkerPool"

WorkerPool::WorkerPool(std::string name, size_t threads, size_t queueCapacity)
    : name_(std::move(name))
    , capacity_(queueCapacity ? queueCapacity : 1)
{
    if (threads == 0)
        threads = 1;
    for (size_t i = 0; i < threads; i++)
        threads_.emplace_back(&WorkerPool::run, this, i);
    LOG_DEBUG("WorkerPool " << name_ << " started " << threads << " thread(s), queue " << capacity_);
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
            return;
        stopping_ = true;
    }
    has_job_.notify_all();
    has_room_.notify_all();

    for (auto &t : threads_)
    {
        if (t.joinable())
            t.join();
    }
    LOG_DEBUG("WorkerPool " << name_ << " stopped");
}

size_t WorkerPool::queued() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void WorkerPool::enqueue(std::function<void()> job)
{
    std::unique_lock<std::mutex> lock(mutex_);
    has_room_.wait(lock, [this] { return stopping_ || jobs_.size() < capacity_; });
    if (stopping_)
        throw std::runtime_error("worker pool " + name_ + " is shut down");
    jobs_.emplace_back(std::move(job));
    has_job_.notify_one();
}

void WorkerPool::run(size_t index)
{
    std::string threadName = (name_ + std::to_string(index)).substr(0, 15);
    pthread_setname_np(pthread_self(), threadName.c_str());

    for (;;)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            has_job_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty())
                return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        has_room_.notify_one();

        // packaged_task stores exceptions in the future, nothing escapes here
        job();
    }
}
