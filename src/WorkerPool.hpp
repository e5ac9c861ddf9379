#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * Fixed set of threads running blocking backend calls.
 *
 * submit() blocks while queueCapacity jobs are waiting and throws
 * std::runtime_error once shutdown() has been called. Whatever the job
 * throws is rethrown by future::get().
 */
class WorkerPool
{
public:
    WorkerPool(std::string name, size_t threads, size_t queueCapacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    template <typename F>
    auto submit(F &&fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    // Finishes queued jobs, then joins the threads.
    void shutdown();

    size_t threadCount() const { return threads_.size(); }
    size_t queued() const;

private:
    void enqueue(std::function<void()> job);
    void run(size_t index);

    std::string name_;
    size_t capacity_;
    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable has_job_;
    std::condition_variable has_room_;
    bool stopping_ = false;
};

#endif // WORKER_POOL_HPP
