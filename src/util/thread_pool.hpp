#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace objfs {

/**
 * ThreadPool - Fixed set of workers draining a bounded task queue
 *
 * submit() blocks while the queue is full, so producers that outrun the
 * workers are throttled instead of buffering without limit. Exceptions thrown
 * by a task are delivered through its future. The destructor drains queued
 * tasks and joins the workers.
 */
class ThreadPool {
public:
    // max_queue_size: 0 = unbounded
    explicit ThreadPool(std::size_t num_threads, std::size_t max_queue_size = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (max_queue_size_ > 0) {
                queue_not_full_.wait(lock, [this] {
                    return tasks_.size() < max_queue_size_ || stopping_;
                });
            }
            if (stopping_) {
                throw std::runtime_error("Cannot submit to stopped thread pool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        queue_not_empty_.notify_one();
        return result;
    }

    // Finish queued tasks, then join the workers. Idempotent.
    void shutdown();

    std::size_t size() const { return workers_.size(); }

    std::size_t pending() const;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable queue_not_empty_;
    std::condition_variable queue_not_full_;

    std::size_t max_queue_size_;
    bool stopping_ = false;
};

} // namespace objfs
