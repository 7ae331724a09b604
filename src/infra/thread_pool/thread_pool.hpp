#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <memory>
#include <type_traits>

namespace chunkup::infra {

// Fixed set of jthreads draining a FIFO of tasks. Futures carry results and
// exceptions back to the submitter.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>>;

    // Blocks until the queue is empty and no task is running.
    void wait();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

private:
    using Task = std::packaged_task<void()>;

    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    std::size_t active_tasks_ = 0;
    bool stop_ = false;
    std::vector<std::jthread> workers_; // declared last: joined before the queue goes away
};

template<typename F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>&>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    workers_.clear(); // request_stop + join; queued tasks are drained first
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, st, [this] { return !tasks_.empty() || stop_; });

            if (tasks_.empty()) {
                return; // stop requested with nothing left to run
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

} // namespace chunkup::infra
