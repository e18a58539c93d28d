/**
 * Fixed-size thread pool for independent read-only work.
 *
 * Workers pull tasks from a shared FIFO queue. Used by the sentence
 * synthesizer to spread best-of-N attempts across cores.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace babbler {

class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(size_t num_threads) : num_threads_(std::max(size_t(1), num_threads)) {
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();

        return result;
    }

    /**
     * Parallel reduce over [begin, end).
     *
     * Each index is reduced independently from `init`; partial results are
     * combined in index order, so the outcome does not depend on scheduling.
     * Exceptions thrown by `reduce` propagate out of this call.
     */
    template<typename T, typename ReduceFunc, typename CombineFunc>
    T parallel_reduce(size_t begin, size_t end, T init, ReduceFunc&& reduce, CombineFunc&& combine) {
        if (begin >= end) return init;

        std::vector<std::future<T>> futures;
        futures.reserve(end - begin);

        for (size_t i = begin; i < end; ++i) {
            futures.push_back(submit([&reduce, init, i]() {
                return reduce(init, i);
            }));
        }

        // Drain every future before rethrowing; pending tasks reference `reduce`
        T result = init;
        std::exception_ptr error;
        for (auto& future : futures) {
            try {
                T partial = future.get();
                if (!error) result = combine(result, partial);
            } catch (...) {
                if (!error) error = std::current_exception();
            }
        }
        if (error) std::rethrow_exception(error);
        return result;
    }

    size_t num_threads() const { return num_threads_; }

private:
    void worker_loop() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

} // namespace babbler
