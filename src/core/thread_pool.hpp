/**
 * Seedhound Thread Pool
 *
 * Fixed-size worker pool shared by all drivers of a run. parallel_for()
 * waits only for the tasks it submitted, so several driver threads can fan
 * their batches out over the same pool at once.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace seedhound {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        for (size_t i = 0; i < num_threads; i++) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
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

    size_t size() const { return workers_.size(); }

    template<typename F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            tasks_.emplace(std::forward<F>(f));
        }
        cv_.notify_one();
    }

    /**
     * Run fn(begin, end) over [0, count) split into at most size() chunks
     * and block until all chunks finished. The first exception thrown by a
     * chunk is rethrown here after every chunk completed.
     *
     * Must not be called from a pool thread.
     */
    void parallel_for(size_t count, const std::function<void(size_t, size_t)>& fn) {
        if (count == 0) return;

        const size_t chunks = std::min(count, workers_.size());
        if (chunks <= 1) {
            fn(0, count);
            return;
        }

        struct TaskGroup {
            std::atomic<size_t> pending{0};
            std::mutex mutex;
            std::condition_variable cv;
            std::exception_ptr error;
        } group;
        group.pending = chunks;

        const size_t per_chunk = (count + chunks - 1) / chunks;
        for (size_t c = 0; c < chunks; c++) {
            const size_t begin = c * per_chunk;
            const size_t end = std::min(count, begin + per_chunk);
            enqueue([&group, &fn, begin, end] {
                try {
                    if (begin < end) fn(begin, end);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(group.mutex);
                    if (!group.error) group.error = std::current_exception();
                }
                std::lock_guard<std::mutex> lock(group.mutex);
                if (--group.pending == 0) group.cv.notify_all();
            });
        }

        std::unique_lock<std::mutex> lock(group.mutex);
        group.cv.wait(lock, [&group] { return group.pending == 0; });
        if (group.error) std::rethrow_exception(group.error);
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_;
};

}  // namespace seedhound
