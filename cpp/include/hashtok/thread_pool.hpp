/**
 * Thread pool for batch tokenization
 *
 * Fixed set of workers draining a shared task queue. Batch calls submit one
 * task per chunk of items and wait on the futures, so exceptions thrown by
 * an item surface in the calling thread.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace hashtok {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);  // 0 = hardware concurrency
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit work and get future
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.push([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    /**
     * Runs func(i) for every i in [start, end), split into contiguous chunks.
     * Blocks until every chunk finished. If any call throws, the exception of
     * the lowest-indexed failing chunk is rethrown after all chunks settled.
     * Called from a worker of any ThreadPool, the range runs inline on that
     * worker, so nested batches cannot wait on tasks queued behind themselves.
     */
    void parallel_for_index(size_t start, size_t end,
                            const std::function<void(size_t)>& func);

    size_t size() const { return workers_.size(); }

    // True on threads owned by some ThreadPool
    static bool on_worker_thread() noexcept;

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

// Shared pool, created on first use with hardware concurrency workers
ThreadPool& get_thread_pool();

} // namespace hashtok
