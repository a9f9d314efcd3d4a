#include "hashtok/thread_pool.hpp"

#include <algorithm>
#include <exception>

namespace hashtok {

namespace {
thread_local bool tls_pool_worker = false;
} // anonymous namespace

bool ThreadPool::on_worker_thread() noexcept {
    return tls_pool_worker;
}

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::worker_loop() {
    tls_pool_worker = true;
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
}

void ThreadPool::parallel_for_index(size_t start, size_t end,
                                    const std::function<void(size_t)>& func) {
    if (start >= end) return;

    if (on_worker_thread()) {
        for (size_t i = start; i < end; ++i) {
            func(i);
        }
        return;
    }

    size_t count = end - start;
    size_t chunk_size = (count + workers_.size() - 1) / workers_.size();

    std::vector<std::future<void>> futures;
    futures.reserve((count + chunk_size - 1) / chunk_size);

    for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk_size) {
        size_t chunk_end = std::min(chunk_start + chunk_size, end);
        futures.push_back(submit([&func, chunk_start, chunk_end] {
            for (size_t i = chunk_start; i < chunk_end; ++i) {
                func(i);
            }
        }));
    }

    // Wait for every chunk before rethrowing: tasks reference `func`
    std::exception_ptr first_error;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

ThreadPool& get_thread_pool() {
    static ThreadPool pool;
    return pool;
}

} // namespace hashtok
