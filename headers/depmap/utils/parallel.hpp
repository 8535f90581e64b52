//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef DEPMAP_PARALLEL_HPP
#define DEPMAP_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Thread pool and an order-preserving parallel map.
 *
 * Per-module import extraction runs through parallel::map; results come
 * back in input order, so scan output never depends on scheduling.
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace depmap::parallel {

    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Fixed-size worker pool. Destruction finishes every queued task,
     * then joins.
     */
    class ThreadPool {
    public:
        /**
         * @param num_threads Number of workers (0 = hardware concurrency).
         */
        explicit ThreadPool(unsigned int num_threads = 0) {
            const unsigned int count = num_threads == 0 ? hardware_concurrency() : num_threads;
            workers_.reserve(count);
            for (unsigned int i = 0; i < count; ++i) {
                workers_.emplace_back([this] { run_worker(); });
            }
        }

        ~ThreadPool() {
            {
                std::lock_guard lock(mutex_);
                stopping_ = true;
            }
            work_available_.notify_all();
            for (auto& worker : workers_) {
                worker.join();
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues f; exceptions it throws surface from the future's get().
         */
        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using R = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
            auto future = task->get_future();
            {
                std::lock_guard lock(mutex_);
                if (stopping_) {
                    throw std::runtime_error("Thread pool is shutting down");
                }
                queue_.emplace_back([task] { (*task)(); });
            }
            work_available_.notify_one();
            return future;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void run_worker() {
            for (;;) {
                std::function<void()> task;
                {
                    std::unique_lock lock(mutex_);
                    work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                    if (queue_.empty()) {
                        return;
                    }
                    task = std::move(queue_.front());
                    queue_.pop_front();
                }
                task();
            }
        }

        std::vector<std::thread> workers_;
        std::deque<std::function<void()>> queue_;
        std::mutex mutex_;
        std::condition_variable work_available_;
        bool stopping_ = false;
    };

    /**
     * Applies f to every item on the pool; output order matches input
     * order. Items are handed out in contiguous chunks, a few per worker.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using R = std::invoke_result_t<F, const T&>;

        std::vector<std::optional<R>> slots(items.size());
        const std::size_t chunks = std::max<std::size_t>(1, std::min(items.size(), pool.size() * 4));
        const std::size_t chunk_size = (items.size() + chunks - 1) / chunks;

        std::vector<std::future<void>> pending;
        pending.reserve(chunks);
        for (std::size_t begin = 0; begin < items.size(); begin += chunk_size) {
            const std::size_t end = std::min(items.size(), begin + chunk_size);
            pending.push_back(pool.submit([&items, &slots, &f, begin, end] {
                for (std::size_t i = begin; i < end; ++i) {
                    slots[i].emplace(f(items[i]));
                }
            }));
        }
        // slots must outlive every chunk, so wait for all before rethrowing
        std::exception_ptr first_failure;
        for (auto& chunk : pending) {
            try {
                chunk.get();
            } catch (...) {
                if (!first_failure) {
                    first_failure = std::current_exception();
                }
            }
        }
        if (first_failure) {
            std::rethrow_exception(first_failure);
        }

        std::vector<R> results;
        results.reserve(items.size());
        for (auto& slot : slots) {
            results.push_back(std::move(*slot));
        }
        return results;
    }

    /**
     * Runs map on a pool of num_threads workers; a single thread (or a
     * single item) runs inline on the caller.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, const unsigned int num_threads)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using R = std::invoke_result_t<F, const T&>;

        const unsigned int workers = num_threads == 0 ? hardware_concurrency() : num_threads;
        if (workers <= 1 || items.size() <= 1) {
            std::vector<R> results;
            results.reserve(items.size());
            for (const auto& item : items) {
                results.push_back(f(item));
            }
            return results;
        }

        ThreadPool pool(workers);
        return map(items, std::forward<F>(f), pool);
    }

}  // namespace depmap::parallel

#endif //DEPMAP_PARALLEL_HPP
