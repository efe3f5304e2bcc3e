#ifndef TETHER_THREAD_POOL_HPP
#define TETHER_THREAD_POOL_HPP

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tether::concurrency {
    // A pool of one thread doubles as a serial queue: tasks run in the order they were enqueued.
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        void enqueue(std::function<void()> next_task);
        void wait_all();
        [[nodiscard]] bool runs_on_current_thread() const;

       private:
        std::vector<std::thread> threads_;  // reserve
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::atomic<bool> stop_ = false;
        size_t active_tasks_ = 0;
        std::condition_variable completion_cv_;
    };
}  // namespace tether::concurrency

#endif
