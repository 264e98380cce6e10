#pragma once

#include <vector>
#include <thread>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <cstddef>

namespace LanScout {

    /**
     * @brief Fixed-size worker pool owned by one component.
     *
     * Each scan component owns its pool so that tearing a session down joins
     * every worker it started. There is no global instance.
     */
    class ThreadPool {
    public:
        /**
         * @throws std::system_error when a worker thread cannot be created.
         */
        ThreadPool(std::size_t threadCount, std::string name);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Enqueue a task for execution.
         * @return future that becomes ready when the task finishes, or is
         *         abandoned (broken_promise) if the task is discarded by
         *         shutdown(false). An invalid future is returned after shutdown.
         */
        template<typename F>
        std::future<void> enqueue(F&& func) {
            auto task = std::make_shared<std::packaged_task<void()>>(std::forward<F>(func));
            std::future<void> fut = task->get_future();

            if (!post([task]() { (*task)(); })) {
                return std::future<void>();
            }
            return fut;
        }

        /**
         * @brief Stop all workers.
         * @param drain run queued tasks before stopping; when false queued
         *        tasks are dropped and only running tasks are waited for.
         *        Must not be called from one of this pool's workers.
         */
        void shutdown(bool drain = true);

        std::size_t size() const { return workerCount_; }
        std::size_t pending() const;
        const std::string& name() const { return name_; }

    private:
        void workerLoop();
        bool post(std::function<void()> task);

        std::string name_;
        std::size_t workerCount_{0};
        std::vector<std::thread> workers_;
        std::deque<std::function<void()>> tasks_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_{false};
    };

} // namespace LanScout
