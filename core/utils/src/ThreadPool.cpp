#include "ThreadPool.h"
#include "Logger.h"

#include <exception>
#include <system_error>

namespace LanScout {

    ThreadPool::ThreadPool(std::size_t threadCount, std::string name)
        : name_(std::move(name)) {
        if (threadCount == 0) {
            threadCount = 1;
        }

        workers_.reserve(threadCount);
        try {
            for (std::size_t i = 0; i < threadCount; ++i) {
                workers_.emplace_back(&ThreadPool::workerLoop, this);
            }
        } catch (const std::system_error&) {
            // Join whatever started before propagating
            shutdown(false);
            throw;
        }
        workerCount_ = workers_.size();
    }

    ThreadPool::~ThreadPool() {
        shutdown(false);
    }

    void ThreadPool::shutdown(bool drain) {
        std::deque<std::function<void()>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!stopping_) {
                stopping_ = true;
                if (!drain) {
                    dropped.swap(tasks_);
                }
            }
        }

        cv_.notify_all();

        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }
        workers_.clear();

        if (!dropped.empty()) {
            Logger::instance().debug("Discarded " + std::to_string(dropped.size()) +
                                     " queued task(s)", name_);
        }
        // Destroying the dropped packaged_tasks breaks their promises here
    }

    std::size_t ThreadPool::pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    bool ThreadPool::post(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return false;
            }
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    void ThreadPool::workerLoop() {
        for (;;) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() {
                    return stopping_ || !tasks_.empty();
                });

                if (stopping_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop_front();
            }

            if (task) {
                try {
                    task();
                } catch (const std::exception& e) {
                    // packaged_task stores exceptions in the future; this only
                    // guards plain callables
                    Logger::instance().error(std::string("Worker task threw: ") + e.what(), name_);
                }
            }
        }
    }

} // namespace LanScout
