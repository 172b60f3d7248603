#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace GlobalSend {

    /**
     * @brief Fixed-size worker pool.
     *
     * Each transfer engine owns one; the engine bounds how many of its
     * tasks are queued at once, the pool itself does not.
     */
    class ThreadPool {
    public:
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a callable; its result (or exception) arrives through the future.
         *
         * After shutdown() the task is dropped and the future reports
         * std::future_error (broken promise).
         */
        template<typename F>
        auto enqueue(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using R = std::invoke_result_t<std::decay_t<F>>;

            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
            std::future<R> fut = task->get_future();

            post([task]() {
                (*task)();
            });

            return fut;
        }

        std::size_t size() const { return workers_.size(); }

        /**
         * @brief Stop accepting work, finish what is queued, join workers.
         */
        void shutdown();

    private:
        void workerLoop();
        void post(std::function<void()> task);

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_{false};
    };

} // namespace GlobalSend
