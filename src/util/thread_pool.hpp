#ifndef DDSLEDGER_UTIL_THREAD_POOL_HPP
#define DDSLEDGER_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to bound peer requests with a deadline
 *        (see network/timeout_transport.hpp).
 *
 * Usage Example:
 *  @code
 *    ddsledger::util::ThreadPool pool(4);
 *    auto fut = pool.enqueue([] { return transport.RequestChunk(peer, id); });
 *    if (fut.wait_for(std::chrono::milliseconds(500)) == std::future_status::timeout) { ... }
 *  @endcode
 *
 * Futures returned by enqueue() come from std::packaged_task, so dropping one that has
 * not completed does not block the caller; the worker finishes the task in the background.
 */

namespace ddsledger {
namespace util {

class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queueMutex_);
                        condVar_.wait(lock, [this] {
                            return !taskQueue_.empty() || stop_;
                        });

                        if (stop_ && taskQueue_.empty()) {
                            return;
                        }
                        task = std::move(taskQueue_.front());
                        taskQueue_.pop();
                    }
                    task();
                }
            });
        }
    }

    /**
     * @brief Stops accepting tasks, drains the queue and joins the workers.
     */
    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const
    {
        return workers_.size();
    }

    /**
     * @brief Enqueue a callable; exceptions it throws surface from future::get().
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace ddsledger

#endif // DDSLEDGER_UTIL_THREAD_POOL_HPP
