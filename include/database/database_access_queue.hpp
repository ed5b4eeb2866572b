#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Owns the one thread allowed to touch a SQLite handle
 *
 * Operations run strictly in submission order. A result or exception raised by
 * an operation is handed back through its future.
 */
class DatabaseAccessQueue
{
public:
    explicit DatabaseAccessQueue(const std::string &name);
    ~DatabaseAccessQueue();

    DatabaseAccessQueue(const DatabaseAccessQueue &) = delete;
    DatabaseAccessQueue &operator=(const DatabaseAccessQueue &) = delete;

    template <typename T>
    std::future<T> submit(std::function<T()> operation)
    {
        auto task = std::make_shared<std::packaged_task<T()>>(std::move(operation));
        std::future<T> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                throw std::runtime_error("Database access queue '" + name_ + "' no longer accepts work");
            }
            tasks_.emplace_back([task]()
                                { (*task)(); });
        }
        wake_.notify_one();
        return result;
    }

    // Submit and block until the operation has run on the access thread
    template <typename T>
    T run(std::function<T()> operation)
    {
        return submit<T>(std::move(operation)).get();
    }

    /**
     * @brief Refuse new work, finish what is queued, join the thread
     *
     * Safe to call more than once.
     */
    void stop();

private:
    void drain();

    std::string name_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_;
    uint64_t executed_;
    std::thread worker_;
};
