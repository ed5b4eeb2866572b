#include "database/database_access_queue.hpp"
#include "logging/logger.hpp"

DatabaseAccessQueue::DatabaseAccessQueue(const std::string &name)
    : name_(name), stopping_(false), executed_(0)
{
    worker_ = std::thread(&DatabaseAccessQueue::drain, this);
    Logger::debug("Database access queue '" + name_ + "' started");
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
}

void DatabaseAccessQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable())
            return;
        stopping_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable())
    {
        worker_.join();
        Logger::debug("Database access queue '" + name_ + "' stopped after " +
                      std::to_string(executed_) + " operations");
    }
}

void DatabaseAccessQueue::drain()
{
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;)
    {
        wake_.wait(lock, [this]
                   { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty())
            break; // stopping and nothing left

        std::function<void()> task = std::move(tasks_.front());
        tasks_.pop_front();

        lock.unlock();
        // Exceptions land in the packaged_task's future
        task();
        lock.lock();
        ++executed_;
    }
}
