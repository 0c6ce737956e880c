#include "engine/AsyncTaskService.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace pb::engine
{

AsyncTaskService::AsyncTaskService(std::size_t workers)
    : worker_count_(std::max<std::size_t>(1, workers))
{
}

AsyncTaskService::~AsyncTaskService()
{
    stop();
}

void AsyncTaskService::start()
{
    if (!workers_.empty())
    {
        return;
    }
    exit_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    workers_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i)
    {
        workers_.emplace_back([this] { loop(); });
    }
}

void AsyncTaskService::stop()
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    for (auto &worker : workers_)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    workers_.clear();
    running_.store(false, std::memory_order_release);
}

bool AsyncTaskService::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

bool AsyncTaskService::submit(std::function<void()> task)
{
    if (!task)
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (exit_requested_.load(std::memory_order_acquire))
        {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void AsyncTaskService::loop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock,
                     [this]
                     {
                         return exit_requested_.load(
                                    std::memory_order_acquire) ||
                                !tasks_.empty();
                     });
            if (tasks_.empty())
            {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            PB_LOG_ERROR("worker task failed: {}", ex.what());
        }
    }
}

} // namespace pb::engine
