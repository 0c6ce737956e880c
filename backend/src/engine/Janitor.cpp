#include "engine/Janitor.hpp"

#include "utils/Log.hpp"

#include <exception>

namespace pb::engine
{

namespace
{

arr::ImportStatusMap fetch_status(arr::ImportTracker *tracker)
{
    if (tracker == nullptr)
    {
        return {};
    }
    return tracker->get_status();
}

} // namespace

std::chrono::seconds clamp_janitor_interval(std::chrono::seconds value)
{
    if (value < kMinJanitorInterval || value > kMaxJanitorInterval)
    {
        PB_LOG_WARN("janitor interval {}s outside [{}s, {}s], using {}s",
                    value.count(), kMinJanitorInterval.count(),
                    kMaxJanitorInterval.count(),
                    kDefaultJanitorInterval.count());
        return kDefaultJanitorInterval;
    }
    return value;
}

Janitor::Janitor(TransferProxy &proxy, arr::ImportTracker *movies,
                 arr::ImportTracker *episodes)
    : proxy_(proxy), movies_(movies), episodes_(episodes)
{
}

Janitor::~Janitor()
{
    stop();
}

std::vector<std::int64_t> Janitor::run_once()
{
    std::unique_lock<std::mutex> pass(pass_mutex_, std::try_to_lock);
    if (!pass.owns_lock())
    {
        PB_LOG_INFO("janitor pass already running, skipping");
        return {};
    }
    return reconcile();
}

std::vector<std::int64_t> Janitor::reconcile()
{
    auto transfers = proxy_.list_transfers();
    auto movie_status = fetch_status(movies_);
    auto episode_status = fetch_status(episodes_);

    std::vector<std::int64_t> completed;
    for (auto const &transfer : transfers)
    {
        auto id = transfer.remote.id;
        arr::ImportStatus const *status = nullptr;
        if (auto it = movie_status.find(id); it != movie_status.end())
        {
            status = &it->second;
        }
        else if (auto it2 = episode_status.find(id);
                 it2 != episode_status.end())
        {
            status = &it2->second;
        }
        if (status == nullptr)
        {
            PB_LOG_WARN("no corresponding imports for transfer {}", id);
            continue;
        }
        if (arr::is_fully_imported(*status))
        {
            PB_LOG_INFO("transfer {} ({}) is imported, cleaning up", id,
                        transfer.remote.name);
            completed.push_back(id);
        }
    }

    if (!completed.empty())
    {
        proxy_.remove_transfers(true, completed);
    }
    return completed;
}

void Janitor::start(std::chrono::milliseconds interval)
{
    if (worker_thread_.joinable())
    {
        return;
    }
    exit_requested_.store(false, std::memory_order_release);
    worker_running_.store(true, std::memory_order_release);
    worker_thread_ = std::thread([this, interval] { worker_loop(interval); });
}

void Janitor::stop()
{
    {
        std::lock_guard<std::mutex> guard(wait_mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    worker_running_.store(false, std::memory_order_release);
}

bool Janitor::is_running() const noexcept
{
    return worker_running_.load(std::memory_order_acquire);
}

void Janitor::worker_loop(std::chrono::milliseconds interval)
{
    while (!exit_requested_.load(std::memory_order_acquire))
    {
        try
        {
            auto removed = run_once();
            if (!removed.empty())
            {
                PB_LOG_INFO("janitor removed {} transfers", removed.size());
            }
        }
        catch (std::exception const &ex)
        {
            PB_LOG_ERROR("janitor pass failed: {}", ex.what());
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, interval,
                          [this]
                          {
                              return exit_requested_.load(
                                  std::memory_order_acquire);
                          });
    }
    worker_running_.store(false, std::memory_order_release);
}

} // namespace pb::engine
