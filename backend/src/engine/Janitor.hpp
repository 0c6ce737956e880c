#pragma once

#include "arr/ImportTracker.hpp"
#include "engine/TransferProxy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace pb::engine
{

inline constexpr std::chrono::seconds kMinJanitorInterval{10 * 60};
inline constexpr std::chrono::seconds kMaxJanitorInterval{24 * 60 * 60};
inline constexpr std::chrono::seconds kDefaultJanitorInterval{60 * 60};

// Values outside [10 min, 24 h] fall back to one hour.
std::chrono::seconds clamp_janitor_interval(std::chrono::seconds value);

// Removes remote transfers, and their files, once the import trackers report
// every item fed by the transfer as imported.
class Janitor
{
  public:
    // Either tracker may be null when the corresponding service is not
    // configured.
    Janitor(TransferProxy &proxy, arr::ImportTracker *movies,
            arr::ImportTracker *episodes);
    Janitor(Janitor const &) = delete;
    Janitor &operator=(Janitor const &) = delete;
    ~Janitor();

    // One reconciliation pass. Returns the ids that were removed; empty when
    // another pass was already running.
    std::vector<std::int64_t> run_once();

    void start(std::chrono::milliseconds interval);
    void stop();
    bool is_running() const noexcept;

  private:
    std::vector<std::int64_t> reconcile();
    void worker_loop(std::chrono::milliseconds interval);

    TransferProxy &proxy_;
    arr::ImportTracker *movies_;
    arr::ImportTracker *episodes_;

    std::mutex pass_mutex_;
    std::atomic<bool> worker_running_{false};
    std::atomic<bool> exit_requested_{false};
    std::thread worker_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace pb::engine
