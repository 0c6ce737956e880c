#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pb::engine {

// Fixed-size worker pool. stop() drains queued tasks before joining.
class AsyncTaskService {
public:
  explicit AsyncTaskService(std::size_t workers = 1);
  AsyncTaskService(AsyncTaskService const &) = delete;
  AsyncTaskService &operator=(AsyncTaskService const &) = delete;
  ~AsyncTaskService();

  void start();
  void stop();
  bool is_running() const noexcept;
  std::size_t worker_count() const noexcept { return worker_count_; }
  // Returns false once stop() has been requested.
  bool submit(std::function<void()> task);

private:
  void loop();

  std::size_t worker_count_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> exit_requested_{false};
};

} // namespace pb::engine
