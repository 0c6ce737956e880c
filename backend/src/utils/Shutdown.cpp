#include "utils/Shutdown.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace pb::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};
constexpr auto kPollSlice = std::chrono::milliseconds(200);
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

// Polls because request_shutdown runs inside signal handlers, where only
// the lock-free flag may be touched.
bool wait_for_shutdown(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!should_shutdown()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                      kPollSlice));
  }
  return true;
}

} // namespace pb::runtime
