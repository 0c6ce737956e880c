#pragma once

#include <chrono>

namespace pb::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Blocks until shutdown is requested or the timeout elapses. Returns true
// when shutdown was requested.
bool wait_for_shutdown(std::chrono::milliseconds timeout);

} // namespace pb::runtime
