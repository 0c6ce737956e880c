#include "utils/Log.hpp"

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>

namespace pb::log
{

namespace
{
std::mutex g_file_mutex;
std::ofstream g_file;
std::optional<std::string> g_path;
std::atomic_bool g_verbose{false};

constexpr char kDefaultLogFile[] = "putbridge.log";
} // namespace

void set_log_file(std::string path)
{
    std::lock_guard<std::mutex> lk(g_file_mutex);
    if (g_file.is_open())
    {
        g_file.close();
    }
    g_path = std::move(path);
}

void set_verbose(bool enabled) noexcept
{
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose() noexcept
{
    return g_verbose.load(std::memory_order_relaxed);
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(g_file_mutex);
    if (!g_path)
    {
        g_path = std::string(kDefaultLogFile);
    }
    // An empty path disables the file sink.
    if (g_path->empty())
    {
        return;
    }
    if (!g_file.is_open())
    {
        g_file.open(*g_path, std::ios::app | std::ios::out);
    }
    if (g_file.is_open())
    {
        g_file << line << '\n';
        g_file.flush();
    }
}

} // namespace pb::log
