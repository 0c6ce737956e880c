#pragma once

#include "engine/TransferProxy.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pb::rpc
{

// Transmission's tr_torrent_activity values.
enum class TorrentStatus : int
{
    Stopped = 0,
    CheckPending = 1,
    Checking = 2,
    DownloadPending = 3,
    Downloading = 4,
    SeedPending = 5,
    Seeding = 6,
};

// Case-insensitive; unknown statuses map to CheckPending.
TorrentStatus to_torrent_status(std::string_view remote_status);

std::string serialize_session(std::string const &download_dir);
std::string
serialize_torrent(engine::Transfer const &transfer,
                  std::chrono::system_clock::time_point now =
                      std::chrono::system_clock::now());
std::string
serialize_torrent_list(std::vector<engine::Transfer> const &transfers,
                       std::chrono::system_clock::time_point now =
                           std::chrono::system_clock::now());
std::string serialize_success();
std::string
serialize_error(std::string_view message,
                std::optional<std::string_view> details = std::nullopt);

} // namespace pb::rpc
