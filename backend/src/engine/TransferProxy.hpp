#pragma once

#include "engine/DirectoryResolver.hpp"
#include "remote/RemoteApi.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pb::engine
{

struct ProxyOptions
{
    // Root download directory as reported to Transmission clients.
    std::string download_dir;
    // Remote folder that backs download_dir.
    std::int64_t parent_dir_id = 0;
    // Friend token; empty means every callback-tagged transfer is ours.
    std::string owner_token;
};

// A remote transfer owned by this instance.
struct Transfer
{
    remote::RemoteTransfer remote;
    // "{logical dir}/{remote id}"; the service stores the payload in a
    // folder named after the transfer.
    std::string download_dir;
    std::string hash;
};

class TransferProxy
{
  public:
    TransferProxy(remote::RemoteApi &api, ProxyOptions options);

    TransferProxy(TransferProxy const &) = delete;
    TransferProxy &operator=(TransferProxy const &) = delete;

    // An empty logical_dir stands for the root download directory.
    Transfer add_transfer(std::string const &uri,
                          std::string const &logical_dir);
    Transfer upload_torrent_file(std::span<std::uint8_t const> bytes,
                                 std::string const &logical_dir);

    std::vector<Transfer> list_transfers();

    // Processes ids in order and stops at the first failure; transfers that
    // belong to someone else are skipped.
    void remove_transfers(bool delete_files,
                          std::vector<std::int64_t> const &ids);

    bool is_owned(remote::RemoteTransfer const &transfer) const;

    std::string const &download_dir() const noexcept
    {
        return options_.download_dir;
    }

  private:
    std::string effective_dir(std::string const &logical_dir) const;

    remote::RemoteApi &api_;
    ProxyOptions options_;
    DirectoryResolver resolver_;
};

} // namespace pb::engine
