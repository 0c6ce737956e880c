#include "engine/TransferProxy.hpp"

#include "engine/CallbackState.hpp"
#include "engine/Errors.hpp"
#include "engine/HashCodec.hpp"
#include "engine/TorrentUtils.hpp"
#include "utils/Log.hpp"

#include <format>
#include <utility>

namespace pb::engine
{

namespace
{

std::string logical_transfer_dir(std::string const &dir, std::int64_t id)
{
    if (!dir.empty() && dir.back() == '/')
    {
        return std::format("{}{}", dir, id);
    }
    return std::format("{}/{}", dir, id);
}

Transfer make_transfer(remote::RemoteTransfer remote,
                       std::string const &logical_dir)
{
    Transfer transfer;
    transfer.download_dir = logical_transfer_dir(logical_dir, remote.id);
    transfer.hash = format_hash(remote.id);
    transfer.remote = std::move(remote);
    return transfer;
}

} // namespace

TransferProxy::TransferProxy(remote::RemoteApi &api, ProxyOptions options)
    : api_(api), options_(std::move(options)),
      resolver_(api_, options_.download_dir, options_.parent_dir_id)
{
}

std::string TransferProxy::effective_dir(std::string const &logical_dir) const
{
    return logical_dir.empty() ? options_.download_dir : logical_dir;
}

Transfer TransferProxy::add_transfer(std::string const &uri,
                                     std::string const &logical_dir)
{
    auto dir = effective_dir(logical_dir);
    auto parent_id = resolver_.resolve(dir);
    auto callback_url = encode_callback_url({dir, options_.owner_token});
    auto remote = api_.add_transfer(uri, parent_id, callback_url);
    PB_LOG_INFO("added transfer {} under {} (folder {})", remote.id, dir,
                parent_id);
    return make_transfer(std::move(remote), dir);
}

Transfer TransferProxy::upload_torrent_file(std::span<std::uint8_t const> bytes,
                                            std::string const &logical_dir)
{
    auto summary = summarize_torrent_file(bytes);
    if (!summary)
    {
        throw ProxyError(ErrorCode::InvalidTorrentFile,
                         "expected a bencoded dictionary with an info key");
    }
    auto magnet = build_magnet_uri(*summary);
    PB_LOG_DEBUG("converted torrent file \"{}\" to {}", summary->name, magnet);
    return add_transfer(magnet, logical_dir);
}

std::vector<Transfer> TransferProxy::list_transfers()
{
    std::vector<Transfer> owned;
    for (auto &remote : api_.list_transfers())
    {
        auto decoded =
            decode_callback_url(remote.callback_url, options_.owner_token);
        if (!decoded.ok())
        {
            PB_LOG_DEBUG("skipping transfer {}: {}", remote.id,
                         decoded.reason);
            continue;
        }
        owned.push_back(make_transfer(std::move(remote),
                                      decoded.state->download_dir));
    }
    return owned;
}

void TransferProxy::remove_transfers(bool delete_files,
                                     std::vector<std::int64_t> const &ids)
{
    for (auto id : ids)
    {
        auto transfer = api_.get_transfer(id);
        auto decoded =
            decode_callback_url(transfer.callback_url, options_.owner_token);
        if (!decoded.ok())
        {
            PB_LOG_WARN("not removing transfer {}: {}", id, decoded.reason);
            continue;
        }
        if (delete_files && transfer.file_id != 0)
        {
            api_.delete_file(transfer.file_id);
            PB_LOG_INFO("deleted file {} of transfer {}", transfer.file_id,
                        id);
        }
        api_.cancel_transfer(transfer.id);
        PB_LOG_INFO("removed transfer {}", id);
    }
}

bool TransferProxy::is_owned(remote::RemoteTransfer const &transfer) const
{
    return engine::is_owned(transfer.callback_url, options_.owner_token);
}

} // namespace pb::engine
