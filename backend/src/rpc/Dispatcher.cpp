#include "rpc/Dispatcher.hpp"

#include "engine/Errors.hpp"
#include "engine/HashCodec.hpp"
#include "rpc/Serializer.hpp"
#include "utils/Encoding.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <yyjson.h>

namespace pb::rpc
{

namespace
{

using engine::ErrorCode;
using engine::ProxyError;

RpcReply bad_request(std::string_view message,
                     std::optional<std::string_view> details = std::nullopt)
{
    return {kHttpBadRequest, serialize_error(message, details)};
}

// Values the client sent as JSON text for debug logging.
std::string describe(yyjson_val *value)
{
    if (value == nullptr)
    {
        return "null";
    }
    char *json = yyjson_val_write(value, 0, nullptr);
    std::string result = json ? json : "?";
    std::free(json);
    return result;
}

std::string download_dir_argument(yyjson_val *arguments)
{
    auto dir = pb::json::string_member(arguments, "download-dir");
    return dir.value_or(std::string{});
}

std::vector<std::int64_t> parse_ids(yyjson_val *arguments)
{
    auto *ids = yyjson_obj_get(arguments, "ids");
    if (ids == nullptr || !yyjson_is_arr(ids) || yyjson_arr_size(ids) == 0)
    {
        throw ProxyError(ErrorCode::MalformedRequest,
                         "torrent-remove expects a non-empty ids array");
    }
    std::vector<std::int64_t> result;
    result.reserve(yyjson_arr_size(ids));
    size_t idx, limit;
    yyjson_val *value = nullptr;
    yyjson_arr_foreach(ids, idx, limit, value)
    {
        if (!yyjson_is_str(value))
        {
            throw ProxyError(ErrorCode::MalformedRequest,
                             "unrecognized id type: " + describe(value));
        }
        result.push_back(engine::parse_hash(
            std::string_view(yyjson_get_str(value), yyjson_get_len(value))));
    }
    return result;
}

template <typename Handler> DispatchHandler wrap_sync_handler(Handler handler)
{
    return DispatchHandler(
        [handler = std::move(handler)](yyjson_val *arguments,
                                       ResponseCallback cb) mutable
        {
            try
            {
                cb(RpcReply{kHttpOk, handler(arguments)});
            }
            catch (std::exception const &ex)
            {
                PB_LOG_WARN("RPC handler failed: {}", ex.what());
                cb(RpcReply{kHttpInternalError,
                            serialize_error("internal error")});
            }
        });
}

std::string handle_session_get(engine::TransferProxy &proxy)
{
    return serialize_session(proxy.download_dir());
}

std::string handle_torrent_get(engine::TransferProxy &proxy)
{
    return serialize_torrent_list(proxy.list_transfers());
}

std::string handle_torrent_add(engine::TransferProxy &proxy,
                               yyjson_val *arguments)
{
    if (arguments == nullptr || !yyjson_is_obj(arguments))
    {
        throw ProxyError(ErrorCode::MalformedRequest,
                         "arguments object missing for torrent-add");
    }
    auto dir = download_dir_argument(arguments);

    if (auto metainfo = pb::json::string_member(arguments, "metainfo"))
    {
        auto decoded = pb::utils::decode_base64(*metainfo);
        if (!decoded || decoded->empty())
        {
            throw ProxyError(ErrorCode::InvalidTorrentFile,
                             "metainfo is not valid base64");
        }
        return serialize_torrent(proxy.upload_torrent_file(*decoded, dir));
    }
    if (auto filename = pb::json::string_member(arguments, "filename"))
    {
        return serialize_torrent(proxy.add_transfer(*filename, dir));
    }
    throw ProxyError(ErrorCode::MalformedRequest,
                     "torrent-add expects either metainfo or filename");
}

std::string handle_torrent_remove(engine::TransferProxy &proxy,
                                  yyjson_val *arguments)
{
    auto delete_data = pb::json::bool_member(arguments, "delete-local-data");
    if (!delete_data)
    {
        throw ProxyError(ErrorCode::MalformedRequest,
                         "torrent-remove expects delete-local-data");
    }
    auto ids = parse_ids(arguments);
    proxy.remove_transfers(*delete_data, ids);
    return serialize_success();
}

std::string handle_ignored(std::string const &method, yyjson_val *arguments)
{
    PB_LOG_INFO("ignoring RPC {} {}", method, describe(arguments));
    return serialize_success();
}

} // namespace

Dispatcher::Dispatcher(engine::TransferProxy &proxy) : proxy_(proxy)
{
    register_handlers();
}

void Dispatcher::register_handlers()
{
    auto add_sync = [this](std::string method, auto handler)
    {
        handlers_.emplace(std::move(method),
                          wrap_sync_handler(std::move(handler)));
    };

    add_sync("session-get",
             [this](yyjson_val *) { return handle_session_get(proxy_); });
    add_sync("torrent-get",
             [this](yyjson_val *) { return handle_torrent_get(proxy_); });
    add_sync("torrent-add", [this](yyjson_val *arguments)
             { return handle_torrent_add(proxy_, arguments); });
    add_sync("torrent-remove", [this](yyjson_val *arguments)
             { return handle_torrent_remove(proxy_, arguments); });
    add_sync("torrent-set", [](yyjson_val *arguments)
             { return handle_ignored("torrent-set", arguments); });
    add_sync("queue-move-top", [](yyjson_val *arguments)
             { return handle_ignored("queue-move-top", arguments); });
}

void Dispatcher::dispatch(std::string_view payload, ResponseCallback cb)
{
    if (payload.empty())
    {
        cb(bad_request("empty RPC payload"));
        return;
    }

    auto doc = pb::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        cb(bad_request("invalid JSON"));
        return;
    }

    yyjson_val *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        cb(bad_request("expected JSON object"));
        return;
    }

    yyjson_val *method_value = yyjson_obj_get(root, "method");
    if (method_value == nullptr || !yyjson_is_str(method_value))
    {
        cb(bad_request("missing method"));
        return;
    }

    std::string method(yyjson_get_str(method_value));
    yyjson_val *arguments = yyjson_obj_get(root, "arguments");
    PB_LOG_DEBUG("RPC request method={} arguments={}", method,
                 describe(arguments));

    auto handler_it = handlers_.find(method);
    if (handler_it == handlers_.end())
    {
        PB_LOG_INFO("unknown RPC method: {}", method);
        cb(bad_request("unsupported method", method));
        return;
    }
    handler_it->second(arguments,
                       [method, cb = std::move(cb)](RpcReply reply)
                       {
                           PB_LOG_DEBUG("RPC response method={} status={} "
                                        "body={}",
                                        method, reply.http_status, reply.body);
                           cb(std::move(reply));
                       });
}

} // namespace pb::rpc
