#pragma once

#include "engine/TransferProxy.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

struct yyjson_val;

namespace pb::rpc
{

inline constexpr int kHttpOk = 200;
inline constexpr int kHttpBadRequest = 400;
inline constexpr int kHttpInternalError = 500;

struct RpcReply
{
    int http_status = kHttpOk;
    std::string body;
};

using ResponseCallback = std::function<void(RpcReply)>;
using DispatchHandler = std::function<void(yyjson_val *, ResponseCallback)>;

// Transmission RPC subset on top of the transfer proxy. Handlers block on
// remote calls; the server runs dispatch() on a worker thread.
class Dispatcher
{
  public:
    explicit Dispatcher(engine::TransferProxy &proxy);
    void dispatch(std::string_view payload, ResponseCallback cb);

  private:
    void register_handlers();

    engine::TransferProxy &proxy_;
    std::unordered_map<std::string, DispatchHandler> handlers_;
};

} // namespace pb::rpc
