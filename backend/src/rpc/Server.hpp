#pragma once
#include "engine/AsyncTaskService.hpp"
#include "rpc/Dispatcher.hpp"

#include <mongoose.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pb::rpc
{

struct ServerOptions
{
    std::optional<std::pair<std::string, std::string>> basic_auth;
    std::string basic_realm = "PutBridge";
    std::string rpc_path = "/transmission/rpc";
    std::string session_header = "X-Transmission-Session-Id";
    std::size_t workers = 4;
};

struct ConnectionInfo
{
    std::uint16_t port = 0;
};

class Server
{
  public:
    explicit Server(engine::TransferProxy &proxy,
                    std::string bind_url = "http://0.0.0.0:9091",
                    ServerOptions options = {});
    ~Server();

    Server(Server const &) = delete;
    Server &operator=(Server const &) = delete;

    // Returns false when the listener could not be bound.
    bool start();
    void stop();

    std::optional<ConnectionInfo> connection_info() const;
    std::string const &session_id() const noexcept
    {
        return session_id_;
    }

  private:
    void run_loop();
    void handle_http_message(struct mg_connection *conn,
                             struct mg_http_message *hm);
    void handle_connection_closed(struct mg_connection *conn);
    static void handle_event(struct mg_connection *conn, int ev, void *ev_data);
    bool authorize_request(struct mg_http_message *hm) const;
    bool session_matches(struct mg_http_message *hm) const;
    void refresh_connection_port();
    void process_pending_tasks();
    void enqueue_task(std::function<void()> task);
    void send_response(std::uint64_t req_id, RpcReply const &reply);

    std::string bind_url_;
    ServerOptions options_;
    Dispatcher dispatcher_;
    engine::AsyncTaskService workers_;
    mg_mgr mgr_;
    struct mg_connection *listener_;
    std::string session_id_;
    std::optional<ConnectionInfo> connection_info_;
    std::atomic_bool running_{false};
    std::thread worker_;
    std::atomic_bool destroying_{false};

    struct ActiveRequest
    {
        struct mg_connection *conn = nullptr;
        std::string headers;
    };
    using RequestId = std::uint64_t;
    RequestId next_request_id_ = 1;
    std::unordered_map<RequestId, ActiveRequest> active_requests_;

    std::vector<std::function<void()>> pending_tasks_;
    std::mutex tasks_mtx_;
};

} // namespace pb::rpc
