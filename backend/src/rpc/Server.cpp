#include "rpc/Server.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Encoding.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <arpa/inet.h>

#include <mongoose.h>

#include <cstdint>
#include <cstring>
#include <exception>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace
{
constexpr std::size_t kMaxHttpPayloadSize = 8u << 20;

std::string sanitize_request_uri(std::string_view uri)
{
    std::string sanitized(uri);
    if (auto query_pos = sanitized.find('?'); query_pos != std::string::npos)
    {
        sanitized.resize(query_pos);
    }
    return sanitized;
}

std::string build_rpc_headers(std::string_view content_type)
{
    std::string headers =
        std::string("Content-Type: ") + std::string(content_type) + "\r\n";
    headers += "Cache-Control: no-store\r\n";
    return headers;
}

std::string generate_session_id()
{
    static constexpr char kHexDigits[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    std::string token;
    token.reserve(32);
    while (token.size() < 32)
    {
        auto value = dist(rng);
        for (int bit = 0; bit < 16 && token.size() < 32; ++bit)
        {
            token.push_back(kHexDigits[value & 0xF]);
            value >>= 4;
        }
    }
    return token;
}

std::optional<std::string> decode_basic_credentials(std::string_view header)
{
    static constexpr std::string_view prefix = "Basic ";
    if (!header.starts_with(prefix))
    {
        return std::nullopt;
    }
    auto payload = header.substr(prefix.size());
    auto decoded = pb::utils::decode_base64(payload);
    if (!decoded)
    {
        return std::nullopt;
    }
    return std::string(decoded->begin(), decoded->end());
}

} // namespace

namespace pb::rpc
{

Server::Server(engine::TransferProxy &proxy, std::string bind_url,
               ServerOptions options)
    : bind_url_(std::move(bind_url)), options_(std::move(options)),
      dispatcher_(proxy), workers_(options_.workers), listener_(nullptr),
      session_id_(generate_session_id())
{
    connection_info_.emplace();
    mg_mgr_init(&mgr_);
    mg_wakeup_init(&mgr_);
    mgr_.userdata = this;
}

Server::~Server()
{
    stop();

    // Callbacks fired by mg_mgr_free must not touch members.
    destroying_.store(true, std::memory_order_release);
    mg_mgr_free(&mgr_);
}

bool Server::start()
{
    if (running_.exchange(true))
    {
        return true;
    }

    listener_ = mg_http_listen(&mgr_, bind_url_.c_str(), &Server::handle_event,
                               this);
    if (listener_ == nullptr)
    {
        PB_LOG_ERROR("Failed to bind RPC listener to {}", bind_url_);
        running_.store(false);
        return false;
    }
    refresh_connection_port();
    PB_LOG_INFO("RPC listener bound to {} (port {}), exposing {}", bind_url_,
                connection_info_->port, options_.rpc_path);

    workers_.start();
    worker_ = std::thread(&Server::run_loop, this);
    PB_LOG_DEBUG("RPC event loop started with {} workers",
                 workers_.worker_count());
    return true;
}

void Server::stop()
{
    if (!worker_.joinable())
    {
        running_.store(false);
        return;
    }

    // In-flight dispatches finish first so their replies can still be sent.
    PB_LOG_INFO("Stopping RPC server");
    workers_.stop();

    running_.store(false);
    mg_wakeup(&mgr_, 0, nullptr, 0);
    worker_.join();

    process_pending_tasks();
    mg_mgr_poll(&mgr_, 0);

    if (listener_ != nullptr)
    {
        listener_->is_closing = 1;
        listener_ = nullptr;
    }
}

void Server::run_loop()
{
    try
    {
        while (running_.load(std::memory_order_relaxed) &&
               !pb::runtime::should_shutdown())
        {
            mg_mgr_poll(&mgr_, 50);
            process_pending_tasks();
        }
    }
    catch (std::exception const &ex)
    {
        PB_LOG_ERROR("RPC event loop exception: {}", ex.what());
    }
}

void Server::refresh_connection_port()
{
    if (!connection_info_ || listener_ == nullptr)
    {
        return;
    }
    connection_info_->port =
        static_cast<std::uint16_t>(ntohs(listener_->loc.port));
}

bool Server::authorize_request(struct mg_http_message *hm) const
{
    if (!options_.basic_auth)
    {
        return true;
    }
    auto *header = mg_http_get_header(hm, "Authorization");
    if (header == nullptr)
    {
        return false;
    }
    auto credentials =
        decode_basic_credentials(std::string_view(header->buf, header->len));
    if (!credentials)
    {
        return false;
    }
    auto expected =
        options_.basic_auth->first + ":" + options_.basic_auth->second;
    return *credentials == expected;
}

bool Server::session_matches(struct mg_http_message *hm) const
{
    auto *header = mg_http_get_header(hm, options_.session_header.c_str());
    return header != nullptr &&
           static_cast<std::size_t>(header->len) == session_id_.size() &&
           std::memcmp(header->buf, session_id_.data(), session_id_.size()) ==
               0;
}

std::optional<ConnectionInfo> Server::connection_info() const
{
    return connection_info_;
}

void Server::handle_event(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }

    auto *self = static_cast<Server *>(conn->fn_data);
    if (self == nullptr ||
        self->destroying_.load(std::memory_order_acquire))
    {
        return;
    }

    switch (ev)
    {
    case MG_EV_HTTP_MSG:
        self->handle_http_message(
            conn, static_cast<struct mg_http_message *>(ev_data));
        break;
    case MG_EV_CLOSE:
        self->handle_connection_closed(conn);
        break;
    default:
        break;
    }
}

void Server::handle_http_message(struct mg_connection *conn,
                                 struct mg_http_message *hm)
{
    if (conn == nullptr || hm == nullptr)
    {
        return;
    }
    std::string_view uri(hm->uri.buf, hm->uri.len);
    std::string_view method(hm->method.buf, hm->method.len);
    PB_LOG_DEBUG("HTTP request {} {}", method, sanitize_request_uri(uri));

    if (uri != options_.rpc_path)
    {
        mg_http_reply(conn, 404, "Content-Type: text/plain\r\n", "not found");
        return;
    }

    if (!authorize_request(hm))
    {
        PB_LOG_INFO("RPC request rejected; invalid credentials");
        auto headers = build_rpc_headers("text/plain");
        headers += "WWW-Authenticate: Basic realm=\"";
        headers += options_.basic_realm;
        headers += "\", charset=\"UTF-8\"\r\n";
        mg_http_reply(conn, 401, headers.c_str(), "unauthorized");
        return;
    }

    if (!session_matches(hm))
    {
        auto headers = build_rpc_headers("application/json");
        headers += options_.session_header + ": " + session_id_ + "\r\n";
        auto payload = serialize_error("session id required");
        mg_http_reply(conn, 409, headers.c_str(), "%s", payload.c_str());
        return;
    }

    if (method == "GET")
    {
        mg_http_reply(conn, 200, build_rpc_headers("text/plain").c_str(), "");
        return;
    }
    if (method != "POST")
    {
        mg_http_reply(conn, 405, "Content-Type: text/plain\r\n",
                      "method not allowed");
        return;
    }

    if (hm->body.len > kMaxHttpPayloadSize)
    {
        PB_LOG_INFO("RPC payload too large: {} bytes", hm->body.len);
        auto payload = serialize_error("payload too large");
        mg_http_reply(conn, 413, build_rpc_headers("application/json").c_str(),
                      "%s", payload.c_str());
        return;
    }

    std::string body;
    if (hm->body.len > 0 && hm->body.buf != nullptr)
    {
        body.assign(hm->body.buf, hm->body.len);
    }

    auto req_id = next_request_id_++;
    active_requests_[req_id] = {conn, build_rpc_headers("application/json")};

    bool accepted = workers_.submit(
        [this, req_id, body = std::move(body)]
        {
            dispatcher_.dispatch(body,
                                 [this, req_id](RpcReply reply)
                                 {
                                     enqueue_task(
                                         [this, req_id,
                                          reply = std::move(reply)]
                                         { send_response(req_id, reply); });
                                 });
        });
    if (!accepted)
    {
        send_response(req_id, RpcReply{kHttpInternalError,
                                       serialize_error("shutting down")});
    }
}

void Server::handle_connection_closed(struct mg_connection *conn)
{
    for (auto it = active_requests_.begin(); it != active_requests_.end();)
    {
        if (it->second.conn == conn)
        {
            it = active_requests_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void Server::enqueue_task(std::function<void()> task)
{
    std::lock_guard<std::mutex> lock(tasks_mtx_);
    pending_tasks_.push_back(std::move(task));
    mg_wakeup(&mgr_, 0, nullptr, 0);
}

void Server::process_pending_tasks()
{
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        tasks.swap(pending_tasks_);
    }
    for (auto &task : tasks)
    {
        task();
    }
}

void Server::send_response(std::uint64_t req_id, RpcReply const &reply)
{
    auto it = active_requests_.find(req_id);
    if (it != active_requests_.end())
    {
        mg_http_reply(it->second.conn, reply.http_status,
                      it->second.headers.c_str(), "%s", reply.body.c_str());
        active_requests_.erase(it);
    }
}

} // namespace pb::rpc
