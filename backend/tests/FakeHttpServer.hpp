#pragma once

#include <mongoose.h>

#include <arpa/inet.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace pb::tests
{

struct RecordedRequest
{
    std::string method;
    std::string path;
    std::string query;
    std::string body;
    std::string host;
    std::string authorization;
    std::string api_key;
    std::string content_type;
};

struct CannedResponse
{
    int status = 200;
    std::string body;
};

// Loopback HTTP listener on an ephemeral port. Requests are recorded and
// answered by the installed handler (404 when none is set).
class FakeHttpServer
{
  public:
    using Handler = std::function<CannedResponse(RecordedRequest const &)>;

    FakeHttpServer()
    {
        mg_mgr_init(&mgr_);
        listener_ = mg_http_listen(&mgr_, "http://127.0.0.1:0",
                                   &FakeHttpServer::handle_event, this);
        if (listener_ == nullptr)
        {
            mg_mgr_free(&mgr_);
            throw std::runtime_error("fake HTTP server failed to bind");
        }
        port_ = static_cast<std::uint16_t>(ntohs(listener_->loc.port));
        running_.store(true);
        thread_ = std::thread(
            [this]
            {
                while (running_.load())
                {
                    mg_mgr_poll(&mgr_, 20);
                }
            });
    }

    ~FakeHttpServer()
    {
        running_.store(false);
        if (thread_.joinable())
        {
            thread_.join();
        }
        mg_mgr_free(&mgr_);
    }

    FakeHttpServer(FakeHttpServer const &) = delete;
    FakeHttpServer &operator=(FakeHttpServer const &) = delete;

    void set_handler(Handler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    std::string url() const
    {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    std::vector<RecordedRequest> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

  private:
    static std::string header(struct mg_http_message *hm, char const *name)
    {
        auto *value = mg_http_get_header(hm, name);
        return value ? std::string(value->buf, value->len) : std::string();
    }

    static void handle_event(struct mg_connection *conn, int ev, void *ev_data)
    {
        if (ev != MG_EV_HTTP_MSG)
        {
            return;
        }
        auto *self = static_cast<FakeHttpServer *>(conn->fn_data);
        auto *hm = static_cast<struct mg_http_message *>(ev_data);

        RecordedRequest request;
        request.method.assign(hm->method.buf, hm->method.len);
        request.path.assign(hm->uri.buf, hm->uri.len);
        request.query.assign(hm->query.buf, hm->query.len);
        request.body.assign(hm->body.buf, hm->body.len);
        request.host = header(hm, "Host");
        request.authorization = header(hm, "Authorization");
        request.api_key = header(hm, "X-Api-Key");
        request.content_type = header(hm, "Content-Type");

        CannedResponse response{404, R"({"error_message":"not found"})"};
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->requests_.push_back(request);
            if (self->handler_)
            {
                response = self->handler_(request);
            }
        }
        mg_http_reply(conn, response.status,
                      "Content-Type: application/json\r\n", "%s",
                      response.body.c_str());
    }

    mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
    std::uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<RecordedRequest> requests_;
};

} // namespace pb::tests
