#include "net/HttpClient.hpp"

#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <mongoose.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cctype>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace pb::net
{

namespace
{

struct ClientContext
{
    std::string request_bytes;
    std::string tls_name;
    std::string const *ca_bundle = nullptr;
    bool use_tls = false;
    bool done = false;
    HttpResponse response;
};

std::string build_request_bytes(HttpRequest const &request,
                                 UrlParts const &parts)
{
    std::string target = parts.path.empty() ? "/" : parts.path;
    if (!parts.raw_query.empty())
    {
        target += "?";
        target += parts.raw_query;
    }
    std::string host = parts.host;
    if (!parts.port.empty())
    {
        host += ":" + parts.port;
    }
    std::string bytes;
    bytes.reserve(256 + request.body.size());
    bytes += request.method + " " + target + " HTTP/1.1\r\n";
    bytes += "Host: " + host + "\r\n";
    bytes += std::string("User-Agent: ") + version::kUserAgentVersion + "\r\n";
    for (auto const &[name, value] : request.headers)
    {
        bytes += name + ": " + value + "\r\n";
    }
    if (!request.body.empty() || request.method != "GET")
    {
        bytes += "Content-Length: " + std::to_string(request.body.size()) +
                 "\r\n";
    }
    bytes += "Connection: close\r\n\r\n";
    bytes += request.body;
    return bytes;
}

void client_handler(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *ctx = static_cast<ClientContext *>(conn->fn_data);
    if (ctx == nullptr || ctx->done)
    {
        return;
    }

    if (ev == MG_EV_CONNECT)
    {
        if (ctx->use_tls)
        {
            struct mg_tls_opts opts = {};
            opts.name = mg_str(ctx->tls_name.c_str());
            if (ctx->ca_bundle != nullptr && !ctx->ca_bundle->empty())
            {
                opts.ca = mg_str_n(ctx->ca_bundle->data(),
                                   ctx->ca_bundle->size());
            }
            mg_tls_init(conn, &opts);
        }
        mg_send(conn, ctx->request_bytes.data(), ctx->request_bytes.size());
    }
    else if (ev == MG_EV_HTTP_MSG)
    {
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        ctx->response.status = mg_http_status(hm);
        ctx->response.body.assign(hm->body.buf, hm->body.len);
        for (auto const &header : hm->headers)
        {
            if (header.name.len == 0)
            {
                break;
            }
            ctx->response.headers.emplace_back(
                std::string(header.name.buf, header.name.len),
                std::string(header.value.buf, header.value.len));
        }
        ctx->done = true;
        conn->is_draining = 1;
    }
    else if (ev == MG_EV_ERROR)
    {
        auto const *message = static_cast<char const *>(ev_data);
        ctx->response.error = message != nullptr ? message : "connection error";
        ctx->done = true;
    }
    else if (ev == MG_EV_CLOSE)
    {
        ctx->response.error = "connection closed before response";
        ctx->done = true;
    }
}

bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i])))
        {
            return false;
        }
    }
    return true;
}

std::string format_address(sockaddr const *addr)
{
    char buffer[INET6_ADDRSTRLEN] = {};
    if (addr->sa_family == AF_INET)
    {
        auto const *v4 = reinterpret_cast<sockaddr_in const *>(addr);
        if (inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer)))
        {
            return buffer;
        }
    }
    else if (addr->sa_family == AF_INET6)
    {
        auto const *v6 = reinterpret_cast<sockaddr_in6 const *>(addr);
        if (inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer)))
        {
            return std::string("[") + buffer + "]";
        }
    }
    return {};
}

} // namespace

std::optional<std::string> resolve_connect_url(UrlParts const &parts,
                                               std::string &error)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    addrinfo *result = nullptr;
    if (auto rc = getaddrinfo(parts.host.c_str(), nullptr, &hints, &result);
        rc != 0)
    {
        error = "unable to resolve " + parts.host + ": " + gai_strerror(rc);
        return std::nullopt;
    }

    std::string address;
    for (auto *ptr = result; ptr != nullptr; ptr = ptr->ai_next)
    {
        if (ptr->ai_family == AF_INET)
        {
            address = format_address(ptr->ai_addr);
            break;
        }
        if (address.empty() && ptr->ai_family == AF_INET6)
        {
            address = format_address(ptr->ai_addr);
        }
    }
    freeaddrinfo(result);

    if (address.empty())
    {
        error = "no usable address for " + parts.host;
        return std::nullopt;
    }
    auto url = parts.scheme + "://" + address;
    if (!parts.port.empty())
    {
        url += ":" + parts.port;
    }
    return url;
}

std::string HttpResponse::header(std::string_view name) const
{
    for (auto const &[key, value] : headers)
    {
        if (equals_ignore_case(key, name))
        {
            return value;
        }
    }
    return {};
}

HttpClient::HttpClient(HttpClientOptions options) : options_(std::move(options))
{
    if (!options_.ca_file.empty())
    {
        std::ifstream input(options_.ca_file, std::ios::binary);
        if (input)
        {
            ca_bundle_.assign(std::istreambuf_iterator<char>(input),
                              std::istreambuf_iterator<char>());
        }
        if (ca_bundle_.empty())
        {
            throw std::runtime_error("unable to read CA bundle " +
                                     options_.ca_file);
        }
    }
}

HttpResponse HttpClient::send(HttpRequest const &request) const
{
    auto started = std::chrono::steady_clock::now();
    auto parts = parse_url(request.url);
    if (!parts || parts->host.empty())
    {
        HttpResponse invalid;
        invalid.error = "invalid URL";
        return invalid;
    }

    ClientContext context;
    context.request_bytes = build_request_bytes(request, *parts);
    context.use_tls = parts->scheme == "https";
    context.tls_name = parts->host;
    context.ca_bundle = &ca_bundle_;
    if (context.use_tls && ca_bundle_.empty())
    {
        HttpResponse refused;
        refused.error = "https requires a CA bundle";
        return refused;
    }

    // mongoose's own resolver only queries a fixed DNS server, so names are
    // resolved here and the connection goes to the address.
    std::string resolve_error;
    auto connect_url = resolve_connect_url(*parts, resolve_error);
    if (!connect_url)
    {
        PB_LOG_DEBUG("HTTP {} {} failed: {}", request.method, request.url,
                     resolve_error);
        HttpResponse unresolved;
        unresolved.error = std::move(resolve_error);
        return unresolved;
    }

    mg_mgr mgr;
    mg_mgr_init(&mgr);
    auto *conn =
        mg_http_connect(&mgr, connect_url->c_str(), client_handler, &context);
    if (conn == nullptr)
    {
        mg_mgr_free(&mgr);
        HttpResponse failed;
        failed.error = "failed to open connection";
        return failed;
    }

    auto deadline = started + options_.timeout;
    while (!context.done && std::chrono::steady_clock::now() < deadline)
    {
        mg_mgr_poll(&mgr, 50);
    }
    if (!context.done)
    {
        context.response.error = "request timed out";
    }
    // Freeing the manager fires MG_EV_CLOSE; the handler ignores it once
    // done is set.
    context.done = true;
    mg_mgr_free(&mgr);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (context.response.transport_failed())
    {
        PB_LOG_DEBUG("HTTP {} {} failed after {}ms: {}", request.method,
                     request.url, elapsed.count(), context.response.error);
    }
    else
    {
        PB_LOG_DEBUG("HTTP {} {} -> {} in {}ms", request.method, request.url,
                     context.response.status, elapsed.count());
    }
    return std::move(context.response);
}

HttpResponse HttpClient::get(std::string url, HeaderList headers) const
{
    HttpRequest request;
    request.method = "GET";
    request.url = std::move(url);
    request.headers = std::move(headers);
    return send(request);
}

HttpResponse HttpClient::post_form(std::string url, QueryParams const &form,
                                   HeaderList headers) const
{
    HttpRequest request;
    request.method = "POST";
    request.url = std::move(url);
    request.headers = std::move(headers);
    request.headers.emplace_back("Content-Type",
                                 "application/x-www-form-urlencoded");
    request.body = encode_query(form);
    return send(request);
}

} // namespace pb::net
