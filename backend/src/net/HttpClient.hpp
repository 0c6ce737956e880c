#pragma once

#include "utils/Endpoint.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pb::net
{

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    HeaderList headers;
    std::string body;
};

struct HttpResponse
{
    int status = 0;
    std::string body;
    HeaderList headers;
    // Set when no HTTP response was received at all.
    std::string error;

    bool transport_failed() const noexcept
    {
        return !error.empty();
    }
    bool ok() const noexcept
    {
        return error.empty() && status >= 200 && status < 300;
    }

    // Case-insensitive lookup; empty when the header is absent.
    std::string header(std::string_view name) const;
};

struct HttpClientOptions
{
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    // PEM bundle used to verify https peers. https requests fail without
    // one.
    std::string ca_file;
};

// Resolves the host through the system resolver (hosts file and
// resolv.conf included) and returns "scheme://address[:port]" for mongoose
// to connect to. IPv4 addresses are preferred. Returns nullopt and fills
// error when the name does not resolve.
std::optional<std::string> resolve_connect_url(UrlParts const &parts,
                                               std::string &error);

// Blocking HTTP/1.1 client. Every call runs its own mongoose manager, so a
// single instance may be shared across threads.
class HttpClient
{
  public:
    // Throws std::runtime_error when ca_file is set but cannot be read.
    explicit HttpClient(HttpClientOptions options = {});

    bool verifies_peers() const noexcept
    {
        return !ca_bundle_.empty();
    }

    HttpResponse send(HttpRequest const &request) const;
    HttpResponse get(std::string url, HeaderList headers = {}) const;
    HttpResponse post_form(std::string url, QueryParams const &form,
                           HeaderList headers = {}) const;

  private:
    HttpClientOptions options_;
    std::string ca_bundle_;
};

} // namespace pb::net
