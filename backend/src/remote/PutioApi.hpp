#pragma once

#include "net/HttpClient.hpp"
#include "remote/RemoteApi.hpp"

#include <string>

namespace pb::remote
{

struct PutioOptions
{
    std::string base_url = "https://api.put.io";
    std::string oauth_token;
};

// put.io v2 REST client.
class PutioApi final : public RemoteApi
{
  public:
    PutioApi(net::HttpClient const &http, PutioOptions options);

    std::vector<RemoteTransfer> list_transfers() override;
    RemoteTransfer get_transfer(std::int64_t id) override;
    RemoteTransfer add_transfer(std::string const &url, std::int64_t parent_id,
                                std::string const &callback_url) override;
    void cancel_transfer(std::int64_t id) override;

    std::vector<RemoteFile> list_folder(std::int64_t parent_id) override;
    RemoteFile create_folder(std::string const &name,
                             std::int64_t parent_id) override;
    void delete_file(std::int64_t id) override;

  private:
    net::HeaderList auth_headers() const;
    std::string endpoint(std::string const &path) const;
    std::string checked_body(net::HttpResponse const &response,
                             char const *operation) const;

    net::HttpClient const &http_;
    PutioOptions options_;
};

} // namespace pb::remote
