#pragma once

#include "arr/ImportTracker.hpp"
#include "net/HttpClient.hpp"

#include <string>

namespace pb::arr
{

enum class ArrKind
{
    Movie,
    Episode,
};

// Radarr (movies) or Sonarr (episodes) over the v3 API.
class ArrImportTracker final : public ImportTracker
{
  public:
    ArrImportTracker(ArrKind kind, std::string url, std::string api_key,
                     net::HttpClient const &http);

    std::string const &name() const noexcept override
    {
        return name_;
    }
    ImportStatusMap get_status() override;

  private:
    std::string fetch(char const *path, char const *operation) const;

    ArrKind kind_;
    std::string name_;
    std::string url_;
    std::string api_key_;
    net::HttpClient const &http_;
};

} // namespace pb::arr
