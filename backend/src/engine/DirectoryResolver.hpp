#pragma once

#include "remote/RemoteApi.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pb::engine
{

// Maps logical download directories (as the calling client sees them) onto
// remote folder IDs below the configured root folder.
class DirectoryResolver
{
  public:
    DirectoryResolver(remote::RemoteApi &api, std::string root_dir,
                      std::int64_t root_folder_id);

    // Walks the remote tree one segment at a time, creating folders that do
    // not exist yet. Throws InvalidDownloadDirectory when logical_path is not
    // the root or below it, and RemoteApi when a remote call fails; folders
    // created before the failure are left in place.
    std::int64_t resolve(std::string_view logical_path);

    // Segments below the root; throws InvalidDownloadDirectory.
    std::vector<std::string> relative_segments(
        std::string_view logical_path) const;

    std::string const &root_dir() const noexcept
    {
        return root_dir_;
    }

  private:
    remote::RemoteApi &api_;
    std::string root_dir_;
    std::int64_t root_folder_id_;
};

} // namespace pb::engine
