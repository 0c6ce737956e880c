#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pb::remote
{

inline constexpr char const kDirectoryContentType[] =
    "application/x-directory";

struct RemoteTransfer
{
    std::int64_t id = 0;
    std::string name;
    std::int64_t size = 0;
    std::int64_t downloaded = 0;
    std::string status;
    // Unix seconds; absent when the service did not report them.
    std::optional<std::int64_t> created_at;
    std::optional<std::int64_t> finished_at;
    std::int64_t file_id = 0;
    std::string error_message;
    std::string callback_url;
    std::int64_t estimated_time = 0;
    int percent_done = 0;
};

struct RemoteFile
{
    std::int64_t id = 0;
    std::int64_t parent_id = 0;
    std::string name;
    std::string content_type;
    std::int64_t size = 0;

    bool is_dir() const noexcept
    {
        return content_type == kDirectoryContentType;
    }
};

// Operations consumed from the remote storage/transfer service. Every
// method throws engine::ProxyError with ErrorCode::RemoteApi on failure.
class RemoteApi
{
  public:
    virtual ~RemoteApi() = default;

    virtual std::vector<RemoteTransfer> list_transfers() = 0;
    virtual RemoteTransfer get_transfer(std::int64_t id) = 0;
    virtual RemoteTransfer add_transfer(std::string const &url,
                                        std::int64_t parent_id,
                                        std::string const &callback_url) = 0;
    virtual void cancel_transfer(std::int64_t id) = 0;

    virtual std::vector<RemoteFile> list_folder(std::int64_t parent_id) = 0;
    virtual RemoteFile create_folder(std::string const &name,
                                     std::int64_t parent_id) = 0;
    virtual void delete_file(std::int64_t id) = 0;
};

} // namespace pb::remote
