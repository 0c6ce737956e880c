#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace pb::engine
{

enum class ErrorCode
{
    InvalidHash,
    UnrecognizedCallback,
    OwnershipMismatch,
    InvalidDownloadDirectory,
    InvalidTorrentFile,
    RemoteApi,
    MalformedRequest,
};

constexpr std::string_view to_string(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::InvalidHash:
        return "invalid hash";
    case ErrorCode::UnrecognizedCallback:
        return "unrecognized callback";
    case ErrorCode::OwnershipMismatch:
        return "ownership mismatch";
    case ErrorCode::InvalidDownloadDirectory:
        return "invalid download directory";
    case ErrorCode::InvalidTorrentFile:
        return "invalid torrent file";
    case ErrorCode::RemoteApi:
        return "remote API error";
    case ErrorCode::MalformedRequest:
        return "malformed request";
    }
    return "unknown error";
}

class ProxyError : public std::runtime_error
{
  public:
    ProxyError(ErrorCode code, std::string const &message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message),
          code_(code)
    {
    }

    ErrorCode code() const noexcept
    {
        return code_;
    }

  private:
    ErrorCode code_;
};

} // namespace pb::engine
