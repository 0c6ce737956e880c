#include "engine/DirectoryResolver.hpp"

#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <format>
#include <utility>

namespace pb::engine
{

DirectoryResolver::DirectoryResolver(remote::RemoteApi &api,
                                     std::string root_dir,
                                     std::int64_t root_folder_id)
    : api_(api), root_dir_(std::move(root_dir)),
      root_folder_id_(root_folder_id)
{
    while (root_dir_.size() > 1 && root_dir_.back() == '/')
    {
        root_dir_.pop_back();
    }
}

std::vector<std::string>
DirectoryResolver::relative_segments(std::string_view logical_path) const
{
    auto reject = [&]()
    {
        return ProxyError(
            ErrorCode::InvalidDownloadDirectory,
            std::format("\"{}\" is not inside \"{}\"", logical_path,
                        root_dir_));
    };

    if (!logical_path.starts_with(root_dir_))
    {
        throw reject();
    }
    auto remainder = logical_path.substr(root_dir_.size());
    // "/data" must not match "/database".
    if (!remainder.empty() && root_dir_ != "/" && remainder.front() != '/')
    {
        throw reject();
    }

    std::vector<std::string> segments;
    while (!remainder.empty())
    {
        auto slash = remainder.find('/');
        auto segment = remainder.substr(0, slash);
        remainder = slash == std::string_view::npos
                        ? std::string_view{}
                        : remainder.substr(slash + 1);
        if (segment.empty())
        {
            continue;
        }
        if (segment == "." || segment == "..")
        {
            throw reject();
        }
        segments.emplace_back(segment);
    }
    return segments;
}

std::int64_t DirectoryResolver::resolve(std::string_view logical_path)
{
    auto segments = relative_segments(logical_path);
    std::int64_t current = root_folder_id_;
    for (auto const &segment : segments)
    {
        try
        {
            bool found = false;
            for (auto const &child : api_.list_folder(current))
            {
                if (child.is_dir() && child.name == segment)
                {
                    current = child.id;
                    found = true;
                    break;
                }
            }
            if (found)
            {
                continue;
            }
            auto created = api_.create_folder(segment, current);
            PB_LOG_DEBUG("created remote folder \"{}\" ({}) under {}",
                         segment, created.id, current);
            current = created.id;
        }
        catch (ProxyError const &ex)
        {
            throw ProxyError(ErrorCode::RemoteApi,
                             std::format("resolving \"{}\" at segment \"{}\": "
                                         "{}",
                                         logical_path, segment, ex.what()));
        }
    }
    return current;
}

} // namespace pb::engine
