#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pb::arr
{

// Item currently sitting in an *arr download queue.
struct QueueRecord
{
    std::int64_t id = 0;
    std::string download_id;
    std::int64_t item_id = 0;
    std::string title;
    std::string status;
    std::string date;
};

// "downloadFolderImported" history event.
struct HistoryRecord
{
    std::int64_t id = 0;
    std::string download_id;
    std::int64_t item_id = 0;
    std::string title;
    std::string date;
};

struct ItemImportStatus
{
    std::optional<QueueRecord> pending;
    std::optional<HistoryRecord> completed;
};

// Every media item a single transfer feeds, keyed by movie or episode id.
struct ImportStatus
{
    std::map<std::int64_t, ItemImportStatus> items;
};

using ImportStatusMap = std::map<std::int64_t, ImportStatus>;

class ImportTracker
{
  public:
    virtual ~ImportTracker() = default;

    virtual std::string const &name() const noexcept = 0;
    // Keyed by remote transfer id. Rebuilt from scratch on every call.
    virtual ImportStatusMap get_status() = 0;
};

inline bool is_fully_imported(ImportStatus const &status)
{
    if (status.items.empty())
    {
        return false;
    }
    for (auto const &[item_id, item] : status.items)
    {
        if (item.pending || !item.completed)
        {
            return false;
        }
    }
    return true;
}

} // namespace pb::arr
