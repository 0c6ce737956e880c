#include "arr/ArrImportTracker.hpp"

#include "engine/Errors.hpp"
#include "engine/HashCodec.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <yyjson.h>

#include <format>
#include <utility>

namespace pb::arr
{

namespace
{

using engine::ErrorCode;
using engine::ProxyError;

constexpr char kQueuePath[] = "/api/v3/queue?page=1&pageSize=1000"
                              "&sortKey=date&sortDirection=descending";
// eventType 3 is downloadFolderImported.
constexpr char kHistoryPath[] = "/api/v3/history?page=1&pageSize=1000"
                                "&sortKey=date&sortDirection=descending"
                                "&eventType=3";

char const *item_key(ArrKind kind)
{
    return kind == ArrKind::Movie ? "movieId" : "episodeId";
}

yyjson_val *records_of(json::Document const &doc, std::string const &tracker,
                       char const *operation)
{
    auto *records = yyjson_obj_get(doc.object_root(), "records");
    if (records == nullptr || !yyjson_is_arr(records))
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{} {}: missing \"records\"", tracker,
                                     operation));
    }
    return records;
}

// Slot for (transfer, item); nullptr when the download id is not ours.
ItemImportStatus *slot_for(ImportStatusMap &result, yyjson_val *record,
                           char const *key)
{
    auto download_id = json::string_member(record, "downloadId");
    if (!download_id)
    {
        return nullptr;
    }
    auto transfer_id = engine::try_parse_hash(*download_id);
    if (!transfer_id)
    {
        return nullptr;
    }
    auto item_id = json::int_member(record, key).value_or(0);
    return &result[*transfer_id].items[item_id];
}

} // namespace

ArrImportTracker::ArrImportTracker(ArrKind kind, std::string url,
                                   std::string api_key,
                                   net::HttpClient const &http)
    : kind_(kind), name_(kind == ArrKind::Movie ? "radarr" : "sonarr"),
      url_(std::move(url)), api_key_(std::move(api_key)), http_(http)
{
    while (!url_.empty() && url_.back() == '/')
    {
        url_.pop_back();
    }
}

std::string ArrImportTracker::fetch(char const *path,
                                    char const *operation) const
{
    auto response = http_.get(url_ + path, {{"X-Api-Key", api_key_},
                                            {"Accept", "application/json"}});
    if (response.transport_failed())
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{} {}: {}", name_, operation,
                                     response.error));
    }
    if (!response.ok())
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{} {}: HTTP {}", name_, operation,
                                     response.status));
    }
    return std::move(response.body);
}

ImportStatusMap ArrImportTracker::get_status()
{
    auto queue_doc = json::Document::parse(fetch(kQueuePath, "queue"));
    if (queue_doc.object_root() == nullptr)
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{} queue: invalid JSON", name_));
    }
    auto history_doc = json::Document::parse(fetch(kHistoryPath, "history"));
    if (history_doc.object_root() == nullptr)
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{} history: invalid JSON", name_));
    }

    auto const *key = item_key(kind_);
    ImportStatusMap result;
    size_t idx, limit;
    yyjson_val *record = nullptr;

    // Both lists are newest-first, so the first record seen for a slot wins.
    auto *queue = records_of(queue_doc, name_, "queue");
    yyjson_arr_foreach(queue, idx, limit, record)
    {
        auto *slot = slot_for(result, record, key);
        if (slot == nullptr || slot->pending)
        {
            continue;
        }
        QueueRecord entry;
        entry.id = json::int_member(record, "id").value_or(0);
        entry.download_id = json::string_member(record, "downloadId").value_or("");
        entry.item_id = json::int_member(record, key).value_or(0);
        entry.title = json::string_member(record, "title").value_or("");
        entry.status = json::string_member(record, "status").value_or("");
        entry.date = json::string_member(record, "added").value_or("");
        slot->pending = std::move(entry);
    }

    auto *history = records_of(history_doc, name_, "history");
    yyjson_arr_foreach(history, idx, limit, record)
    {
        auto *slot = slot_for(result, record, key);
        if (slot == nullptr || slot->completed)
        {
            continue;
        }
        HistoryRecord entry;
        entry.id = json::int_member(record, "id").value_or(0);
        entry.download_id = json::string_member(record, "downloadId").value_or("");
        entry.item_id = json::int_member(record, key).value_or(0);
        entry.title = json::string_member(record, "sourceTitle").value_or("");
        entry.date = json::string_member(record, "date").value_or("");
        slot->completed = std::move(entry);
    }

    PB_LOG_DEBUG("{} reports imports for {} transfers", name_, result.size());
    return result;
}

} // namespace pb::arr
