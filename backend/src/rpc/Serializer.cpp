#include "rpc/Serializer.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <yyjson.h>

#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

namespace pb::rpc
{

namespace
{

std::string to_upper(std::string_view value)
{
    std::string out(value);
    for (auto &ch : out)
    {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
}

std::int64_t seconds_downloading(engine::Transfer const &transfer,
                                 std::chrono::system_clock::time_point now)
{
    if (!transfer.remote.created_at)
    {
        return 0;
    }
    auto now_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                           now.time_since_epoch())
                           .count();
    auto elapsed = now_seconds - *transfer.remote.created_at;
    return elapsed > 0 ? elapsed : 0;
}

void add_torrent_fields(yyjson_mut_doc *doc, yyjson_mut_val *entry,
                        engine::Transfer const &transfer,
                        std::chrono::system_clock::time_point now)
{
    auto const &remote = transfer.remote;
    yyjson_mut_obj_add_sint(doc, entry, "id", remote.id);
    yyjson_mut_obj_add_strcpy(doc, entry, "hashString", transfer.hash.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "name", remote.name.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "downloadDir",
                              transfer.download_dir.c_str());
    yyjson_mut_obj_add_sint(doc, entry, "totalSize", remote.size);
    yyjson_mut_obj_add_sint(doc, entry, "leftUntilDone",
                            remote.size - remote.downloaded);
    yyjson_mut_obj_add_bool(doc, entry, "isFinished",
                            remote.finished_at.has_value());
    yyjson_mut_obj_add_sint(doc, entry, "eta", remote.estimated_time);
    yyjson_mut_obj_add_int(doc, entry, "status",
                           static_cast<int>(to_torrent_status(remote.status)));
    yyjson_mut_obj_add_sint(doc, entry, "secondsDownloading",
                            seconds_downloading(transfer, now));
    yyjson_mut_obj_add_strcpy(doc, entry, "errorString",
                              remote.error_message.c_str());
    yyjson_mut_obj_add_sint(doc, entry, "downloadedEver", remote.downloaded);
    yyjson_mut_obj_add_real(doc, entry, "percentDone",
                            static_cast<double>(remote.percent_done) / 100.0);
    yyjson_mut_obj_add_real(doc, entry, "seedRatioLimit", 0.0);
    yyjson_mut_obj_add_int(doc, entry, "seedRatioMode", 0);
    yyjson_mut_obj_add_int(doc, entry, "seedIdleLimit", 0);
    yyjson_mut_obj_add_int(doc, entry, "seedIdleMode", 0);
    yyjson_mut_obj_add_int(doc, entry, "fileCount", 1);
}

} // namespace

TorrentStatus to_torrent_status(std::string_view remote_status)
{
    auto status = to_upper(remote_status);
    if (status == "COMPLETED" || status == "ERROR")
    {
        return TorrentStatus::Stopped;
    }
    if (status == "PREPARING_DOWNLOAD")
    {
        return TorrentStatus::CheckPending;
    }
    if (status == "COMPLETING")
    {
        return TorrentStatus::Checking;
    }
    if (status == "IN_QUEUE")
    {
        return TorrentStatus::DownloadPending;
    }
    if (status == "DOWNLOADING")
    {
        return TorrentStatus::Downloading;
    }
    if (status == "WAITING")
    {
        return TorrentStatus::SeedPending;
    }
    if (status == "SEEDING")
    {
        return TorrentStatus::Seeding;
    }
    PB_LOG_INFO("unknown transfer status '{}', reporting check pending",
                remote_status);
    return TorrentStatus::CheckPending;
}

std::string serialize_session(std::string const &download_dir)
{
    pb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "success");

    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);
    yyjson_mut_obj_add_str(native, arguments, "rpc-version",
                           pb::version::kTransmissionRpcVersion);
    yyjson_mut_obj_add_str(native, arguments, "version",
                           pb::version::kTransmissionVersion);
    yyjson_mut_obj_add_strcpy(native, arguments, "download-dir",
                              download_dir.c_str());

    return doc.write(R"({"result":"error"})");
}

std::string serialize_torrent(engine::Transfer const &transfer,
                              std::chrono::system_clock::time_point now)
{
    pb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "success");

    // torrent-add replies with the torrent itself as the arguments object.
    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);
    add_torrent_fields(native, arguments, transfer, now);

    return doc.write(R"({"result":"error"})");
}

std::string serialize_torrent_list(std::vector<engine::Transfer> const &transfers,
                                   std::chrono::system_clock::time_point now)
{
    pb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "success");

    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);

    auto *array = yyjson_mut_arr(native);
    yyjson_mut_obj_add_val(native, arguments, "torrents", array);
    for (auto const &transfer : transfers)
    {
        auto *entry = yyjson_mut_obj(native);
        add_torrent_fields(native, entry, transfer, now);
        yyjson_mut_arr_add_val(array, entry);
    }

    return doc.write(R"({"result":"error"})");
}

std::string serialize_success()
{
    pb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "success");

    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);

    return doc.write(R"({"result":"error"})");
}

std::string serialize_error(std::string_view message,
                            std::optional<std::string_view> details)
{
    pb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "error");

    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);
    yyjson_mut_obj_add_strncpy(native, arguments, "message", message.data(),
                               message.size());
#ifndef NDEBUG
    if (details && !details->empty())
    {
        yyjson_mut_obj_add_strncpy(native, arguments, "detail",
                                   details->data(), details->size());
    }
#endif

    return doc.write(R"({"result":"error"})");
}

} // namespace pb::rpc
