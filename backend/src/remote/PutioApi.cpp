#include "remote/PutioApi.hpp"

#include "engine/Errors.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <yyjson.h>

#include <cstdio>
#include <ctime>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pb::remote
{

namespace
{

using engine::ErrorCode;
using engine::ProxyError;

// put.io timestamps look like "2024-05-01T10:20:30", always UTC.
std::optional<std::int64_t> parse_timestamp(yyjson_val *object,
                                            char const *key)
{
    auto text = json::string_member(object, key);
    if (!text || text->empty())
    {
        return std::nullopt;
    }
    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(text->c_str(), "%d-%d-%dT%d:%d:%d", &year, &month, &day,
                    &hour, &minute, &second) != 6)
    {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return static_cast<std::int64_t>(timegm(&tm));
}

RemoteTransfer parse_transfer(yyjson_val *object)
{
    RemoteTransfer transfer;
    transfer.id = json::int_member(object, "id").value_or(0);
    transfer.name = json::string_member(object, "name").value_or("");
    transfer.size = json::int_member(object, "size").value_or(0);
    transfer.downloaded = json::int_member(object, "downloaded").value_or(0);
    transfer.status = json::string_member(object, "status").value_or("");
    transfer.created_at = parse_timestamp(object, "created_at");
    transfer.finished_at = parse_timestamp(object, "finished_at");
    transfer.file_id = json::int_member(object, "file_id").value_or(0);
    transfer.error_message =
        json::string_member(object, "error_message").value_or("");
    transfer.callback_url =
        json::string_member(object, "callback_url").value_or("");
    transfer.estimated_time =
        json::int_member(object, "estimated_time").value_or(0);
    transfer.percent_done = static_cast<int>(
        json::int_member(object, "percent_done").value_or(0));
    return transfer;
}

RemoteFile parse_file(yyjson_val *object)
{
    RemoteFile file;
    file.id = json::int_member(object, "id").value_or(0);
    file.parent_id = json::int_member(object, "parent_id").value_or(0);
    file.name = json::string_member(object, "name").value_or("");
    file.content_type =
        json::string_member(object, "content_type").value_or("");
    file.size = json::int_member(object, "size").value_or(0);
    return file;
}

json::Document parse_object(std::string const &body, char const *operation)
{
    auto doc = json::Document::parse(body);
    if (doc.object_root() == nullptr)
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{}: response is not a JSON object",
                                     operation));
    }
    return doc;
}

yyjson_val *required_object(json::Document const &doc, char const *key,
                            char const *operation)
{
    auto *value = yyjson_obj_get(doc.object_root(), key);
    if (value == nullptr || !yyjson_is_obj(value))
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{}: missing \"{}\"", operation, key));
    }
    return value;
}

yyjson_val *required_array(json::Document const &doc, char const *key,
                           char const *operation)
{
    auto *value = yyjson_obj_get(doc.object_root(), key);
    if (value == nullptr || !yyjson_is_arr(value))
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{}: missing \"{}\"", operation, key));
    }
    return value;
}

} // namespace

PutioApi::PutioApi(net::HttpClient const &http, PutioOptions options)
    : http_(http), options_(std::move(options))
{
    while (!options_.base_url.empty() && options_.base_url.back() == '/')
    {
        options_.base_url.pop_back();
    }
}

net::HeaderList PutioApi::auth_headers() const
{
    return {{"Authorization", "Bearer " + options_.oauth_token},
            {"Accept", "application/json"}};
}

std::string PutioApi::endpoint(std::string const &path) const
{
    return options_.base_url + path;
}

std::string PutioApi::checked_body(net::HttpResponse const &response,
                                   char const *operation) const
{
    if (response.transport_failed())
    {
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{}: {}", operation, response.error));
    }
    if (!response.ok())
    {
        auto doc = json::Document::parse(response.body);
        auto detail = json::string_member(doc.object_root(), "error_message")
                          .value_or(response.body);
        throw ProxyError(ErrorCode::RemoteApi,
                         std::format("{}: HTTP {}: {}", operation,
                                     response.status, detail));
    }
    return response.body;
}

std::vector<RemoteTransfer> PutioApi::list_transfers()
{
    static constexpr char kOperation[] = "list transfers";
    auto body = checked_body(
        http_.get(endpoint("/v2/transfers/list"), auth_headers()), kOperation);
    auto doc = parse_object(body, kOperation);
    auto *array = required_array(doc, "transfers", kOperation);

    std::vector<RemoteTransfer> transfers;
    transfers.reserve(yyjson_arr_size(array));
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(array, idx, limit, entry)
    {
        if (yyjson_is_obj(entry))
        {
            transfers.push_back(parse_transfer(entry));
        }
    }
    return transfers;
}

RemoteTransfer PutioApi::get_transfer(std::int64_t id)
{
    static constexpr char kOperation[] = "get transfer";
    auto body = checked_body(
        http_.get(endpoint(std::format("/v2/transfers/{}", id)),
                  auth_headers()),
        kOperation);
    auto doc = parse_object(body, kOperation);
    return parse_transfer(required_object(doc, "transfer", kOperation));
}

RemoteTransfer PutioApi::add_transfer(std::string const &url,
                                      std::int64_t parent_id,
                                      std::string const &callback_url)
{
    static constexpr char kOperation[] = "add transfer";
    net::QueryParams form = {{"url", url},
                             {"save_parent_id", std::to_string(parent_id)},
                             {"callback_url", callback_url}};
    auto body = checked_body(
        http_.post_form(endpoint("/v2/transfers/add"), form, auth_headers()),
        kOperation);
    auto doc = parse_object(body, kOperation);
    auto transfer =
        parse_transfer(required_object(doc, "transfer", kOperation));
    PB_LOG_DEBUG("put.io transfer {} added under folder {}", transfer.id,
                 parent_id);
    return transfer;
}

void PutioApi::cancel_transfer(std::int64_t id)
{
    net::QueryParams form = {{"transfer_ids", std::to_string(id)}};
    checked_body(http_.post_form(endpoint("/v2/transfers/cancel"), form,
                                 auth_headers()),
                 "cancel transfer");
}

std::vector<RemoteFile> PutioApi::list_folder(std::int64_t parent_id)
{
    static constexpr char kOperation[] = "list files";
    auto body = checked_body(
        http_.get(endpoint(std::format("/v2/files/list?parent_id={}",
                                       parent_id)),
                  auth_headers()),
        kOperation);
    auto doc = parse_object(body, kOperation);
    auto *array = required_array(doc, "files", kOperation);

    std::vector<RemoteFile> files;
    files.reserve(yyjson_arr_size(array));
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(array, idx, limit, entry)
    {
        if (yyjson_is_obj(entry))
        {
            files.push_back(parse_file(entry));
        }
    }
    return files;
}

RemoteFile PutioApi::create_folder(std::string const &name,
                                   std::int64_t parent_id)
{
    static constexpr char kOperation[] = "create folder";
    net::QueryParams form = {{"name", name},
                             {"parent_id", std::to_string(parent_id)}};
    auto body = checked_body(http_.post_form(endpoint("/v2/files/create-folder"),
                                             form, auth_headers()),
                             kOperation);
    auto doc = parse_object(body, kOperation);
    return parse_file(required_object(doc, "file", kOperation));
}

void PutioApi::delete_file(std::int64_t id)
{
    net::QueryParams form = {{"file_ids", std::to_string(id)}};
    checked_body(
        http_.post_form(endpoint("/v2/files/delete"), form, auth_headers()),
        "delete file");
}

} // namespace pb::remote
