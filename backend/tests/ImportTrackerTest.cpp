#include "FakeHttpServer.hpp"
#include "arr/ArrImportTracker.hpp"
#include "engine/Errors.hpp"
#include "engine/HashCodec.hpp"
#include "net/HttpClient.hpp"

#include <doctest/doctest.h>

#include <format>
#include <string>

using pb::arr::ArrImportTracker;
using pb::arr::ArrKind;
using pb::arr::ImportStatus;
using pb::tests::CannedResponse;
using pb::tests::FakeHttpServer;
using pb::tests::RecordedRequest;

namespace
{

std::string records(std::string const &items)
{
    return R"({"page":1,"totalRecords":0,"records":[)" + items + "]}";
}

std::string queue_item(int id, std::string const &download_id, int item_id,
                       char const *key)
{
    return std::format(
        R"({{"id":{},"downloadId":"{}","{}":{},"title":"q{}","status":"downloading","added":"2024-01-0{}T00:00:00Z"}})",
        id, download_id, key, item_id, id, id % 9 + 1);
}

std::string history_item(int id, std::string const &download_id, int item_id,
                         char const *key)
{
    return std::format(
        R"({{"id":{},"downloadId":"{}","{}":{},"sourceTitle":"h{}","eventType":"downloadFolderImported","date":"2024-02-0{}T00:00:00Z"}})",
        id, download_id, key, item_id, id, id % 9 + 1);
}

} // namespace

TEST_CASE("radarr queue and history are merged per transfer")
{
    FakeHttpServer server;
    auto ours = pb::engine::format_hash(101);
    server.set_handler(
        [&](RecordedRequest const &request) -> CannedResponse
        {
            if (request.path == "/api/v3/queue")
            {
                return {200, records(queue_item(1, ours, 7, "movieId") + "," +
                                     queue_item(2, "SABnzbd_nzo_x", 8,
                                                "movieId"))};
            }
            if (request.path == "/api/v3/history")
            {
                // Newest first; the older duplicate must not replace it.
                return {200,
                        records(history_item(10, ours, 7, "movieId") + "," +
                                history_item(9, ours, 7, "movieId") + "," +
                                history_item(8, "0123ABCD", 9, "movieId"))};
            }
            return {404, "{}"};
        });

    pb::net::HttpClient http;
    ArrImportTracker radarr(ArrKind::Movie, server.url() + "/", "secret",
                            http);
    CHECK(radarr.name() == "radarr");

    auto status = radarr.get_status();
    REQUIRE(status.size() == 1);
    REQUIRE(status.contains(101));
    auto const &items = status.at(101).items;
    REQUIRE(items.size() == 1);
    auto const &item = items.at(7);
    REQUIRE(item.pending);
    CHECK(item.pending->id == 1);
    CHECK(item.pending->title == "q1");
    CHECK(item.pending->status == "downloading");
    REQUIRE(item.completed);
    CHECK(item.completed->id == 10);
    CHECK(item.completed->title == "h10");
    CHECK(item.completed->download_id == ours);

    auto requests = server.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].path == "/api/v3/queue");
    CHECK(requests[0].query ==
          "page=1&pageSize=1000&sortKey=date&sortDirection=descending");
    CHECK(requests[1].path == "/api/v3/history");
    CHECK(requests[1].query.ends_with("&eventType=3"));
    for (auto const &request : requests)
    {
        CHECK(request.method == "GET");
        CHECK(request.api_key == "secret");
    }
}

TEST_CASE("sonarr keys items by episode")
{
    FakeHttpServer server;
    auto ours = pb::engine::format_hash(200);
    server.set_handler(
        [&](RecordedRequest const &request) -> CannedResponse
        {
            if (request.path == "/api/v3/queue")
            {
                return {200, records("")};
            }
            return {200, records(history_item(1, ours, 11, "episodeId") +
                                 "," +
                                 history_item(2, ours, 12, "episodeId") +
                                 "," +
                                 history_item(3, ours, 13, "episodeId"))};
        });

    pb::net::HttpClient http;
    ArrImportTracker sonarr(ArrKind::Episode, server.url(), "key", http);
    CHECK(sonarr.name() == "sonarr");
    auto status = sonarr.get_status();
    REQUIRE(status.contains(200));
    CHECK(status.at(200).items.size() == 3);
    CHECK(pb::arr::is_fully_imported(status.at(200)));
}

TEST_CASE("tracker failures surface as remote errors")
{
    FakeHttpServer server;
    pb::net::HttpClient http;
    ArrImportTracker radarr(ArrKind::Movie, server.url(), "key", http);

    SUBCASE("HTTP error")
    {
        server.set_handler([](RecordedRequest const &) -> CannedResponse
                           { return {401, R"({"message":"Unauthorized"})"}; });
    }
    SUBCASE("invalid JSON")
    {
        server.set_handler([](RecordedRequest const &) -> CannedResponse
                           { return {200, "<html>"}; });
    }
    SUBCASE("missing records")
    {
        server.set_handler([](RecordedRequest const &) -> CannedResponse
                           { return {200, R"({"page":1})"}; });
    }

    try
    {
        radarr.get_status();
        FAIL("expected a ProxyError");
    }
    catch (pb::engine::ProxyError const &ex)
    {
        CHECK(ex.code() == pb::engine::ErrorCode::RemoteApi);
    }
}

TEST_CASE("full import requires every item completed and none pending")
{
    using pb::arr::HistoryRecord;
    using pb::arr::QueueRecord;

    ImportStatus status;
    CHECK_FALSE(pb::arr::is_fully_imported(status));

    status.items[1].completed = HistoryRecord{};
    CHECK(pb::arr::is_fully_imported(status));

    status.items[2].pending = QueueRecord{};
    CHECK_FALSE(pb::arr::is_fully_imported(status));

    status.items[2].completed = HistoryRecord{};
    CHECK_FALSE(pb::arr::is_fully_imported(status));

    status.items[2].pending.reset();
    CHECK(pb::arr::is_fully_imported(status));
}
