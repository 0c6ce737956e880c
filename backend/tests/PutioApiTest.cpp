#include "FakeHttpServer.hpp"
#include "engine/Errors.hpp"
#include "net/HttpClient.hpp"
#include "remote/PutioApi.hpp"
#include "utils/Endpoint.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <string>

using pb::engine::ErrorCode;
using pb::engine::ProxyError;
using pb::remote::PutioApi;
using pb::tests::CannedResponse;
using pb::tests::FakeHttpServer;
using pb::tests::RecordedRequest;

namespace
{

constexpr char kTransferJson[] =
    R"({"id":7,"name":"Show.S01E01","size":2048,"downloaded":1024,)"
    R"("status":"DOWNLOADING","created_at":"2024-05-01T10:20:30",)"
    R"("finished_at":null,"file_id":null,"error_message":null,)"
    R"("callback_url":"test://put.test/arr#%2Ftv","estimated_time":60,)"
    R"("percent_done":50})";

std::string form_value(RecordedRequest const &request, std::string const &key)
{
    auto params = pb::net::parse_query(request.body);
    REQUIRE(params);
    for (auto const &[name, value] : *params)
    {
        if (name == key)
        {
            return value;
        }
    }
    return {};
}

ErrorCode error_of(auto &&fn)
{
    try
    {
        fn();
    }
    catch (ProxyError const &ex)
    {
        return ex.code();
    }
    FAIL("expected a ProxyError");
    return ErrorCode::MalformedRequest;
}

} // namespace

TEST_CASE("transfers are listed with bearer authentication")
{
    FakeHttpServer server;
    server.set_handler(
        [](RecordedRequest const &) -> CannedResponse
        {
            return {200, std::string(R"({"status":"OK","transfers":[)") +
                             kTransferJson + "]}"};
        });
    pb::net::HttpClient http;
    PutioApi api(http, {server.url() + "/", "token-123"});

    auto transfers = api.list_transfers();
    REQUIRE(transfers.size() == 1);
    auto const &transfer = transfers[0];
    CHECK(transfer.id == 7);
    CHECK(transfer.name == "Show.S01E01");
    CHECK(transfer.size == 2048);
    CHECK(transfer.downloaded == 1024);
    CHECK(transfer.status == "DOWNLOADING");
    REQUIRE(transfer.created_at);
    CHECK(*transfer.created_at == 1714558830);
    CHECK_FALSE(transfer.finished_at);
    CHECK(transfer.file_id == 0);
    CHECK(transfer.error_message.empty());
    CHECK(transfer.callback_url == "test://put.test/arr#%2Ftv");
    CHECK(transfer.estimated_time == 60);
    CHECK(transfer.percent_done == 50);

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "GET");
    CHECK(requests[0].path == "/v2/transfers/list");
    CHECK(requests[0].authorization == "Bearer token-123");
}

TEST_CASE("adding a transfer posts a form")
{
    FakeHttpServer server;
    server.set_handler(
        [](RecordedRequest const &) -> CannedResponse
        {
            return {200, std::string(R"({"status":"OK","transfer":)") +
                             kTransferJson + "}"};
        });
    pb::net::HttpClient http;
    PutioApi api(http, {server.url(), "t"});

    auto transfer = api.add_transfer("magnet:?xt=urn:btih:AAA&dn=x", 55,
                                     "test://put.test/arr#%2Ftv");
    CHECK(transfer.id == 7);

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    auto const &request = requests[0];
    CHECK(request.method == "POST");
    CHECK(request.path == "/v2/transfers/add");
    CHECK(request.content_type == "application/x-www-form-urlencoded");
    CHECK(form_value(request, "url") == "magnet:?xt=urn:btih:AAA&dn=x");
    CHECK(form_value(request, "save_parent_id") == "55");
    CHECK(form_value(request, "callback_url") == "test://put.test/arr#%2Ftv");
}

TEST_CASE("folder and file operations")
{
    FakeHttpServer server;
    server.set_handler(
        [](RecordedRequest const &request) -> CannedResponse
        {
            if (request.path == "/v2/files/list")
            {
                return {200,
                        R"({"files":[{"id":3,"parent_id":1,"name":"tv",)"
                        R"("content_type":"application/x-directory","size":0},)"
                        R"({"id":4,"parent_id":1,"name":"a.mkv",)"
                        R"("content_type":"video/x-matroska","size":9}]})"};
            }
            if (request.path == "/v2/files/create-folder")
            {
                return {200, R"({"file":{"id":5,"parent_id":1,"name":"new",)"
                             R"("content_type":"application/x-directory"}})"};
            }
            return {200, R"({"status":"OK"})"};
        });
    pb::net::HttpClient http;
    PutioApi api(http, {server.url(), "t"});

    auto files = api.list_folder(1);
    REQUIRE(files.size() == 2);
    CHECK(files[0].is_dir());
    CHECK(files[0].name == "tv");
    CHECK_FALSE(files[1].is_dir());
    CHECK(files[1].size == 9);

    auto folder = api.create_folder("new", 1);
    CHECK(folder.id == 5);
    CHECK(folder.is_dir());

    api.delete_file(4);
    api.cancel_transfer(7);

    auto requests = server.requests();
    REQUIRE(requests.size() == 4);
    CHECK(requests[0].query == "parent_id=1");
    CHECK(form_value(requests[1], "name") == "new");
    CHECK(form_value(requests[1], "parent_id") == "1");
    CHECK(requests[2].path == "/v2/files/delete");
    CHECK(form_value(requests[2], "file_ids") == "4");
    CHECK(requests[3].path == "/v2/transfers/cancel");
    CHECK(form_value(requests[3], "transfer_ids") == "7");
}

TEST_CASE("service errors become remote errors")
{
    FakeHttpServer server;
    pb::net::HttpClient http;
    PutioApi api(http, {server.url(), "t"});

    SUBCASE("error status with message")
    {
        server.set_handler(
            [](RecordedRequest const &) -> CannedResponse
            {
                return {404, R"({"error_message":"Transfer not found",)"
                             R"("error_type":"NotFound","status":"ERROR"})"};
            });
        try
        {
            api.get_transfer(99);
            FAIL("expected a ProxyError");
        }
        catch (ProxyError const &ex)
        {
            CHECK(ex.code() == ErrorCode::RemoteApi);
            CHECK(std::string(ex.what()).find("Transfer not found") !=
                  std::string::npos);
        }
        REQUIRE(server.requests().size() == 1);
        CHECK(server.requests()[0].path == "/v2/transfers/99");
    }
    SUBCASE("malformed body")
    {
        server.set_handler([](RecordedRequest const &) -> CannedResponse
                           { return {200, R"({"status":"OK"})"}; });
        CHECK(error_of([&] { api.list_transfers(); }) == ErrorCode::RemoteApi);
        CHECK(error_of([&] { api.get_transfer(1); }) == ErrorCode::RemoteApi);
    }
}

TEST_CASE("connection failures become remote errors")
{
    std::string url;
    {
        FakeHttpServer server;
        url = server.url();
    }
    pb::net::HttpClient http({std::chrono::seconds(2), {}});
    auto response = http.get(url + "/anything");
    CHECK(response.transport_failed());
    CHECK_FALSE(response.ok());

    PutioApi api(http, {url, "t"});
    CHECK(error_of([&] { api.list_transfers(); }) == ErrorCode::RemoteApi);
}
