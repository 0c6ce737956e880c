#include "FakeRemoteApi.hpp"
#include "engine/DirectoryResolver.hpp"
#include "engine/Errors.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using pb::engine::DirectoryResolver;
using pb::engine::ErrorCode;
using pb::engine::ProxyError;
using pb::tests::FakeRemoteApi;

namespace
{

ErrorCode resolve_error(DirectoryResolver &resolver, std::string const &path)
{
    try
    {
        resolver.resolve(path);
    }
    catch (ProxyError const &ex)
    {
        return ex.code();
    }
    FAIL("resolve did not throw for " << path);
    return ErrorCode::MalformedRequest;
}

} // namespace

TEST_CASE("root directory resolves without remote calls")
{
    FakeRemoteApi api;
    auto root = api.make_folder("downloads", 0);
    DirectoryResolver resolver(api, "/downloads", root);
    CHECK(resolver.resolve("/downloads") == root);
    CHECK(resolver.resolve("/downloads/") == root);
    CHECK(api.journal().empty());
}

TEST_CASE("missing folders are created once")
{
    FakeRemoteApi api;
    auto root = api.make_folder("downloads", 0);
    DirectoryResolver resolver(api, "/downloads", root);

    auto first = resolver.resolve("/downloads/tv/Some Show");
    CHECK(api.count("create_folder") == 2);

    auto second = resolver.resolve("/downloads/tv/Some Show");
    CHECK(second == first);
    CHECK(api.count("create_folder") == 2);

    auto sibling = resolver.resolve("/downloads/tv/Other Show");
    CHECK(sibling != first);
    CHECK(api.count("create_folder") == 3);
}

TEST_CASE("existing folders are reused")
{
    FakeRemoteApi api;
    auto root = api.make_folder("downloads", 0);
    auto movies = api.make_folder("movies", root);
    DirectoryResolver resolver(api, "/downloads", root);
    CHECK(resolver.resolve("/downloads/movies") == movies);
    CHECK(api.count("create_folder") == 0);
}

TEST_CASE("empty segments are skipped")
{
    FakeRemoteApi api;
    DirectoryResolver resolver(api, "/downloads/", 0);
    CHECK(resolver.root_dir() == "/downloads");
    auto segments = resolver.relative_segments("/downloads//a///b/");
    CHECK(segments == std::vector<std::string>{"a", "b"});
}

TEST_CASE("slash root accepts every absolute path")
{
    FakeRemoteApi api;
    DirectoryResolver resolver(api, "/", 0);
    CHECK(resolver.resolve("/") == 0);
    auto segments = resolver.relative_segments("/movies/new");
    CHECK(segments == std::vector<std::string>{"movies", "new"});
}

TEST_CASE("paths outside the root are rejected before any remote call")
{
    FakeRemoteApi api;
    DirectoryResolver resolver(api, "/downloads", 0);
    CHECK(resolve_error(resolver, "/elsewhere") ==
          ErrorCode::InvalidDownloadDirectory);
    CHECK(resolve_error(resolver, "/downloadsmore") ==
          ErrorCode::InvalidDownloadDirectory);
    CHECK(resolve_error(resolver, "downloads") ==
          ErrorCode::InvalidDownloadDirectory);
    CHECK(resolve_error(resolver, "/downloads/../etc") ==
          ErrorCode::InvalidDownloadDirectory);
    CHECK(resolve_error(resolver, "/downloads/./x") ==
          ErrorCode::InvalidDownloadDirectory);
    CHECK(api.journal().empty());
}

TEST_CASE("remote failures surface as remote API errors")
{
    FakeRemoteApi api;
    DirectoryResolver resolver(api, "/downloads", 0);
    api.fail_on("list_folder");
    CHECK(resolve_error(resolver, "/downloads/new") == ErrorCode::RemoteApi);
    CHECK(api.count("create_folder") == 0);
}
