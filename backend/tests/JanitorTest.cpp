#include "FakeRemoteApi.hpp"
#include "arr/ImportTracker.hpp"
#include "engine/Janitor.hpp"
#include "engine/TransferProxy.hpp"
#include "utils/Log.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <latch>
#include <stdexcept>
#include <string>
#include <thread>

using pb::arr::HistoryRecord;
using pb::arr::ImportStatusMap;
using pb::arr::QueueRecord;
using pb::engine::Janitor;
using pb::engine::TransferProxy;
using pb::tests::FakeRemoteApi;

namespace
{

class StaticTracker final : public pb::arr::ImportTracker
{
  public:
    explicit StaticTracker(std::string name) : name_(std::move(name))
    {
    }

    std::string const &name() const noexcept override
    {
        return name_;
    }

    ImportStatusMap get_status() override
    {
        ++calls;
        if (fail)
        {
            throw std::runtime_error(name_ + " unavailable");
        }
        return status;
    }

    void complete(std::int64_t transfer_id, std::int64_t item_id)
    {
        auto &item = status[transfer_id].items[item_id];
        item.pending.reset();
        item.completed = HistoryRecord{};
    }

    void enqueue(std::int64_t transfer_id, std::int64_t item_id)
    {
        status[transfer_id].items[item_id].pending = QueueRecord{};
    }

    ImportStatusMap status;
    bool fail = false;
    int calls = 0;

  private:
    std::string name_;
};

// Parks the first get_status call until released.
class BlockingTracker final : public pb::arr::ImportTracker
{
  public:
    std::string const &name() const noexcept override
    {
        return name_;
    }

    ImportStatusMap get_status() override
    {
        ++calls;
        entered.count_down();
        release.wait();
        return {};
    }

    std::latch entered{1};
    std::latch release{1};
    std::atomic<int> calls{0};

  private:
    std::string name_ = "radarr";
};

} // namespace

TEST_CASE("janitor removes transfers once every item is imported")
{
    FakeRemoteApi api;
    TransferProxy proxy(api, {"/", 0, ""});
    auto movie = proxy.add_transfer("magnet:?xt=urn:btih:M&dn=movie", "/");
    auto season = proxy.add_transfer("magnet:?xt=urn:btih:S&dn=season", "/");
    auto movie_file = api.complete_transfer(movie.remote.id);
    auto season_file = api.complete_transfer(season.remote.id);

    StaticTracker radarr("radarr");
    StaticTracker sonarr("sonarr");
    radarr.complete(movie.remote.id, 1);
    sonarr.complete(season.remote.id, 11);
    sonarr.complete(season.remote.id, 12);
    sonarr.enqueue(season.remote.id, 13);

    Janitor janitor(proxy, &radarr, &sonarr);
    auto removed = janitor.run_once();
    REQUIRE(removed.size() == 1);
    CHECK(removed[0] == movie.remote.id);
    CHECK_FALSE(api.has_file(movie_file));
    CHECK(api.has_file(season_file));
    CHECK(proxy.list_transfers().size() == 1);

    sonarr.complete(season.remote.id, 13);
    removed = janitor.run_once();
    REQUIRE(removed.size() == 1);
    CHECK(removed[0] == season.remote.id);
    CHECK_FALSE(api.has_file(season_file));
    CHECK(proxy.list_transfers().empty());
}

TEST_CASE("transfers without imports are left alone")
{
    FakeRemoteApi api;
    TransferProxy proxy(api, {"/", 0, ""});
    proxy.add_transfer("magnet:?xt=urn:btih:A", "/");

    StaticTracker radarr("radarr");
    Janitor janitor(proxy, &radarr, nullptr);
    CHECK(janitor.run_once().empty());
    CHECK(api.count("cancel_transfer") == 0);
    CHECK(radarr.calls == 1);
}

TEST_CASE("a pass requested while one is running is skipped")
{
    FakeRemoteApi api;
    TransferProxy proxy(api, {"/", 0, ""});
    proxy.add_transfer("magnet:?xt=urn:btih:A", "/");

    BlockingTracker radarr;
    Janitor janitor(proxy, &radarr, nullptr);

    std::thread first([&] { CHECK(janitor.run_once().empty()); });
    radarr.entered.wait();

    CHECK(janitor.run_once().empty());
    CHECK(radarr.calls.load() == 1);

    radarr.release.count_down();
    first.join();
    CHECK(radarr.calls.load() == 1);
    CHECK(api.count("cancel_transfer") == 0);
}

#if PB_LOGGING_ACTIVE
TEST_CASE("unmatched transfers are logged as warnings")
{
    auto path =
        std::filesystem::temp_directory_path() / "putbridge-janitor-test.log";
    std::filesystem::remove(path);
    pb::log::set_log_file(path.string());

    FakeRemoteApi api;
    TransferProxy proxy(api, {"/", 0, ""});
    auto added = proxy.add_transfer("magnet:?xt=urn:btih:A", "/");
    StaticTracker radarr("radarr");
    Janitor janitor(proxy, &radarr, nullptr);
    CHECK(janitor.run_once().empty());

    pb::log::set_log_file("putbridge.log");

    std::ifstream input(path);
    REQUIRE(input);
    auto expected =
        "no corresponding imports for transfer " +
        std::to_string(added.remote.id);
    bool found = false;
    for (std::string line; std::getline(input, line);)
    {
        if (line.find(expected) != std::string::npos)
        {
            found = true;
            CHECK(line.starts_with("[W "));
        }
    }
    CHECK(found);
    input.close();
    std::filesystem::remove(path);
}
#endif

TEST_CASE("tracker failure aborts the pass without removals")
{
    FakeRemoteApi api;
    TransferProxy proxy(api, {"/", 0, ""});
    auto added = proxy.add_transfer("magnet:?xt=urn:btih:A", "/");

    StaticTracker radarr("radarr");
    StaticTracker sonarr("sonarr");
    radarr.complete(added.remote.id, 1);
    sonarr.fail = true;

    Janitor janitor(proxy, &radarr, &sonarr);
    CHECK_THROWS_AS(janitor.run_once(), std::runtime_error);
    CHECK(api.count("cancel_transfer") == 0);
}

TEST_CASE("janitor worker runs immediately and stops promptly")
{
    FakeRemoteApi api;
    TransferProxy proxy(api, {"/", 0, ""});
    auto added = proxy.add_transfer("magnet:?xt=urn:btih:A", "/");

    StaticTracker radarr("radarr");
    radarr.complete(added.remote.id, 1);

    Janitor janitor(proxy, &radarr, nullptr);
    janitor.start(std::chrono::hours(1));
    CHECK(janitor.is_running());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (api.count("cancel_transfer") == 0 &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(api.count("cancel_transfer") == 1);

    auto stop_started = std::chrono::steady_clock::now();
    janitor.stop();
    CHECK(std::chrono::steady_clock::now() - stop_started <
          std::chrono::seconds(2));
    CHECK_FALSE(janitor.is_running());
}

TEST_CASE("janitor interval is clamped to its allowed range")
{
    using namespace std::chrono_literals;
    using pb::engine::clamp_janitor_interval;
    CHECK(clamp_janitor_interval(600s) == 600s);
    CHECK(clamp_janitor_interval(86400s) == 86400s);
    CHECK(clamp_janitor_interval(7200s) == 7200s);
    CHECK(clamp_janitor_interval(599s) == 3600s);
    CHECK(clamp_janitor_interval(86401s) == 3600s);
    CHECK(clamp_janitor_interval(0s) == 3600s);
}
