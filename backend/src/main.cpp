#include "app/Config.hpp"
#include "app/DaemonMain.hpp"
#include "arr/ArrImportTracker.hpp"
#include "engine/Janitor.hpp"
#include "engine/TransferProxy.hpp"
#include "net/HttpClient.hpp"
#include "remote/PutioApi.hpp"
#include "rpc/Server.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace
{

struct CommandLine
{
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> bind;
    bool verbose = false;
    bool show_version = false;
    int run_seconds = 0;
};

int parse_seconds(std::string_view value)
{
    int seconds = 0;
    for (char ch : value)
    {
        if (ch < '0' || ch > '9')
        {
            return 5;
        }
        seconds = seconds * 10 + (ch - '0');
    }
    return value.empty() ? 5 : seconds;
}

CommandLine parse_command_line(int argc, char *argv[])
{
    CommandLine cli;
    auto next_value = [&](int &index, char const *flag) -> std::string
    {
        if (index + 1 >= argc || argv[index + 1] == nullptr)
        {
            throw pb::app::ConfigError(
                std::string(flag) + " requires a value");
        }
        return argv[++index];
    };
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
            continue;
        std::string arg = argv[index];
        if (arg == "--config")
        {
            cli.config_path = next_value(index, "--config");
        }
        else if (arg.rfind("--config=", 0) == 0)
        {
            cli.config_path = arg.substr(9);
        }
        else if (arg == "--addr")
        {
            cli.bind = next_value(index, "--addr");
        }
        else if (arg.rfind("--addr=", 0) == 0)
        {
            cli.bind = arg.substr(7);
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            cli.verbose = true;
        }
        else if (arg == "--version")
        {
            cli.show_version = true;
        }
        else if (arg.rfind("--run-seconds=", 0) == 0)
        {
            cli.run_seconds = parse_seconds(arg.substr(14));
        }
        else if (arg == "--run-seconds")
        {
            if (index + 1 < argc && argv[index + 1] &&
                argv[index + 1][0] != '-')
            {
                cli.run_seconds = parse_seconds(argv[++index]);
            }
            else
            {
                cli.run_seconds = 5;
            }
        }
        else
        {
            throw pb::app::ConfigError("unknown argument " + arg);
        }
    }
    return cli;
}

} // namespace

namespace pb::app
{

int daemon_main(int argc, char *argv[],
                std::promise<pb::rpc::ConnectionInfo> *ready_promise)
{
    try
    {
        std::signal(SIGINT, [](int) { pb::runtime::request_shutdown(); });
        std::signal(SIGTERM, [](int) { pb::runtime::request_shutdown(); });

        auto cli = parse_command_line(argc, argv);
        if (cli.show_version)
        {
            pb::log::print_status("{}", pb::version::kDisplayVersion);
            return 0;
        }

        auto config_path = cli.config_path.value_or(default_config_path());
        auto config = load_config(config_path);
        if (cli.bind)
        {
            config.server.bind = *cli.bind;
        }
        if (cli.verbose)
        {
            config.verbose = true;
        }
        if (config.log_file)
        {
            pb::log::set_log_file(*config.log_file);
        }
        pb::log::set_verbose(config.verbose);

        PB_LOG_INFO("{} starting with {}", pb::version::kDisplayVersion,
                    config_path.string());
        PB_LOG_INFO("Download directory: {} (folder {})",
                    config.transmission.download_dir,
                    config.putio.parent_dir_id);

        pb::net::HttpClient http(pb::app::http_client_options(config));
        if (!http.verifies_peers())
        {
            PB_LOG_WARN("no CA bundle configured; https endpoints are refused");
        }
        pb::remote::PutioApi putio(
            http, {config.putio.api_url, config.putio.oauth_token});
        pb::engine::TransferProxy proxy(
            putio, {config.transmission.download_dir,
                    config.putio.parent_dir_id, config.putio.friend_token});

        std::unique_ptr<pb::arr::ArrImportTracker> radarr;
        if (config.radarr)
        {
            radarr = std::make_unique<pb::arr::ArrImportTracker>(
                pb::arr::ArrKind::Movie, config.radarr->url,
                config.radarr->api_key, http);
        }
        std::unique_ptr<pb::arr::ArrImportTracker> sonarr;
        if (config.sonarr)
        {
            sonarr = std::make_unique<pb::arr::ArrImportTracker>(
                pb::arr::ArrKind::Episode, config.sonarr->url,
                config.sonarr->api_key, http);
        }

        pb::rpc::ServerOptions rpc_options;
        rpc_options.basic_auth = std::make_pair(config.transmission.username,
                                                config.transmission.password);
        rpc_options.workers = config.server.workers;
        pb::rpc::Server rpc(proxy, config.server.bind, rpc_options);
        if (!rpc.start())
        {
            pb::log::print_status("PutBridge failed to bind {}",
                                  config.server.bind);
            return 1;
        }
        if (ready_promise != nullptr)
        {
            if (auto info = rpc.connection_info())
            {
                ready_promise->set_value(*info);
            }
        }

        pb::engine::Janitor janitor(proxy, radarr.get(), sonarr.get());
        auto interval =
            pb::engine::clamp_janitor_interval(config.putio.janitor_interval);
        janitor.start(interval);
        PB_LOG_INFO("Janitor running every {}s", interval.count());

        if (cli.run_seconds > 0)
        {
            std::thread(
                [run_seconds = cli.run_seconds]()
                {
                    std::this_thread::sleep_for(
                        std::chrono::seconds(run_seconds));
                    PB_LOG_INFO("Auto shutdown: run-seconds={} reached, "
                                "requesting shutdown",
                                run_seconds);
                    pb::runtime::request_shutdown();
                })
                .detach();
        }

        pb::log::print_status("PutBridge running; CTRL+C to stop.");

        while (!pb::runtime::wait_for_shutdown(std::chrono::seconds(1)))
        {
        }

        PB_LOG_INFO("Shutdown requested; stopping RPC and janitor...");
        // In-flight RPCs drain before the janitor goes away.
        rpc.stop();
        janitor.stop();

        pb::log::print_status("Shutdown complete.");
        PB_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (ConfigError const &ex)
    {
        std::fprintf(stderr, "PutBridge configuration error: %s\n", ex.what());
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "PutBridge daemon failed: %s\n", ex.what());
        pb::log::print_status("PutBridge daemon failed: {}", ex.what());
    }
    return 1;
}

} // namespace pb::app

int main(int argc, char *argv[])
{
    return pb::app::daemon_main(argc, argv, nullptr);
}
