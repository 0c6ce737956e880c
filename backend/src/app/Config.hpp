#pragma once

#include "net/HttpClient.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pb::app
{

class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct TransmissionConfig
{
    std::string username;
    std::string password;
    // Directory reported to Transmission clients.
    std::string download_dir;
};

struct PutioConfig
{
    std::string oauth_token;
    std::int64_t parent_dir_id = 0;
    std::chrono::seconds janitor_interval{0};
    // Tells apart instances sharing one account; empty claims every transfer
    // this software created.
    std::string friend_token;
    std::string api_url = "https://api.put.io";
};

struct ArrConfig
{
    std::string url;
    std::string api_key;
};

struct ServerConfig
{
    std::string bind = "http://0.0.0.0:9091";
    std::size_t workers = 4;
};

struct Config
{
    TransmissionConfig transmission;
    PutioConfig putio;
    std::optional<ArrConfig> radarr;
    std::optional<ArrConfig> sonarr;
    ServerConfig server;
    bool verbose = false;
    std::optional<std::string> log_file;
    // PEM bundle for verifying https peers.
    std::string ca_file = "/etc/ssl/certs/ca-certificates.crt";
};

using EnvReader = std::function<std::optional<std::string>(char const *)>;

std::filesystem::path default_config_path();

// Parses the JSON document without validating it.
Config parse_config(std::string_view json);
Config read_config_file(std::filesystem::path const &path);

// PB_RPC_BIND, PB_PUTIO_TOKEN, PB_FRIEND_TOKEN, PB_VERBOSE, PB_LOG_FILE,
// PB_CA_FILE.
void apply_env_overrides(Config &config, EnvReader const &read_env);
std::optional<std::string> process_env(char const *key);

// Throws ConfigError naming the first missing field.
void validate_config(Config const &config);

net::HttpClientOptions http_client_options(Config const &config);

// read + env overrides + validation.
Config load_config(std::filesystem::path const &path,
                   EnvReader const &read_env = process_env);

} // namespace pb::app
