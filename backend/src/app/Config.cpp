#include "app/Config.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <yyjson.h>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <string>

namespace pb::app
{

namespace
{

yyjson_val *section(yyjson_val *root, char const *key)
{
    auto *value = yyjson_obj_get(root, key);
    if (value == nullptr || yyjson_is_null(value))
    {
        return nullptr;
    }
    if (!yyjson_is_obj(value))
    {
        throw ConfigError(std::format("{} must be an object", key));
    }
    return value;
}

std::string string_field(yyjson_val *object, char const *section_name,
                         char const *key, std::string fallback = {})
{
    auto *value = object ? yyjson_obj_get(object, key) : nullptr;
    if (value == nullptr || yyjson_is_null(value))
    {
        return fallback;
    }
    if (!yyjson_is_str(value))
    {
        throw ConfigError(
            std::format("{}.{} must be a string", section_name, key));
    }
    return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

std::int64_t int_field(yyjson_val *object, char const *section_name,
                       char const *key, std::int64_t fallback)
{
    auto *value = object ? yyjson_obj_get(object, key) : nullptr;
    if (value == nullptr || yyjson_is_null(value))
    {
        return fallback;
    }
    auto parsed = pb::json::int_member(object, key);
    if (!parsed)
    {
        throw ConfigError(
            std::format("{}.{} must be a number", section_name, key));
    }
    return *parsed;
}

std::optional<ArrConfig> arr_section(yyjson_val *root, char const *key)
{
    auto *object = section(root, key);
    if (object == nullptr)
    {
        return std::nullopt;
    }
    ArrConfig arr;
    arr.url = string_field(object, key, "url");
    arr.api_key = string_field(object, key, "api_key");
    return arr;
}

bool parse_flag(std::string const &value)
{
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // namespace

std::filesystem::path default_config_path()
{
    if (auto home = process_env("HOME"); home && !home->empty())
    {
        return std::filesystem::path(*home) / ".config" / "putbridge" /
               "config.json";
    }
    return std::filesystem::path("config.json");
}

Config parse_config(std::string_view json)
{
    auto doc = pb::json::Document::parse(json);
    if (!doc.is_valid())
    {
        throw ConfigError("configuration is not valid JSON");
    }
    auto *root = doc.object_root();
    if (root == nullptr)
    {
        throw ConfigError("configuration root must be an object");
    }

    Config config;
    auto *transmission = section(root, "transmission");
    config.transmission.username =
        string_field(transmission, "transmission", "username");
    config.transmission.password =
        string_field(transmission, "transmission", "password");
    config.transmission.download_dir =
        string_field(transmission, "transmission", "download_dir");

    auto *putio = section(root, "putio");
    config.putio.oauth_token = string_field(putio, "putio", "oauth_token");
    config.putio.parent_dir_id = int_field(putio, "putio", "parent_dir_id", 0);
    config.putio.janitor_interval = std::chrono::seconds(
        int_field(putio, "putio", "janitor_interval", 0));
    config.putio.friend_token = string_field(putio, "putio", "friend_token");
    config.putio.api_url =
        string_field(putio, "putio", "api_url", config.putio.api_url);

    config.radarr = arr_section(root, "radarr");
    config.sonarr = arr_section(root, "sonarr");

    auto *server = section(root, "server");
    config.server.bind =
        string_field(server, "server", "bind", config.server.bind);
    auto workers = int_field(server, "server", "workers",
                             static_cast<std::int64_t>(config.server.workers));
    if (workers < 1)
    {
        throw ConfigError("server.workers must be at least 1");
    }
    config.server.workers = static_cast<std::size_t>(workers);

    if (auto verbose = pb::json::bool_member(root, "verbose"))
    {
        config.verbose = *verbose;
    }
    if (auto log_file = pb::json::string_member(root, "log_file");
        log_file && !log_file->empty())
    {
        config.log_file = *log_file;
    }
    if (auto ca_file = pb::json::string_member(root, "ca_file"))
    {
        config.ca_file = *ca_file;
    }
    return config;
}

Config read_config_file(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        throw ConfigError(
            std::format("unable to open config file {}", path.string()));
    }
    std::string content((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    try
    {
        return parse_config(content);
    }
    catch (ConfigError const &ex)
    {
        throw ConfigError(std::format("{}: {}", path.string(), ex.what()));
    }
}

std::optional<std::string> process_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

void apply_env_overrides(Config &config, EnvReader const &read_env)
{
    if (auto value = read_env("PB_RPC_BIND"); value && !value->empty())
    {
        config.server.bind = *value;
    }
    if (auto value = read_env("PB_PUTIO_TOKEN"); value && !value->empty())
    {
        config.putio.oauth_token = *value;
    }
    if (auto value = read_env("PB_FRIEND_TOKEN"))
    {
        config.putio.friend_token = *value;
    }
    if (auto value = read_env("PB_VERBOSE"))
    {
        config.verbose = parse_flag(*value);
    }
    if (auto value = read_env("PB_LOG_FILE"))
    {
        config.log_file = *value;
    }
    if (auto value = read_env("PB_CA_FILE"))
    {
        config.ca_file = *value;
    }
}

void validate_config(Config const &config)
{
    if (config.transmission.username.empty())
    {
        throw ConfigError("transmission username is required");
    }
    if (config.transmission.password.empty())
    {
        throw ConfigError("transmission password is required");
    }
    if (config.transmission.download_dir.empty())
    {
        throw ConfigError("transmission download_dir is required");
    }
    if (config.putio.oauth_token.empty())
    {
        throw ConfigError("putio oauth_token is required");
    }
    if (!config.radarr && !config.sonarr)
    {
        throw ConfigError(
            "either radarr or sonarr configuration is required");
    }
    auto check_arr = [](std::optional<ArrConfig> const &arr, char const *name)
    {
        if (!arr)
        {
            return;
        }
        if (arr->url.empty())
        {
            throw ConfigError(std::format("{} url is required", name));
        }
        if (arr->api_key.empty())
        {
            throw ConfigError(std::format("{} api_key is required", name));
        }
    };
    check_arr(config.radarr, "radarr");
    check_arr(config.sonarr, "sonarr");

    if (config.ca_file.empty())
    {
        auto is_https = [](std::string const &url)
        { return url.starts_with("https://"); };
        bool needs_ca = is_https(config.putio.api_url) ||
                        (config.radarr && is_https(config.radarr->url)) ||
                        (config.sonarr && is_https(config.sonarr->url));
        if (needs_ca)
        {
            throw ConfigError("ca_file is required for https endpoints");
        }
    }
}

net::HttpClientOptions http_client_options(Config const &config)
{
    net::HttpClientOptions options;
    options.ca_file = config.ca_file;
    return options;
}

Config load_config(std::filesystem::path const &path,
                   EnvReader const &read_env)
{
    auto config = read_config_file(path);
    apply_env_overrides(config, read_env);
    validate_config(config);
    PB_LOG_DEBUG("configuration loaded from {}", path.string());
    return config;
}

} // namespace pb::app
