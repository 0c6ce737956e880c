#pragma once

#include "utils/Encoding.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pb::net
{

struct HostPort
{
    std::string host;
    std::string port;
};

inline HostPort parse_host_port(std::string_view input)
{
    HostPort result;
    if (input.empty())
    {
        return result;
    }
    if (input.front() == '[')
    {
        auto closing = input.find(']');
        if (closing == std::string_view::npos)
        {
            result.host = std::string(input);
            return result;
        }
        result.host = std::string(input.substr(1, closing - 1));
        if (closing + 1 < input.size() && input[closing + 1] == ':')
        {
            result.port = std::string(input.substr(closing + 2));
        }
        return result;
    }
    auto colon = input.find_last_of(':');
    if (colon == std::string_view::npos)
    {
        result.host = std::string(input);
        return result;
    }
    result.host = std::string(input.substr(0, colon));
    result.port = std::string(input.substr(colon + 1));
    return result;
}

// Components of an absolute URL. The query and fragment are kept raw;
// callers decode what they need.
struct UrlParts
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string raw_query;
    std::string raw_fragment;
};

inline std::optional<UrlParts> parse_url(std::string_view url)
{
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0)
    {
        return std::nullopt;
    }
    UrlParts parts;
    parts.scheme = std::string(url.substr(0, scheme_end));
    auto rest = url.substr(scheme_end + 3);

    if (auto hash = rest.find('#'); hash != std::string_view::npos)
    {
        parts.raw_fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (auto question = rest.find('?'); question != std::string_view::npos)
    {
        parts.raw_query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }
    auto slash = rest.find('/');
    auto authority =
        slash == std::string_view::npos ? rest : rest.substr(0, slash);
    if (slash != std::string_view::npos)
    {
        parts.path = std::string(rest.substr(slash));
    }
    if (auto at = authority.find('@'); at != std::string_view::npos)
    {
        authority = authority.substr(at + 1);
    }
    auto host_port = parse_host_port(authority);
    parts.host = std::move(host_port.host);
    parts.port = std::move(host_port.port);
    return parts;
}

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Splits an application/x-www-form-urlencoded string. Returns nullopt when
// any escape sequence is malformed.
inline std::optional<QueryParams> parse_query(std::string_view raw)
{
    QueryParams params;
    while (!raw.empty())
    {
        auto amp = raw.find('&');
        auto pair = raw.substr(0, amp);
        raw = amp == std::string_view::npos ? std::string_view{}
                                            : raw.substr(amp + 1);
        if (pair.empty())
        {
            continue;
        }
        auto eq = pair.find('=');
        auto key = pair.substr(0, eq);
        auto value = eq == std::string_view::npos ? std::string_view{}
                                                  : pair.substr(eq + 1);
        auto decoded_key = utils::percent_decode(key, true);
        auto decoded_value = utils::percent_decode(value, true);
        if (!decoded_key || !decoded_value)
        {
            return std::nullopt;
        }
        params.emplace_back(std::move(*decoded_key), std::move(*decoded_value));
    }
    return params;
}

inline std::string encode_query(QueryParams const &params)
{
    std::string out;
    for (auto const &[key, value] : params)
    {
        if (!out.empty())
        {
            out.push_back('&');
        }
        out += utils::query_escape(key);
        out.push_back('=');
        out += utils::query_escape(value);
    }
    return out;
}

} // namespace pb::net
