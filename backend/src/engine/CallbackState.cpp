#include "engine/CallbackState.hpp"

#include "utils/Encoding.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Json.hpp"

#include <yyjson.h>

#include <utility>

namespace pb::engine
{

namespace
{

constexpr char kStateParam[] = "x";
constexpr char kDirectoryKey[] = "d";

CallbackDecodeResult failure(ErrorCode code, std::string reason)
{
    CallbackDecodeResult result;
    result.error = code;
    result.reason = std::move(reason);
    return result;
}

} // namespace

std::string encode_callback_url(CallbackState const &state)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_strncpy(native, root, kDirectoryKey,
                               state.download_dir.data(),
                               state.download_dir.size());
    auto payload = doc.write();

    std::string url = std::string(kCallbackScheme) + "://" + kCallbackHost +
                      kCallbackPath + "?" +
                      net::encode_query({{kStateParam, payload}});
    if (!state.owner_token.empty())
    {
        url += "#";
        url += utils::fragment_escape(state.owner_token);
    }
    return url;
}

CallbackDecodeResult decode_callback_url(std::string_view url,
                                         std::string_view expected_token)
{
    auto parts = net::parse_url(url);
    if (!parts || parts->host != kCallbackHost || !parts->port.empty() ||
        parts->path != kCallbackPath)
    {
        return failure(ErrorCode::UnrecognizedCallback,
                       "unrecognized callback URL: " + std::string(url));
    }

    auto fragment = utils::percent_decode(parts->raw_fragment, false);
    if (!fragment)
    {
        return failure(ErrorCode::UnrecognizedCallback,
                       "malformed callback fragment");
    }
    if (!expected_token.empty() && *fragment != expected_token)
    {
        return failure(ErrorCode::OwnershipMismatch,
                       "transfer belongs to a different owner, fragment=" +
                           *fragment);
    }

    auto params = net::parse_query(parts->raw_query);
    if (!params)
    {
        return failure(ErrorCode::UnrecognizedCallback,
                       "malformed callback query");
    }
    std::string const *payload = nullptr;
    int matches = 0;
    for (auto const &[key, value] : *params)
    {
        if (key == kStateParam)
        {
            payload = &value;
            ++matches;
        }
    }
    if (matches != 1)
    {
        return failure(ErrorCode::UnrecognizedCallback,
                       "callback URL must carry exactly one state parameter");
    }

    auto doc = json::Document::parse(*payload);
    auto *root = doc.object_root();
    if (root == nullptr)
    {
        return failure(ErrorCode::UnrecognizedCallback,
                       "callback state is not a JSON object");
    }
    CallbackState state;
    if (auto *dir = yyjson_obj_get(root, kDirectoryKey); dir != nullptr)
    {
        if (!yyjson_is_str(dir))
        {
            return failure(ErrorCode::UnrecognizedCallback,
                           "callback download dir is not a string");
        }
        state.download_dir.assign(yyjson_get_str(dir), yyjson_get_len(dir));
    }
    state.owner_token = std::move(*fragment);

    CallbackDecodeResult result;
    result.state = std::move(state);
    return result;
}

bool is_owned(std::string_view callback_url, std::string_view expected_token)
{
    return decode_callback_url(callback_url, expected_token).ok();
}

} // namespace pb::engine
