#include "engine/HashCodec.hpp"

#include "engine/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace pb::engine
{

std::string format_hash(std::int64_t id)
{
    return std::string(kHashPrefix) + std::to_string(id);
}

std::optional<std::int64_t> try_parse_hash(std::string_view hash)
{
    if (hash.size() <= kHashPrefix.size())
    {
        return std::nullopt;
    }
    std::string lowered(hash);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    if (!lowered.starts_with(kHashPrefix))
    {
        return std::nullopt;
    }
    std::string_view digits(lowered);
    digits.remove_prefix(kHashPrefix.size());
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch)
                     { return std::isdigit(ch) != 0; }))
    {
        return std::nullopt;
    }
    std::int64_t id = 0;
    auto [end, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), id);
    if (ec != std::errc{} || end != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    return id;
}

std::int64_t parse_hash(std::string_view hash)
{
    if (auto id = try_parse_hash(hash))
    {
        return *id;
    }
    throw ProxyError(ErrorCode::InvalidHash, std::string(hash));
}

} // namespace pb::engine
