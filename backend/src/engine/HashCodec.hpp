#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pb::engine
{

inline constexpr std::string_view kHashPrefix = "putarr;";

// Transmission clients address torrents by hash string; transfers are
// addressed as "putarr;<remote id>".
std::string format_hash(std::int64_t id);

// Case-insensitive; nullopt when the prefix is missing or the remainder is
// not a plain non-negative decimal that fits in 64 bits.
std::optional<std::int64_t> try_parse_hash(std::string_view hash);

// Same as try_parse_hash but throws ProxyError(InvalidHash).
std::int64_t parse_hash(std::string_view hash);

} // namespace pb::engine
