#pragma once

#include "utils/Encoding.hpp"

#include <libtorrent/bdecode.hpp>
#include <libtorrent/bencode.hpp>
#include <libtorrent/entry.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/hasher.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/span.hpp>

#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pb::engine {

constexpr int kSha1Bytes = static_cast<int>(libtorrent::sha1_hash::size());

struct TorrentFileSummary {
  libtorrent::sha1_hash info_hash;
  std::string name;
  std::optional<std::int64_t> length;
  std::string announce;
};

inline std::string info_hash_to_base32(libtorrent::sha1_hash const &hash) {
  auto const *bytes = reinterpret_cast<std::uint8_t const *>(hash.data());
  return utils::encode_base32(
      std::span<std::uint8_t const>(bytes, static_cast<std::size_t>(kSha1Bytes)));
}

// Decodes a .torrent file and hashes its re-encoded info dictionary.
// Returns nullopt when the bytes are not bencoded or lack an info dict.
inline std::optional<TorrentFileSummary>
summarize_torrent_file(std::span<std::uint8_t const> bytes) {
  libtorrent::error_code ec;
  auto const *data = reinterpret_cast<char const *>(bytes.data());
  libtorrent::bdecode_node root = libtorrent::bdecode(
      libtorrent::span<char const>(data, static_cast<std::ptrdiff_t>(bytes.size())),
      ec);
  if (ec || root.type() != libtorrent::bdecode_node::dict_t) {
    return std::nullopt;
  }
  libtorrent::bdecode_node info = root.dict_find_dict("info");
  if (!info) {
    return std::nullopt;
  }

  libtorrent::entry info_entry;
  info_entry = info;
  std::vector<char> encoded;
  libtorrent::bencode(std::back_inserter(encoded), info_entry);

  TorrentFileSummary summary;
  summary.info_hash =
      libtorrent::hasher(libtorrent::span<char const>(
                             encoded.data(), static_cast<std::ptrdiff_t>(encoded.size())))
          .final();
  summary.name = std::string(info.dict_find_string_value("name"));
  if (auto length = info.dict_find_int("length")) {
    summary.length = length.int_value();
  }
  summary.announce = std::string(root.dict_find_string_value("announce"));
  return summary;
}

// magnet:?xt=urn:btih:<BASE32>, then dn/xl/tr when the file carries them.
inline std::string build_magnet_uri(TorrentFileSummary const &summary) {
  std::string magnet = "magnet:?xt=urn:btih:" + info_hash_to_base32(summary.info_hash);
  if (!summary.name.empty()) {
    magnet += "&dn=" + utils::query_escape(summary.name);
  }
  if (summary.length) {
    magnet += "&xl=" + std::to_string(*summary.length);
  }
  if (!summary.announce.empty()) {
    magnet += "&tr=" + utils::query_escape(summary.announce);
  }
  return magnet;
}

} // namespace pb::engine
