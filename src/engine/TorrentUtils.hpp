#pragma once

#include <libtorrent/sha1_hash.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sw::engine {

constexpr int kSha1Bytes = static_cast<int>(libtorrent::sha1_hash::size());
// qBittorrent reports hybrid and v2-only torrents by their truncated v2 hash,
// but older clients may hand out the full SHA-256 digest.
constexpr std::size_t kSha256HexLength = 64;

inline int hex_digit_value(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

inline std::optional<libtorrent::sha1_hash> sha1_from_hex(std::string_view value) {
  constexpr auto expected = kSha1Bytes * 2;
  if (value.size() != expected) {
    return std::nullopt;
  }
  libtorrent::sha1_hash result;
  for (int i = 0; i < kSha1Bytes; ++i) {
    int high = hex_digit_value(value[2 * i]);
    int low = hex_digit_value(value[2 * i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    result[i] = static_cast<std::uint8_t>((high << 4) | low);
  }
  return result;
}

inline std::string sha1_to_hex(libtorrent::sha1_hash const &hash) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(kSha1Bytes * 2);
  for (int i = 0; i < kSha1Bytes; ++i) {
    auto byte = static_cast<unsigned char>(hash[i]);
    result.push_back(kHexDigits[byte >> 4]);
    result.push_back(kHexDigits[byte & 0x0F]);
  }
  return result;
}

inline bool hash_is_nonzero(libtorrent::sha1_hash const &hash) {
  auto const *bytes = reinterpret_cast<unsigned char const *>(hash.data());
  for (int i = 0; i < kSha1Bytes; ++i) {
    if (bytes[i] != 0) {
      return true;
    }
  }
  return false;
}

// Normalized (lower-case) torrent id, or nullopt when the value is not a
// non-zero SHA-1 or a SHA-256 hex digest.
inline std::optional<std::string> normalize_torrent_id(std::string_view value) {
  if (value.size() == kSha256HexLength) {
    std::string result;
    result.reserve(value.size());
    for (char ch : value) {
      int digit = hex_digit_value(ch);
      if (digit < 0) {
        return std::nullopt;
      }
      result.push_back("0123456789abcdef"[digit]);
    }
    return result;
  }
  auto hash = sha1_from_hex(value);
  if (!hash || !hash_is_nonzero(*hash)) {
    return std::nullopt;
  }
  return sha1_to_hex(*hash);
}

// "30d 5h", "2h 15m", "0m". Minutes are only shown below one day.
inline std::string format_duration(std::chrono::seconds value) {
  auto total = value.count() < 0 ? 0 : value.count();
  auto days = total / 86400;
  auto hours = (total % 86400) / 3600;
  auto minutes = (total % 3600) / 60;
  std::string result;
  auto append = [&result](long long amount, char unit) {
    if (!result.empty()) {
      result.push_back(' ');
    }
    result += std::to_string(amount);
    result.push_back(unit);
  };
  if (days > 0) {
    append(days, 'd');
  }
  if (hours > 0) {
    append(hours, 'h');
  }
  if (minutes > 0 && days == 0) {
    append(minutes, 'm');
  }
  return result.empty() ? std::string("0m") : result;
}

} // namespace sw::engine
