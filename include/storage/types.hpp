#ifndef WTTP_STORAGE_TYPES_HPP
#define WTTP_STORAGE_TYPES_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wttp {

using Bytes = std::vector<std::byte>;

/// Authenticated caller or publisher. The empty identity is "nobody".
using Identity = std::string;

/// Unit of account tracked by the royalty ledger.
using Amount = uint64_t;

/// Seconds since the Unix epoch.
using Timestamp = uint64_t;

inline Bytes toBytes(std::string_view str) {
  Bytes bytes(str.size());
  std::transform(str.begin(), str.end(), bytes.begin(),
                 [](char c) { return static_cast<std::byte>(c); });
  return bytes;
}

inline std::string bytesToString(const Bytes &bytes) {
  std::string str(bytes.size(), '\0');
  std::transform(bytes.begin(), bytes.end(), str.begin(),
                 [](std::byte b) { return static_cast<char>(b); });
  return str;
}

} // namespace wttp

#endif // WTTP_STORAGE_TYPES_HPP
