// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::base64 -- blob encoding on the wire.
//
// Blob columns are returned as standard-alphabet, padded base64
// (RFC 4648 section 4).

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlgw {
namespace base64 {

inline std::string Encode(const uint8_t* data, size_t len) {
  static const char kChars[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string result;
  result.reserve(4 * ((len + 2) / 3));

  for (size_t i = 0; i < len; i += 3) {
    uint32_t n = static_cast<uint32_t>(data[i]) << 16;
    if (i + 1 < len) { n |= static_cast<uint32_t>(data[i + 1]) << 8; }
    if (i + 2 < len) { n |= static_cast<uint32_t>(data[i + 2]); }

    result += kChars[(n >> 18) & 0x3F];
    result += kChars[(n >> 12) & 0x3F];
    result += (i + 1 < len) ? kChars[(n >> 6) & 0x3F] : '=';
    result += (i + 2 < len) ? kChars[n & 0x3F] : '=';
  }
  return result;
}

inline std::string Encode(const std::vector<uint8_t>& data) {
  return Encode(data.data(), data.size());
}

}  // namespace base64
}  // namespace sqlgw
