#pragma once

#include "types.hpp"
#include <cstring>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace thermite {

namespace internal {

constexpr uint64_t FileHeaderLength = /* magic bytes */ sizeof(Magic) +
                                      /* header count */ 8;
constexpr uint64_t HeaderRecordLength = /* name */ HeaderNameLength +
                                        /* start offset */ 8;
constexpr uint64_t BlockHeaderLength = /* sample count */ 8;
constexpr uint64_t SampleRecordLength = /* timestamp */ 8 +
                                        /* value */ 8;

inline std::string ToHex(uint8_t byte) {
  std::string result{2, '\0'};
  result[0] = "0123456789ABCDEF"[(uint8_t(byte) >> 4) & 0x0F];
  result[1] = "0123456789ABCDEF"[uint8_t(byte) & 0x0F];
  return result;
}
inline std::string ToHex(std::byte byte) {
  return ToHex(uint8_t(byte));
}

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using thermite::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

inline uint64_t ParseUint64(const std::byte* data) {
  return uint64_t(data[0]) | (uint64_t(data[1]) << 8) | (uint64_t(data[2]) << 16) |
         (uint64_t(data[3]) << 24) | (uint64_t(data[4]) << 32) | (uint64_t(data[5]) << 40) |
         (uint64_t(data[6]) << 48) | (uint64_t(data[7]) << 56);
}

inline int64_t ParseInt64(const std::byte* data) {
  return int64_t(ParseUint64(data));
}

inline double ParseDouble(const std::byte* data) {
  const uint64_t bits = ParseUint64(data);
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

/**
 * @brief Returns the name stored in a fixed-width header name field: the bytes
 * before the first NUL, or the whole field if it has no terminator.
 */
inline std::string_view HeaderName(const char* field) {
  const void* terminator = std::memchr(field, '\0', HeaderNameLength);
  const size_t length = terminator ? size_t(static_cast<const char*>(terminator) - field)
                                   : HeaderNameLength;
  return std::string_view{field, length};
}

inline bool IsValidUtf8(std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    const uint8_t lead = uint8_t(text[i]);
    size_t continuation;
    uint32_t codepoint;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      continuation = 1;
      codepoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      continuation = 2;
      codepoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      continuation = 3;
      codepoint = lead & 0x07;
    } else {
      return false;
    }
    if (continuation >= text.size() - i) {
      return false;
    }
    for (size_t j = 1; j <= continuation; ++j) {
      const uint8_t next = uint8_t(text[i + j]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      codepoint = (codepoint << 6) | (next & 0x3F);
    }
    // Reject overlong encodings, surrogates and values past U+10FFFF
    if ((continuation == 1 && codepoint < 0x80) || (continuation == 2 && codepoint < 0x800) ||
        (continuation == 3 && codepoint < 0x10000) || (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
        codepoint > 0x10FFFF) {
      return false;
    }
    i += continuation + 1;
  }
  return true;
}

inline std::string MagicToHex(const std::byte* data) {
  return internal::ToHex(data[0]) + internal::ToHex(data[1]) + internal::ToHex(data[2]) +
         internal::ToHex(data[3]) + internal::ToHex(data[4]) + internal::ToHex(data[5]) +
         internal::ToHex(data[6]) + internal::ToHex(data[7]);
}

}  // namespace internal

}  // namespace thermite
