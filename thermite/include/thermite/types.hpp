#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace thermite {

/**
 * @brief Microseconds since the Unix epoch.
 */
using Timestamp = int64_t;
using ByteOffset = uint64_t;
using ProblemCallback = std::function<void(const Status&)>;

constexpr char FormatVersion = '0';
constexpr uint8_t Magic[] = {137, 84, 72, 82, 77, FormatVersion, 13, 10};  // "\x89THRM0\r\n"
constexpr size_t HeaderNameLength = 48;
constexpr double MicrosecondsPerSecond = 1e6;

/**
 * @brief Negative return codes reported across the engine boundary. Engine
 * operations return a non-negative count on success and one of these codes on
 * failure.
 */
enum struct EngineCode : int64_t {
  OpenFailed = -1,
  ReadFailed = -2,
  MagicMismatch = -3,
  InvalidHeader = -4,
  InvalidDataBlock = -5,
  SignalNotFound = -6,
  InvalidArgument = -7,
};

/**
 * @brief Get the string representation of an engine return code.
 */
THERMITE_PUBLIC
std::string_view EngineCodeString(int64_t code);

/**
 * @brief Fixed-size header record exchanged with an engine. `name` is
 * NUL-padded; if all 48 bytes are used there is no terminator.
 */
struct THERMITE_PUBLIC RawHeader {
  char name[HeaderNameLength];
  uint64_t start;
};

/**
 * @brief Fixed-size sample record exchanged with an engine.
 */
struct THERMITE_PUBLIC RawSample {
  int64_t timestamp;
  double value;
};

static_assert(sizeof(RawHeader) == HeaderNameLength + 8, "RawHeader must be 56 bytes");
static_assert(sizeof(RawSample) == 16, "RawSample must be 16 bytes");
static_assert(std::numeric_limits<double>::is_iec559, "double must be IEEE-754 binary64");

/**
 * @brief An entry of the header catalog: a signal name and the byte offset of
 * its data block. The offset is only meaningful to the engine.
 */
struct THERMITE_PUBLIC HeaderEntry {
  std::string name;
  ByteOffset startOffset;

  HeaderEntry() = default;
  HeaderEntry(std::string_view name, ByteOffset startOffset)
      : name(name)
      , startOffset(startOffset) {}
};

/**
 * @brief A single (timestamp, value) observation.
 */
struct THERMITE_PUBLIC Sample {
  Timestamp timestamp;
  double value;

  bool operator==(const Sample& other) const {
    return timestamp == other.timestamp && value == other.value;
  }
  bool operator!=(const Sample& other) const {
    return !(*this == other);
  }
};

/**
 * @brief The result of reading a signal by name. A signal that is present in
 * the header catalog has `known == true` and carries its samples in file
 * order, which may be empty if the data block is empty. A name absent from
 * the catalog yields `known == false` and no samples.
 */
struct THERMITE_PUBLIC Signal {
  std::string name;
  bool known = false;
  std::vector<Sample> samples;

  bool empty() const {
    return samples.empty();
  }
  size_t size() const {
    return samples.size();
  }
};

using SignalPtr = std::shared_ptr<const Signal>;

}  // namespace thermite

#ifdef THERMITE_IMPLEMENTATION
#  include "types.inl"
#endif
