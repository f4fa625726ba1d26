#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <string_view>
#include <vector>

namespace thermite {

/**
 * @brief An abstract interface for reading thermite data.
 */
struct THERMITE_PUBLIC IReadable {
  virtual ~IReadable() = default;

  /**
   * @brief Returns the size of the file in bytes.
   *
   * @return uint64_t The total number of bytes in the thermite file.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief This method is called by the engine when it needs to read a portion
   * of the file.
   *
   * @param output A pointer to a pointer to the buffer to write to. This method
   *   is expected to either maintain an internal buffer, read data into it, and
   *   update this pointer to point at the internal buffer, or update this
   *   pointer to point directly at the source data if possible. The pointer and
   *   data must remain valid and unmodified until the next call to read().
   * @param offset The offset in bytes from the beginning of the file to read.
   * @param size The number of bytes to read.
   * @return uint64_t Number of bytes actually read. This may be less than the
   *   requested size if the end of the file is reached. If the read fails, this
   *   method should return 0.
   */
  virtual uint64_t read(std::byte** output, uint64_t offset, uint64_t size) = 0;
};

/**
 * @brief IReadable implementation wrapping a FILE* pointer created by fopen()
 * and a read buffer.
 */
class THERMITE_PUBLIC FileReader final : public IReadable {
public:
  FileReader(std::FILE* file);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  std::FILE* file_;
  std::vector<std::byte> buffer_;
  uint64_t size_;
  uint64_t position_;
};

/**
 * @brief IReadable implementation over a caller-owned block of memory. No
 * internal buffers are allocated.
 */
class THERMITE_PUBLIC BufferReader final : public IReadable {
public:
  BufferReader(const std::byte* data, uint64_t size);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  const std::byte* data_;
  uint64_t size_;
};

/**
 * @brief The engine boundary. Each operation takes the path of a thermite
 * file and returns a non-negative count on success or a negative
 * `EngineCode` on failure. Implementations may parse the file directly
 * (`FileEngine`) or forward to an existing native engine.
 */
struct THERMITE_PUBLIC IEngine {
  virtual ~IEngine() = default;

  /**
   * @brief Returns the number of header records in the file.
   */
  virtual int64_t headerCount(std::string_view path) = 0;
  /**
   * @brief Populates up to `count` header records, in file order.
   *
   * @return int64_t The number of records written to `output`.
   */
  virtual int64_t headers(std::string_view path, RawHeader* output, uint64_t count) = 0;
  /**
   * @brief Returns the number of samples stored for the named signal.
   */
  virtual int64_t dataCount(std::string_view path, std::string_view name) = 0;
  /**
   * @brief Populates up to `count` samples of the named signal, in file order.
   *
   * @return int64_t The number of samples written to `output`.
   */
  virtual int64_t data(std::string_view path, std::string_view name, RawSample* output,
                       uint64_t count) = 0;
};

/**
 * @brief Engine that decodes thermite files directly. Every call opens the
 * file, reads what it needs and closes it again, so a FileEngine holds no
 * per-file state. Data queries resolve a name to the first header record
 * carrying that name.
 */
class THERMITE_PUBLIC FileEngine final : public IEngine {
public:
  FileEngine() = default;
  /**
   * @param onProblem Receives a Status describing each failure (with offsets
   *   and sizes) before the corresponding negative code is returned.
   */
  explicit FileEngine(ProblemCallback onProblem);

  int64_t headerCount(std::string_view path) override;
  int64_t headers(std::string_view path, RawHeader* output, uint64_t count) override;
  int64_t dataCount(std::string_view path, std::string_view name) override;
  int64_t data(std::string_view path, std::string_view name, RawSample* output,
               uint64_t count) override;

  // The following static methods are used internally for parsing thermite
  // files and do not need to be called directly unless you are reading from
  // a custom IReadable.

  static Status ReadFileHeader(IReadable& reader, uint64_t* headerCount);
  static Status ReadHeaders(IReadable& reader, uint64_t count, RawHeader* output);
  static Status FindSignal(IReadable& reader, std::string_view name, ByteOffset* startOffset);
  static Status ReadBlockCount(IReadable& reader, ByteOffset startOffset, uint64_t* sampleCount);
  static Status ReadBlock(IReadable& reader, ByteOffset startOffset, uint64_t count,
                          RawSample* output);

  /**
   * @brief Maps a failure Status to the negative code reported across the
   * engine boundary.
   */
  static int64_t ToEngineCode(const Status& status);

private:
  ProblemCallback onProblem_;

  int64_t fail_(const Status& status);
};

}  // namespace thermite

#ifdef THERMITE_IMPLEMENTATION
#  include "engine.inl"
#endif
