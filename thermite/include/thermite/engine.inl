#include "internal.hpp"
#include <algorithm>
#include <cassert>
#include <memory>

namespace thermite {

namespace internal {

struct FileCloser {
  void operator()(std::FILE* file) const {
    std::fclose(file);
  }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

Status OpenFile(std::string_view path, FilePtr* output) {
  const std::string filename{path};
  output->reset(std::fopen(filename.c_str(), "rb"));
  if (!*output) {
    const auto msg = StrCat("failed to open \"", path, "\"");
    return Status{StatusCode::OpenFailed, msg};
  }
  return StatusCode::Success;
}

}  // namespace internal

// FileReader //////////////////////////////////////////////////////////////////

FileReader::FileReader(std::FILE* file)
    : file_(file)
    , size_(0)
    , position_(0) {
  assert(file_);

  // Determine the size of the file
  std::fseek(file_, 0, SEEK_END);
  const long end = std::ftell(file_);
  size_ = end > 0 ? uint64_t(end) : 0;
  std::fseek(file_, 0, SEEK_SET);
}

uint64_t FileReader::size() const {
  return size_;
}

uint64_t FileReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= size_) {
    return 0;
  }

  if (offset != position_) {
    if (std::fseek(file_, (long)(offset), SEEK_SET) != 0) {
      return 0;
    }
    position_ = offset;
  }

  if (size > buffer_.size()) {
    buffer_.resize(size);
  }

  const uint64_t bytesRead = uint64_t(std::fread(buffer_.data(), 1, size, file_));
  *output = buffer_.data();

  position_ += bytesRead;
  return bytesRead;
}

// BufferReader ////////////////////////////////////////////////////////////////

BufferReader::BufferReader(const std::byte* data, uint64_t size)
    : data_(data)
    , size_(size) {}

uint64_t BufferReader::size() const {
  return size_;
}

uint64_t BufferReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (!data_ || offset >= size_) {
    return 0;
  }

  const auto available = size_ - offset;
  *output = const_cast<std::byte*>(data_) + offset;
  return std::min(size, available);
}

// FileEngine //////////////////////////////////////////////////////////////////

FileEngine::FileEngine(ProblemCallback onProblem)
    : onProblem_(std::move(onProblem)) {}

int64_t FileEngine::headerCount(std::string_view path) {
  internal::FilePtr file;
  if (auto status = internal::OpenFile(path, &file); !status.ok()) {
    return fail_(status);
  }
  FileReader reader{file.get()};

  uint64_t count = 0;
  if (auto status = ReadFileHeader(reader, &count); !status.ok()) {
    return fail_(status);
  }
  return int64_t(count);
}

int64_t FileEngine::headers(std::string_view path, RawHeader* output, uint64_t count) {
  if (!output && count > 0) {
    return fail_(Status{StatusCode::InvalidArgument, "null header buffer"});
  }
  internal::FilePtr file;
  if (auto status = internal::OpenFile(path, &file); !status.ok()) {
    return fail_(status);
  }
  FileReader reader{file.get()};

  uint64_t available = 0;
  if (auto status = ReadFileHeader(reader, &available); !status.ok()) {
    return fail_(status);
  }
  const uint64_t populate = std::min(count, available);
  if (auto status = ReadHeaders(reader, populate, output); !status.ok()) {
    return fail_(status);
  }
  return int64_t(populate);
}

int64_t FileEngine::dataCount(std::string_view path, std::string_view name) {
  internal::FilePtr file;
  if (auto status = internal::OpenFile(path, &file); !status.ok()) {
    return fail_(status);
  }
  FileReader reader{file.get()};

  ByteOffset startOffset = 0;
  if (auto status = FindSignal(reader, name, &startOffset); !status.ok()) {
    return fail_(status);
  }
  uint64_t sampleCount = 0;
  if (auto status = ReadBlockCount(reader, startOffset, &sampleCount); !status.ok()) {
    return fail_(status);
  }
  return int64_t(sampleCount);
}

int64_t FileEngine::data(std::string_view path, std::string_view name, RawSample* output,
                         uint64_t count) {
  if (!output && count > 0) {
    return fail_(Status{StatusCode::InvalidArgument, "null sample buffer"});
  }
  internal::FilePtr file;
  if (auto status = internal::OpenFile(path, &file); !status.ok()) {
    return fail_(status);
  }
  FileReader reader{file.get()};

  ByteOffset startOffset = 0;
  if (auto status = FindSignal(reader, name, &startOffset); !status.ok()) {
    return fail_(status);
  }
  uint64_t sampleCount = 0;
  if (auto status = ReadBlockCount(reader, startOffset, &sampleCount); !status.ok()) {
    return fail_(status);
  }
  const uint64_t populate = std::min(count, sampleCount);
  if (auto status = ReadBlock(reader, startOffset, populate, output); !status.ok()) {
    return fail_(status);
  }
  return int64_t(populate);
}

Status FileEngine::ReadFileHeader(IReadable& reader, uint64_t* headerCount) {
  const uint64_t fileSize = reader.size();
  if (fileSize < internal::FileHeaderLength) {
    const auto msg = internal::StrCat("file is ", fileSize, " bytes, expected at least ",
                                      internal::FileHeaderLength);
    return Status{StatusCode::FileTooSmall, msg};
  }

  std::byte* data = nullptr;
  const uint64_t bytesRead = reader.read(&data, 0, internal::FileHeaderLength);
  if (bytesRead != internal::FileHeaderLength) {
    return StatusCode::ReadFailed;
  }

  if (std::memcmp(data, Magic, sizeof(Magic)) != 0) {
    const auto msg = internal::StrCat("invalid magic bytes: 0x", internal::MagicToHex(data));
    return Status{StatusCode::MagicMismatch, msg};
  }

  const uint64_t count = internal::ParseUint64(data + sizeof(Magic));
  const uint64_t maxCount = (fileSize - internal::FileHeaderLength) / internal::HeaderRecordLength;
  if (count > maxCount) {
    const auto msg = internal::StrCat("header count ", count, " exceeds the ", maxCount,
                                      " header records that fit in ", fileSize, " bytes");
    return Status{StatusCode::InvalidHeader, msg};
  }

  *headerCount = count;
  return StatusCode::Success;
}

Status FileEngine::ReadHeaders(IReadable& reader, uint64_t count, RawHeader* output) {
  if (count == 0) {
    return StatusCode::Success;
  }

  const uint64_t fileSize = reader.size();
  if (fileSize < internal::FileHeaderLength ||
      (fileSize - internal::FileHeaderLength) / internal::HeaderRecordLength < count) {
    const auto msg =
      internal::StrCat("cannot read ", count, " header records from ", fileSize, " bytes");
    return Status{StatusCode::InvalidHeader, msg};
  }

  const uint64_t length = count * internal::HeaderRecordLength;
  std::byte* data = nullptr;
  const uint64_t bytesRead = reader.read(&data, internal::FileHeaderLength, length);
  if (bytesRead != length) {
    const auto msg = internal::StrCat("attempted to read ", length,
                                      " bytes of header records but only read ", bytesRead,
                                      " bytes");
    return Status{StatusCode::ReadFailed, msg};
  }

  for (uint64_t i = 0; i < count; ++i) {
    const std::byte* record = data + i * internal::HeaderRecordLength;
    std::memcpy(output[i].name, record, HeaderNameLength);
    output[i].start = internal::ParseUint64(record + HeaderNameLength);
  }
  return StatusCode::Success;
}

Status FileEngine::FindSignal(IReadable& reader, std::string_view name, ByteOffset* startOffset) {
  uint64_t count = 0;
  if (auto status = ReadFileHeader(reader, &count); !status.ok()) {
    return status;
  }
  std::vector<RawHeader> headers(count);
  if (auto status = ReadHeaders(reader, count, headers.data()); !status.ok()) {
    return status;
  }

  const auto it = std::find_if(headers.begin(), headers.end(), [&](const RawHeader& header) {
    return internal::HeaderName(header.name) == name;
  });
  if (it == headers.end()) {
    const auto msg = internal::StrCat("no header named \"", name, "\"");
    return Status{StatusCode::SignalNotFound, msg};
  }
  *startOffset = it->start;
  return StatusCode::Success;
}

Status FileEngine::ReadBlockCount(IReadable& reader, ByteOffset startOffset,
                                  uint64_t* sampleCount) {
  const uint64_t fileSize = reader.size();
  if (startOffset > fileSize || fileSize - startOffset < internal::BlockHeaderLength) {
    const auto msg = internal::StrCat("data block at offset ", startOffset,
                                      " does not fit in ", fileSize, " bytes");
    return Status{StatusCode::InvalidDataBlock, msg};
  }

  std::byte* data = nullptr;
  const uint64_t bytesRead = reader.read(&data, startOffset, internal::BlockHeaderLength);
  if (bytesRead != internal::BlockHeaderLength) {
    const auto msg = internal::StrCat("failed to read data block count at offset ", startOffset);
    return Status{StatusCode::ReadFailed, msg};
  }

  const uint64_t count = internal::ParseUint64(data);
  const uint64_t maxCount =
    (fileSize - startOffset - internal::BlockHeaderLength) / internal::SampleRecordLength;
  if (count > maxCount) {
    const auto msg = internal::StrCat("data block at offset ", startOffset, " has ", count,
                                      " samples but only ", maxCount, " fit in the file");
    return Status{StatusCode::InvalidDataBlock, msg};
  }

  *sampleCount = count;
  return StatusCode::Success;
}

Status FileEngine::ReadBlock(IReadable& reader, ByteOffset startOffset, uint64_t count,
                             RawSample* output) {
  if (count == 0) {
    return StatusCode::Success;
  }

  const uint64_t fileSize = reader.size();
  if (startOffset > fileSize || fileSize - startOffset < internal::BlockHeaderLength ||
      (fileSize - startOffset - internal::BlockHeaderLength) / internal::SampleRecordLength <
        count) {
    const auto msg = internal::StrCat("cannot read ", count, " samples from data block at offset ",
                                      startOffset);
    return Status{StatusCode::InvalidDataBlock, msg};
  }

  const uint64_t length = count * internal::SampleRecordLength;
  std::byte* data = nullptr;
  const uint64_t bytesRead =
    reader.read(&data, startOffset + internal::BlockHeaderLength, length);
  if (bytesRead != length) {
    const auto msg = internal::StrCat("attempted to read ", length, " bytes of samples at offset ",
                                      startOffset, " but only read ", bytesRead, " bytes");
    return Status{StatusCode::ReadFailed, msg};
  }

  for (uint64_t i = 0; i < count; ++i) {
    const std::byte* record = data + i * internal::SampleRecordLength;
    output[i].timestamp = internal::ParseInt64(record);
    output[i].value = internal::ParseDouble(record + 8);
  }
  return StatusCode::Success;
}

int64_t FileEngine::ToEngineCode(const Status& status) {
  switch (status.code) {
    case StatusCode::OpenFailed:
      return int64_t(EngineCode::OpenFailed);
    case StatusCode::MagicMismatch:
      return int64_t(EngineCode::MagicMismatch);
    case StatusCode::FileTooSmall:
    case StatusCode::InvalidHeader:
      return int64_t(EngineCode::InvalidHeader);
    case StatusCode::InvalidDataBlock:
      return int64_t(EngineCode::InvalidDataBlock);
    case StatusCode::SignalNotFound:
      return int64_t(EngineCode::SignalNotFound);
    case StatusCode::InvalidArgument:
      return int64_t(EngineCode::InvalidArgument);
    case StatusCode::ReadFailed:
    default:
      return int64_t(EngineCode::ReadFailed);
  }
}

int64_t FileEngine::fail_(const Status& status) {
  if (onProblem_) {
    onProblem_(status);
  }
  return ToEngineCode(status);
}

}  // namespace thermite
