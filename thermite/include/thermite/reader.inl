#include "internal.hpp"
#include <algorithm>

namespace thermite {

// ThermiteReader //////////////////////////////////////////////////////////////

ThermiteReader::ThermiteReader()
    : fileEngine_(std::make_unique<FileEngine>())
    , engine_(fileEngine_.get()) {}

ThermiteReader::ThermiteReader(IEngine& engine)
    : engine_(&engine) {}

ThermiteReader::~ThermiteReader() {
  close();
}

Status ThermiteReader::open(std::string_view path, const ThermiteReaderOptions& options) {
  reset_();

  std::vector<HeaderEntry> headers;
  if (auto status = LoadHeaders(*engine_, path, options, &headers); !status.ok()) {
    return status;
  }

  std::unordered_set<std::string> names;
  for (const auto& header : headers) {
    if (!names.insert(header.name).second && options.onProblem) {
      const auto msg = internal::StrCat("signal \"", header.name, "\" appears more than once in \"",
                                        path, "\"; reads resolve to the first occurrence");
      options.onProblem(Status{StatusCode::DuplicateSignal, msg});
    }
  }

  path_ = std::string(path);
  headers_ = std::move(headers);
  names_ = std::move(names);
  open_ = true;
  return StatusCode::Success;
}

void ThermiteReader::close() {
  reset_();
}

void ThermiteReader::reset_() {
  path_.clear();
  headers_.clear();
  names_.clear();
  cache_.clear();
  open_ = false;
}

bool ThermiteReader::isOpen() const {
  return open_;
}

const std::string& ThermiteReader::path() const {
  return path_;
}

const std::vector<HeaderEntry>& ThermiteReader::headers() const {
  return headers_;
}

std::vector<std::string> ThermiteReader::signalNames() const {
  std::vector<std::string> names;
  names.reserve(headers_.size());
  for (const auto& header : headers_) {
    names.push_back(header.name);
  }
  return names;
}

bool ThermiteReader::contains(std::string_view name) const {
  return names_.find(std::string(name)) != names_.end();
}

Status ThermiteReader::readSignal(std::string_view name, SignalPtr* output) {
  if (!open_) {
    return StatusCode::NotOpen;
  }

  if (auto cached = cache_.find(name)) {
    *output = std::move(cached);
    return StatusCode::Success;
  }

  auto signal = std::make_shared<Signal>();
  signal->name = std::string(name);
  if (contains(name)) {
    signal->known = true;
    if (auto status = LoadSignal(*engine_, path_, name, &signal->samples); !status.ok()) {
      return status;
    }
  }

  cache_.insert(name, signal);
  *output = std::move(signal);
  return StatusCode::Success;
}

Status ThermiteReader::buildTable(const std::vector<std::string>& names,
                                  const TableOptions& options, AlignedTable* output) {
  if (!open_) {
    return StatusCode::NotOpen;
  }

  TableBuilder builder;
  for (const auto& name : names) {
    SignalPtr signal;
    if (auto status = readSignal(name, &signal); !status.ok()) {
      return status;
    }
    builder.addColumn(name, signal->samples);
  }

  *output = builder.build(options);
  return StatusCode::Success;
}

void ThermiteReader::clearCache() {
  cache_.clear();
}

size_t ThermiteReader::cachedSignalCount() const {
  return cache_.size();
}

Status ThermiteReader::LoadHeaders(IEngine& engine, std::string_view path,
                                   const ThermiteReaderOptions& options,
                                   std::vector<HeaderEntry>* output) {
  const int64_t count = engine.headerCount(path);
  if (count < 0) {
    const auto msg = internal::StrCat("failed to count headers in \"", path,
                                      "\": ", EngineCodeString(count));
    return Status{StatusCode::HeaderCountFailed, msg, count};
  }

  std::vector<RawHeader> buffer(static_cast<size_t>(count));
  const int64_t populated = engine.headers(path, buffer.data(), uint64_t(count));
  if (populated < 0) {
    const auto msg = internal::StrCat("failed to read ", count, " headers from \"", path,
                                      "\": ", EngineCodeString(populated));
    return Status{StatusCode::HeadersFailed, msg, populated};
  }
  buffer.resize(std::min(buffer.size(), size_t(populated)));

  output->clear();
  output->reserve(buffer.size());
  for (size_t i = 0; i < buffer.size(); ++i) {
    const auto name = internal::HeaderName(buffer[i].name);
    if (!internal::IsValidUtf8(name)) {
      const auto msg = internal::StrCat("header ", i, " in \"", path,
                                        "\" has a name that is not valid UTF-8");
      if (options.nameDecoding == NameDecoding::Strict) {
        return Status{StatusCode::InvalidSignalName, msg};
      }
      if (options.onProblem) {
        options.onProblem(Status{StatusCode::InvalidSignalName, msg});
      }
    }
    output->emplace_back(name, buffer[i].start);
  }
  return StatusCode::Success;
}

Status ThermiteReader::LoadSignal(IEngine& engine, std::string_view path, std::string_view name,
                                  std::vector<Sample>* output) {
  const int64_t count = engine.dataCount(path, name);
  if (count < 0) {
    const auto msg = internal::StrCat("failed to count samples of \"", name, "\" in \"", path,
                                      "\": ", EngineCodeString(count));
    return Status{StatusCode::DataCountFailed, msg, count};
  }

  std::vector<RawSample> buffer(static_cast<size_t>(count));
  const int64_t populated = engine.data(path, name, buffer.data(), uint64_t(count));
  if (populated < 0) {
    const auto msg = internal::StrCat("failed to read ", count, " samples of \"", name,
                                      "\" from \"", path, "\": ", EngineCodeString(populated));
    return Status{StatusCode::DataFailed, msg, populated};
  }
  buffer.resize(std::min(buffer.size(), size_t(populated)));

  output->clear();
  output->reserve(buffer.size());
  for (const auto& raw : buffer) {
    output->push_back(Sample{raw.timestamp, raw.value});
  }
  return StatusCode::Success;
}

}  // namespace thermite
