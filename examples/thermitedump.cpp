#define THERMITE_IMPLEMENTATION
#include <thermite/thermite.hpp>

#include <fmt/core.h>

#include <iostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

template <typename... T>
[[nodiscard]] inline std::string StrFormat(fmt::format_string<T...> msg, T&&... args) {
  return fmt::format(msg, std::forward<T>(args)...);
}

std::string ToString(size_t index, const thermite::HeaderEntry& header, size_t sampleCount) {
  return StrFormat("[Header {}] name={}, start_offset={}, samples={}", index, header.name,
                   header.startOffset, sampleCount);
}

std::string DuplicateToString(size_t index, const thermite::HeaderEntry& header,
                              size_t firstIndex) {
  return StrFormat("[Header {}] name={}, start_offset={}, duplicate of header {}", index,
                   header.name, header.startOffset, firstIndex);
}

std::string ToString(const thermite::Signal& signal) {
  if (signal.empty()) {
    return StrFormat("[Signal] name={}, samples=0", signal.name);
  }
  return StrFormat("[Signal] name={}, samples={}, first_timestamp={}, last_timestamp={}",
                   signal.name, signal.size(), signal.samples.front().timestamp,
                   signal.samples.back().timestamp);
}

int DumpHeaders(thermite::ThermiteReader& reader) {
  std::cout << StrFormat("{}: {} signals\n", reader.path(), reader.headers().size());

  int result = 0;
  const auto& headers = reader.headers();
  std::unordered_map<std::string, size_t> firstIndex;
  for (size_t i = 0; i < headers.size(); ++i) {
    // Lookups by name resolve to the first header, so later ones have no
    // readable samples of their own
    const auto [first, inserted] = firstIndex.emplace(headers[i].name, i);
    if (!inserted) {
      std::cout << DuplicateToString(i, headers[i], first->second) << "\n";
      continue;
    }
    thermite::SignalPtr signal;
    const auto status = reader.readSignal(headers[i].name, &signal);
    if (!status.ok()) {
      std::cerr << "! " << status.message << "\n";
      result = 1;
      continue;
    }
    std::cout << ToString(i, headers[i], signal->size()) << "\n";
  }
  return result;
}

int DumpTable(thermite::ThermiteReader& reader, const std::vector<std::string>& names,
              const thermite::TableOptions& options) {
  for (const auto& name : names) {
    if (!reader.contains(name)) {
      std::cerr << StrFormat("! no signal named \"{}\" in {}\n", name, reader.path());
    }
  }

  thermite::AlignedTable table;
  const auto status = reader.buildTable(names, options, &table);
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  for (const auto& name : table.columns) {
    thermite::SignalPtr signal;
    if (reader.readSignal(name, &signal).ok()) {
      std::cerr << ToString(*signal) << "\n";
    }
  }
  thermite::WriteCsv(table, std::cout);
  return 0;
}

int main(int argc, char* argv[]) {
  std::string inputFile;
  std::vector<std::string> names;
  thermite::TableOptions tableOptions;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--no-ffill") {
      tableOptions.ffill = false;
    } else if (arg == "--absolute-time") {
      tableOptions.relativeTimestamp = false;
    } else if (inputFile.empty()) {
      inputFile = arg;
    } else {
      names.emplace_back(arg);
    }
  }

  if (inputFile.empty()) {
    std::cerr << "Usage: " << argv[0]
              << " [--no-ffill] [--absolute-time] <input.thermite> [signal...]\n";
    return 1;
  }

  thermite::ThermiteReaderOptions readerOptions;
  readerOptions.onProblem = [](const thermite::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  };

  thermite::ThermiteReader reader;
  const auto status = reader.open(inputFile, readerOptions);
  if (!status.ok()) {
    std::cerr << "Failed to open " << inputFile << " for reading: " << status.message << "\n";
    return 1;
  }

  const int result = names.empty() ? DumpHeaders(reader) : DumpTable(reader, names, tableOptions);
  reader.close();
  return result;
}
