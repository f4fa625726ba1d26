#include "internal.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>

namespace thermite {

namespace internal {

inline std::string CsvField(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }
  std::string quoted = "\"";
  for (const char c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

}  // namespace internal

std::optional<double> AlignedTable::firstValidIndex() const {
  for (size_t row = 0; row < rowCount(); ++row) {
    for (const auto& column : values) {
      if (column[row].has_value()) {
        return time[row];
      }
    }
  }
  return std::nullopt;
}

void TableBuilder::addColumn(std::string_view name, const std::vector<Sample>& samples) {
  if (samples.empty()) {
    return;
  }
  Column column;
  column.name = std::string(name);
  column.series.reserve(samples.size());
  for (const auto& sample : samples) {
    column.series.emplace_back(double(sample.timestamp) / MicrosecondsPerSecond, sample.value);
  }
  columns_.push_back(std::move(column));
}

size_t TableBuilder::columnCount() const {
  return columns_.size();
}

AlignedTable TableBuilder::build(const TableOptions& options) const {
  AlignedTable table;

  // Row axis: sorted union of every column's timestamps
  for (const auto& column : columns_) {
    for (const auto& point : column.series) {
      table.time.push_back(point.first);
    }
  }
  std::sort(table.time.begin(), table.time.end());
  table.time.erase(std::unique(table.time.begin(), table.time.end()), table.time.end());
  if (table.time.empty()) {
    return table;
  }

  const size_t rows = table.time.size();
  table.columns.reserve(columns_.size());
  table.values.reserve(columns_.size());
  for (const auto& column : columns_) {
    std::vector<std::optional<double>> cells(rows);
    // Samples sharing a timestamp land in one row; the later sample wins. NaN
    // values are missing cells.
    for (const auto& [time, value] : column.series) {
      const auto row = std::lower_bound(table.time.begin(), table.time.end(), time);
      auto& cell = cells[size_t(row - table.time.begin())];
      if (std::isnan(value)) {
        cell.reset();
      } else {
        cell = value;
      }
    }
    table.columns.push_back(column.name);
    table.values.push_back(std::move(cells));
  }

  if (options.relativeTimestamp) {
    if (const auto origin = table.firstValidIndex()) {
      for (auto& time : table.time) {
        time -= *origin;
      }
    }
  }

  if (options.ffill) {
    for (auto& cells : table.values) {
      std::optional<double> last;
      for (auto& cell : cells) {
        if (cell.has_value()) {
          last = cell;
        } else {
          cell = last;
        }
      }
    }
  }

  return table;
}

void WriteCsv(const AlignedTable& table, std::ostream& output) {
  const auto precision = output.precision(std::numeric_limits<double>::max_digits10);

  output << "time";
  for (const auto& name : table.columns) {
    output << ',' << internal::CsvField(name);
  }
  output << '\n';

  for (size_t row = 0; row < table.rowCount(); ++row) {
    output << table.time[row];
    for (size_t column = 0; column < table.columnCount(); ++column) {
      output << ',';
      if (const auto& cell = table.at(row, column)) {
        output << *cell;
      }
    }
    output << '\n';
  }

  output.precision(precision);
}

}  // namespace thermite
