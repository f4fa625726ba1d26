#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace thermite {

/**
 * @brief Options for joining several signals into one AlignedTable.
 */
struct THERMITE_PUBLIC TableOptions {
  /**
   * @brief Replace each missing cell with the most recent earlier value in the
   * same column. Cells before a column's first value stay missing.
   */
  bool ffill = true;
  /**
   * @brief Shift the time axis so that the first row holding any value is at
   * zero seconds.
   */
  bool relativeTimestamp = true;

  TableOptions() = default;
  TableOptions(bool ffill, bool relativeTimestamp)
      : ffill(ffill)
      , relativeTimestamp(relativeTimestamp) {}
};

/**
 * @brief Several signals joined on a shared time axis. `time` holds the row
 * timestamps in seconds, ascending. `values[c][r]` is the value of column `c`
 * at row `r`, or std::nullopt where that signal has no sample (or a NaN sample)
 * at that time.
 */
struct THERMITE_PUBLIC AlignedTable {
  std::vector<double> time;
  std::vector<std::string> columns;
  std::vector<std::vector<std::optional<double>>> values;

  size_t rowCount() const {
    return time.size();
  }
  size_t columnCount() const {
    return columns.size();
  }
  bool empty() const {
    return time.empty();
  }
  const std::optional<double>& at(size_t row, size_t column) const {
    return values[column][row];
  }

  /**
   * @brief Returns the timestamp of the first row in which any column holds a
   * value, or std::nullopt if every cell is missing.
   */
  std::optional<double> firstValidIndex() const;
};

/**
 * @brief Outer-joins sample series into an AlignedTable. Rows are the sorted
 * union of every timestamp (in seconds) of every added column; timestamps
 * are matched by exact equality.
 */
class THERMITE_PUBLIC TableBuilder final {
public:
  /**
   * @brief Append a column. Columns keep the order in which they are added and
   *   the same name may be added more than once. A series with no samples is
   *   skipped and contributes neither a column nor rows.
   */
  void addColumn(std::string_view name, const std::vector<Sample>& samples);

  size_t columnCount() const;

  AlignedTable build(const TableOptions& options = {}) const;

private:
  struct Column {
    std::string name;
    std::vector<std::pair<double, double>> series;
  };

  std::vector<Column> columns_;
};

/**
 * @brief Writes `table` as CSV: a `time,<column>...` header row followed by one
 * line per row. Missing cells are left empty.
 */
THERMITE_PUBLIC
void WriteCsv(const AlignedTable& table, std::ostream& output);

}  // namespace thermite

#ifdef THERMITE_IMPLEMENTATION
#  include "table.inl"
#endif
