#pragma once

#include "engine.hpp"
#include "signal_cache.hpp"
#include "table.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace thermite {

enum struct NameDecoding {
  /**
   * @brief Keep header names byte-for-byte. Names that are not valid UTF-8 are
   * reported through the problem callback but do not fail `open()`.
   */
  Lenient,
  /**
   * @brief Fail `open()` with StatusCode::InvalidSignalName if any header name
   * is not valid UTF-8.
   */
  Strict,
};

/**
 * @brief Options for opening a thermite file.
 */
struct THERMITE_PUBLIC ThermiteReaderOptions {
  NameDecoding nameDecoding = NameDecoding::Lenient;
  /**
   * @brief Called for problems that do not prevent the file from being read,
   * such as duplicate header names or undecodable names in lenient mode.
   */
  ProblemCallback onProblem;
};

/**
 * @brief Provides a read interface to a thermite file. The header catalog is
 * loaded once by `open()`; signals are fetched from the engine on first
 * access and served from a per-reader cache afterwards.
 *
 * A reader is not safe to use from several threads at once.
 */
class THERMITE_PUBLIC ThermiteReader final {
public:
  /**
   * @brief Creates a reader backed by its own FileEngine.
   */
  ThermiteReader();
  /**
   * @brief Creates a reader backed by `engine`, which must outlive the reader.
   */
  explicit ThermiteReader(IEngine& engine);
  ~ThermiteReader();

  ThermiteReader(const ThermiteReader&) = delete;
  ThermiteReader& operator=(const ThermiteReader&) = delete;
  ThermiteReader(ThermiteReader&&) = delete;
  ThermiteReader& operator=(ThermiteReader&&) = delete;

  /**
   * @brief Opens a thermite file and loads its header catalog.
   *
   * @param path Path of the thermite file.
   * @param options Name decoding and problem reporting options.
   * @return Status StatusCode::Success on success. If a non-success Status is
   *   returned, the reader is left closed with an empty catalog and every
   *   query returns StatusCode::NotOpen until `open()` succeeds.
   */
  Status open(std::string_view path, const ThermiteReaderOptions& options = {});

  /**
   * @brief Closes the file, dropping the header catalog and the signal cache.
   */
  void close();

  bool isOpen() const;

  /**
   * @brief Path passed to the last successful `open()`, or empty if closed.
   */
  const std::string& path() const;

  /**
   * @brief Returns the header catalog in file order.
   */
  const std::vector<HeaderEntry>& headers() const;

  /**
   * @brief Returns the signal names in file order. Duplicate names are kept.
   */
  std::vector<std::string> signalNames() const;

  /**
   * @brief Returns true if `name` appears in the header catalog.
   */
  bool contains(std::string_view name) const;

  /**
   * @brief Reads a signal by name. The first read of a name queries the engine
   * and stores the result; later reads return the stored Signal until
   * `clearCache()` is called. A name missing from the header catalog yields a
   * Signal with `known == false` and no samples, without querying the engine.
   *
   * @param name Signal name.
   * @param output Set to the signal on success.
   * @return Status StatusCode::DataCountFailed or StatusCode::DataFailed if the
   *   engine fails on a known signal. Failures are not cached.
   */
  Status readSignal(std::string_view name, SignalPtr* output);

  /**
   * @brief Joins the named signals into one table. Each name becomes a column,
   * in the given order; names with no samples are skipped. An empty table is
   * returned when no requested signal has samples.
   */
  Status buildTable(const std::vector<std::string>& names, const TableOptions& options,
                    AlignedTable* output);

  /**
   * @brief Discards every cached signal. The next read of any name queries the
   * engine again.
   */
  void clearCache();

  size_t cachedSignalCount() const;

  // The following static methods are used internally to query an engine and
  // do not need to be called directly unless you are bypassing the cache.

  static Status LoadHeaders(IEngine& engine, std::string_view path,
                            const ThermiteReaderOptions& options,
                            std::vector<HeaderEntry>* output);
  static Status LoadSignal(IEngine& engine, std::string_view path, std::string_view name,
                           std::vector<Sample>* output);

private:
  std::unique_ptr<FileEngine> fileEngine_;
  IEngine* engine_ = nullptr;
  std::string path_;
  std::vector<HeaderEntry> headers_;
  std::unordered_set<std::string> names_;
  SignalCache cache_;
  bool open_ = false;

  void reset_();
};

}  // namespace thermite

#ifdef THERMITE_IMPLEMENTATION
#  include "reader.inl"
#endif
