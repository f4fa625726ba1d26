#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <string>
#include <string_view>
#include <unordered_map>

namespace thermite {

/**
 * @brief Memoizes decoded signals by name for a single reader. Entries are
 * only ever removed all at once by `clear()`; the cache assumes the
 * underlying file does not change while it is in use.
 */
class THERMITE_PUBLIC SignalCache final {
public:
  /**
   * @brief Look up a previously stored signal.
   *
   * @return SignalPtr The stored signal, or nullptr if `name` has not been
   *   stored since the last `clear()`.
   */
  SignalPtr find(std::string_view name) const {
    const auto it = signals_.find(std::string(name));
    return it != signals_.end() ? it->second : nullptr;
  }

  /**
   * @brief Store `signal` under `name`, replacing any previous entry.
   */
  void insert(std::string_view name, SignalPtr signal) {
    signals_[std::string(name)] = std::move(signal);
  }

  void clear() {
    signals_.clear();
  }

  size_t size() const {
    return signals_.size();
  }

private:
  std::unordered_map<std::string, SignalPtr> signals_;
};

}  // namespace thermite
