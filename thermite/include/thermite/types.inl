#include "internal.hpp"

namespace thermite {

std::string_view EngineCodeString(int64_t code) {
  switch (EngineCode(code)) {
    case EngineCode::OpenFailed:
      return "open failed";
    case EngineCode::ReadFailed:
      return "read failed";
    case EngineCode::MagicMismatch:
      return "magic mismatch";
    case EngineCode::InvalidHeader:
      return "invalid header";
    case EngineCode::InvalidDataBlock:
      return "invalid data block";
    case EngineCode::SignalNotFound:
      return "signal not found";
    case EngineCode::InvalidArgument:
      return "invalid argument";
    default:
      return code >= 0 ? "ok" : "unknown";
  }
}

}  // namespace thermite
