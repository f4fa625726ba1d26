#pragma once

#include <cstdint>
#include <string>

namespace thermite {

/**
 * @brief Status codes for thermite readers and engines.
 */
enum class StatusCode {
  Success = 0,
  NotOpen,
  InvalidArgument,
  OpenFailed,
  ReadFailed,
  FileTooSmall,
  MagicMismatch,
  InvalidHeader,
  InvalidDataBlock,
  InvalidSignalName,
  SignalNotFound,
  HeaderCountFailed,
  HeadersFailed,
  DataCountFailed,
  DataFailed,
  DuplicateSignal,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 * Failures that originate at the engine boundary also carry the engine's
 * negative return code in `engineCode`.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;
  int64_t engineCode = 0;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::NotOpen:
        message = "not open";
        break;
      case StatusCode::InvalidArgument:
        message = "invalid argument";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::FileTooSmall:
        message = "file too small";
        break;
      case StatusCode::MagicMismatch:
        message = "magic mismatch";
        break;
      case StatusCode::InvalidHeader:
        message = "invalid header";
        break;
      case StatusCode::InvalidDataBlock:
        message = "invalid data block";
        break;
      case StatusCode::InvalidSignalName:
        message = "invalid signal name";
        break;
      case StatusCode::SignalNotFound:
        message = "signal not found";
        break;
      case StatusCode::HeaderCountFailed:
        message = "header count query failed";
        break;
      case StatusCode::HeadersFailed:
        message = "header query failed";
        break;
      case StatusCode::DataCountFailed:
        message = "data count query failed";
        break;
      case StatusCode::DataFailed:
        message = "data query failed";
        break;
      case StatusCode::DuplicateSignal:
        message = "duplicate signal name";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  Status(StatusCode _code, const std::string& _message, int64_t _engineCode)
      : code(_code)
      , message(_message)
      , engineCode(_engineCode) {}

  bool ok() const {
    return code == StatusCode::Success;
  }
};

}  // namespace thermite
