#pragma once

#include <string>

namespace fina {

/**
 * @brief Status codes for PHPFina meta readers, planners and chunk readers.
 */
enum class StatusCode {
  Success = 0,
  ValidationError,
  NotFound,
  Corrupt,
  SizeLimit,
  PathSecurity,
  Arithmetic,
  OpenFailed,
  ReadFailed,
  MapFailed,
  StuckRead,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::ValidationError:
        message = "invalid parameter";
        break;
      case StatusCode::NotFound:
        message = "file not found";
        break;
      case StatusCode::Corrupt:
        message = "corrupt file";
        break;
      case StatusCode::SizeLimit:
        message = "file exceeds size limit";
        break;
      case StatusCode::PathSecurity:
        message = "path outside of data directory";
        break;
      case StatusCode::Arithmetic:
        message = "division by zero interval";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::MapFailed:
        message = "memory mapping failed";
        break;
      case StatusCode::StuckRead:
        message = "read position did not advance";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  bool ok() const {
    return code == StatusCode::Success;
  }
};

}  // namespace fina
