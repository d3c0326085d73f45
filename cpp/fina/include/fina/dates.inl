#include "internal.hpp"
#include <ctime>

namespace fina {

namespace internal {

inline Status DateParseError(std::string_view value, std::string_view format) {
  return Status{StatusCode::ValidationError,
                StrCat("Error parsing date '", value, "' with the format '", format, "'")};
}

}  // namespace internal

Status ParseUtcDate(std::string_view value, std::string_view format, Timestamp* output) {
  // strptime() needs null-terminated input
  const std::string valueStr(value);
  const std::string formatStr(format);

  std::tm tm{};
  const char* end = ::strptime(valueStr.c_str(), formatStr.c_str(), &tm);
  if (end == nullptr || *end != '\0') {
    return internal::DateParseError(value, format);
  }
  const std::time_t time = ::timegm(&tm);
  if (time < 0) {
    return internal::DateParseError(value, format);
  }
  *output = Timestamp(time);
  return StatusCode::Success;
}

Status FormatUtcDate(Timestamp timestamp, std::string_view format, std::string* output) {
  const auto time = std::time_t(timestamp);
  std::tm tm{};
  if (::gmtime_r(&time, &tm) == nullptr) {
    const auto msg = internal::StrCat("cannot convert timestamp ", timestamp, " to a UTC date");
    return Status{StatusCode::ValidationError, msg};
  }

  const std::string formatStr(format);
  char buffer[256];
  const size_t length = std::strftime(buffer, sizeof(buffer), formatStr.c_str(), &tm);
  if (length == 0 && !formatStr.empty()) {
    const auto msg = internal::StrCat("cannot format timestamp ", timestamp, " with the format '",
                                      format, "'");
    return Status{StatusCode::ValidationError, msg};
  }
  output->assign(buffer, length);
  return StatusCode::Success;
}

Status WindowByDates(std::string_view startDate, std::string_view endDate, std::string_view format,
                     Timestamp* startTime, Timestamp* timeWindow) {
  Timestamp start = 0;
  Timestamp end = 0;
  if (auto status = ParseUtcDate(startDate, format, &start); !status.ok()) {
    return status;
  }
  if (auto status = ParseUtcDate(endDate, format, &end); !status.ok()) {
    return status;
  }
  if (start >= end) {
    const auto msg = internal::StrCat("the start date '", startDate,
                                      "' must be earlier than the end date '", endDate, "'");
    return Status{StatusCode::ValidationError, msg};
  }
  *startTime = start;
  *timeWindow = end - start;
  return StatusCode::Success;
}

Status DatesIntervalFromTimestamp(Timestamp startTime, Timestamp timeWindow,
                                  std::string_view format, std::string* startDate,
                                  std::string* endDate) {
  if (startTime < 0 || timeWindow < 0) {
    const auto msg = internal::StrCat("start ", startTime, " and window ", timeWindow,
                                      " must be non-negative");
    return Status{StatusCode::ValidationError, msg};
  }
  if (auto status = FormatUtcDate(startTime, format, startDate); !status.ok()) {
    return status;
  }
  return FormatUtcDate(startTime + timeWindow, format, endDate);
}

Timestamp StartOfDay(Timestamp timestamp) {
  return timestamp - internal::FloorMod(timestamp, SecondsPerDay);
}

}  // namespace fina
