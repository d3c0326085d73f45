#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <string>
#include <string_view>

namespace fina {

/**
 * @brief Parses `value` as a UTC calendar date using a strftime-style `format`.
 *
 * @return Status StatusCode::ValidationError if `value` does not fully match `format`.
 */
FINA_PUBLIC
Status ParseUtcDate(std::string_view value, std::string_view format, Timestamp* output);

/**
 * @brief Formats `timestamp` as a UTC calendar date.
 */
FINA_PUBLIC
Status FormatUtcDate(Timestamp timestamp, std::string_view format, std::string* output);

/**
 * @brief Converts a date range into a query start time and window length in seconds.
 *
 * @return Status StatusCode::ValidationError if either date fails to parse or `startDate` is not
 *   earlier than `endDate`.
 */
FINA_PUBLIC
Status WindowByDates(std::string_view startDate, std::string_view endDate, std::string_view format,
                     Timestamp* startTime, Timestamp* timeWindow);

/**
 * @brief Formats the bounds of the window `[startTime, startTime + timeWindow]`.
 */
FINA_PUBLIC
Status DatesIntervalFromTimestamp(Timestamp startTime, Timestamp timeWindow,
                                  std::string_view format, std::string* startDate,
                                  std::string* endDate);

/**
 * @brief Returns midnight UTC of the day holding `timestamp`.
 */
FINA_PUBLIC
Timestamp StartOfDay(Timestamp timestamp);

}  // namespace fina

#ifdef FINA_IMPLEMENTATION
#  include "dates.inl"
#endif
