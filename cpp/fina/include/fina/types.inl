#include "internal.hpp"

namespace fina {

std::string_view OutputTypeString(OutputType type) {
  switch (type) {
    case OutputType::Values:
      return "values";
    case OutputType::ValuesMinMax:
      return "valuesMinMax";
    case OutputType::TimeSeries:
      return "timeSeries";
    case OutputType::TimeSeriesMinMax:
      return "timeSeriesMinMax";
    case OutputType::Integrity:
      return "integrity";
    default:
      return "unknown";
  }
}

std::string_view OutputAverageString(OutputAverage average) {
  switch (average) {
    case OutputAverage::Complete:
      return "complete";
    case OutputAverage::Partial:
      return "partial";
    case OutputAverage::AsIs:
      return "as_is";
    default:
      return "unknown";
  }
}

std::string_view TimeRefString(TimeRef timeRef) {
  switch (timeRef) {
    case TimeRef::ByTime:
      return "by_time";
    case TimeRef::BySearch:
      return "by_search";
    default:
      return "unknown";
  }
}

Status ParseOutputType(std::string_view value, OutputType* output) {
  for (auto type : {OutputType::Values, OutputType::ValuesMinMax, OutputType::TimeSeries,
                    OutputType::TimeSeriesMinMax, OutputType::Integrity}) {
    if (value == OutputTypeString(type)) {
      *output = type;
      return StatusCode::Success;
    }
  }
  return Status{StatusCode::ValidationError,
                internal::StrCat("non-existent output type \"", value, "\"")};
}

Status ParseOutputAverage(std::string_view value, OutputAverage* output) {
  for (auto average : {OutputAverage::Complete, OutputAverage::Partial, OutputAverage::AsIs}) {
    if (value == OutputAverageString(average)) {
      *output = average;
      return StatusCode::Success;
    }
  }
  return Status{StatusCode::ValidationError,
                internal::StrCat("non-existent output average \"", value, "\"")};
}

Status ParseTimeRef(std::string_view value, TimeRef* output) {
  for (auto timeRef : {TimeRef::ByTime, TimeRef::BySearch}) {
    if (value == TimeRefString(timeRef)) {
      *output = timeRef;
      return StatusCode::Success;
    }
  }
  return Status{StatusCode::ValidationError,
                internal::StrCat("non-existent time reference \"", value, "\"")};
}

size_t ColumnCount(OutputType type) {
  switch (type) {
    case OutputType::Values:
      return 1;
    case OutputType::TimeSeries:
      return 2;
    case OutputType::ValuesMinMax:
    case OutputType::Integrity:
      return 3;
    case OutputType::TimeSeriesMinMax:
      return 4;
    default:
      return 0;
  }
}

std::vector<std::string> ColumnNames(OutputType type) {
  switch (type) {
    case OutputType::Values:
      return {"values"};
    case OutputType::ValuesMinMax:
      return {"min", "values", "max"};
    case OutputType::TimeSeries:
      return {"time", "values"};
    case OutputType::TimeSeriesMinMax:
      return {"time", "min", "values", "max"};
    case OutputType::Integrity:
      return {"time", "nb_finite", "nb_total"};
    default:
      return {};
  }
}

// FileMeta ////////////////////////////////////////////////////////////////////

uint64_t FileMeta::nbDays() const {
  if (endTime <= startTime) {
    return 0;
  }
  return uint64_t(internal::CeilDiv(endTime - startTime, SecondsPerDay));
}

Status FileMeta::validate() const {
  if (startTime > 0 && startTime >= endTime) {
    const auto msg = internal::StrCat("start time ", startTime, " is not before end time ",
                                      endTime, " (", npoints, " points)");
    return Status{StatusCode::Corrupt, msg};
  }
  return StatusCode::Success;
}

bool FileMeta::operator==(const FileMeta& other) const {
  return interval == other.interval && startTime == other.startTime &&
         endTime == other.endTime && npoints == other.npoints && size == other.size;
}

// SearchQuery /////////////////////////////////////////////////////////////////

Status SearchQuery::validate() const {
  if (startTime < 0 || timeWindow < 0 || timeInterval < 0) {
    const auto msg = internal::StrCat("start time, window and interval must be non-negative, got ",
                                      startTime, ", ", timeWindow, ", ", timeInterval);
    return Status{StatusCode::ValidationError, msg};
  }
  if (startTime > MaxTimestamp || timeWindow > MaxTimestamp - startTime) {
    const auto msg =
      internal::StrCat("query window [", startTime, ", +", timeWindow, "] exceeds ", MaxTimestamp);
    return Status{StatusCode::ValidationError, msg};
  }
  if (ColumnCount(outputType) == 0) {
    return Status{StatusCode::ValidationError, "non-existent output type"};
  }
  if (OutputAverageString(outputAverage) == "unknown") {
    return Status{StatusCode::ValidationError, "non-existent output average"};
  }
  if (TimeRefString(timeRefStart) == "unknown") {
    return Status{StatusCode::ValidationError, "non-existent time reference"};
  }
  if (minValue && maxValue && *minValue >= *maxValue) {
    const auto msg =
      internal::StrCat("min value ", *minValue, " must be less than max value ", *maxValue);
    return Status{StatusCode::ValidationError, msg};
  }
  if (nDecimals && (*nDecimals < 0 || *nDecimals > 15)) {
    const auto msg = internal::StrCat("number of decimals must be within 0..15, got ", *nDecimals);
    return Status{StatusCode::ValidationError, msg};
  }
  return StatusCode::Success;
}

// ReaderOptions ///////////////////////////////////////////////////////////////

Status ReaderOptions::validate() const {
  if (maxDataSize == 0 || maxMetaSize == 0) {
    return Status{StatusCode::ValidationError, "file size limits must be positive"};
  }
  if (maxMetaSize < MetaHeaderSize + MetaRecordSize) {
    const auto msg = internal::StrCat("meta size limit ", maxMetaSize, " is below ",
                                      MetaHeaderSize + MetaRecordSize, " bytes");
    return Status{StatusCode::ValidationError, msg};
  }
  if (defaultChunkSize == 0 || chunkSizeLimit == 0) {
    return Status{StatusCode::ValidationError, "chunk sizes must be positive"};
  }
  if (defaultChunkSize > chunkSizeLimit) {
    const auto msg = internal::StrCat("default chunk size ", defaultChunkSize,
                                      " exceeds chunk size limit ", chunkSizeLimit);
    return Status{StatusCode::ValidationError, msg};
  }
  return StatusCode::Success;
}

}  // namespace fina
