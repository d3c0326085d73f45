#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fina {

#define FINA_LIBRARY_VERSION "0.1.0"

using Timestamp = int64_t;
using PointIndex = int64_t;
using OutputRow = std::vector<double>;
using ProblemCallback = std::function<void(const Status&)>;

constexpr char LibraryVersion[] = FINA_LIBRARY_VERSION;
constexpr uint64_t PointSize = 4;
constexpr uint64_t MetaHeaderSize = 8;
constexpr uint64_t MetaRecordSize = 8;
constexpr uint64_t DefaultMaxDataSize = 100 * 1024 * 1024;
constexpr uint64_t DefaultMaxMetaSize = 1024;
constexpr uint64_t DefaultChunkSize = 1024;
constexpr uint64_t ChunkSizeLimit = 4096;
constexpr Timestamp MaxTimestamp = 2147480000;
constexpr Timestamp SecondsPerDay = 86400;
constexpr char MetaExtension[] = ".meta";
constexpr char DataExtension[] = ".dat";
constexpr char DefaultDateFormat[] = "%Y-%m-%d %H:%M:%S";
constexpr int DefaultDecimals = 3;

/**
 * @brief Shape of each output row.
 */
enum struct OutputType {
  /// [mean]
  Values,
  /// [min, mean, max]
  ValuesMinMax,
  /// [time, mean]
  TimeSeries,
  /// [time, min, mean, max]
  TimeSeriesMinMax,
  /// [time, finite count, total count]
  Integrity,
};

/**
 * @brief Selects which output buckets are kept when down-sampling.
 */
enum struct OutputAverage {
  /**
   * @brief Only buckets fully covered by the file and the query window are emitted. The read
   * start is moved forward to the first whole bucket.
   */
  Complete,
  /**
   * @brief Like Complete, but the read start is not realigned and the bucket holding the last
   * recorded point is emitted even when the file ends inside it.
   */
  Partial,
  /**
   * @brief Raw blocks of `blockSize` points are emitted in file order, preceded by empty rows for
   * the part of the query window that lies before the file start.
   */
  AsIs,
};

/**
 * @brief Anchor of the output bucket grid.
 */
enum struct TimeRef {
  /// Bucket boundaries land on multiples of the output interval since the epoch.
  ByTime,
  /// Bucket boundaries are anchored on the query start time.
  BySearch,
};

FINA_PUBLIC
std::string_view OutputTypeString(OutputType type);
FINA_PUBLIC
std::string_view OutputAverageString(OutputAverage average);
FINA_PUBLIC
std::string_view TimeRefString(TimeRef timeRef);

FINA_PUBLIC
Status ParseOutputType(std::string_view value, OutputType* output);
FINA_PUBLIC
Status ParseOutputAverage(std::string_view value, OutputAverage* output);
FINA_PUBLIC
Status ParseTimeRef(std::string_view value, TimeRef* output);

/**
 * @brief Number of numeric columns in a row of the given output type.
 */
FINA_PUBLIC
size_t ColumnCount(OutputType type);

/**
 * @brief Column labels for a row of the given output type.
 */
FINA_PUBLIC
std::vector<std::string> ColumnNames(OutputType type);

/**
 * @brief Derived description of one PHPFina feed. It is read fresh for every query, since the
 * data file may have grown since the previous one.
 */
struct FINA_PUBLIC FileMeta {
  /**
   * @brief Seconds between two consecutive points.
   */
  Timestamp interval = 0;
  /**
   * @brief Epoch seconds of point 0, or 0 for a feed that never received data.
   */
  Timestamp startTime = 0;
  /**
   * @brief Epoch seconds of the last point, or 0 when `startTime` is 0.
   */
  Timestamp endTime = 0;
  uint64_t npoints = 0;
  /**
   * @brief Size of the data file in bytes.
   */
  uint64_t size = 0;

  Timestamp pointTime(PointIndex position) const {
    return startTime + position * interval;
  }

  /**
   * @brief Number of calendar days spanned, rounded up.
   */
  uint64_t nbDays() const;

  /**
   * @brief Returns StatusCode::Corrupt if `startTime` is set but not strictly before `endTime`.
   */
  Status validate() const;

  bool operator==(const FileMeta& other) const;
  bool operator!=(const FileMeta& other) const {
    return !(*this == other);
  }
};

/**
 * @brief Caller-supplied description of the window to read and the output to produce.
 */
struct FINA_PUBLIC SearchQuery {
  /**
   * @brief Epoch seconds of the start of the requested window.
   */
  Timestamp startTime = 0;
  /**
   * @brief Length of the requested window in seconds. 0 reads to the end of the file.
   */
  Timestamp timeWindow = 0;
  /**
   * @brief Output sampling period in seconds. 0 uses the source interval. Other values are
   * rounded up to a multiple of the source interval.
   */
  Timestamp timeInterval = 0;
  OutputType outputType = OutputType::TimeSeries;
  OutputAverage outputAverage = OutputAverage::Complete;
  TimeRef timeRefStart = TimeRef::ByTime;
  /**
   * @brief Aggregated values below `minValue` or above `maxValue` are replaced by NaN.
   */
  std::optional<double> minValue;
  std::optional<double> maxValue;
  /**
   * @brief If set, aggregated values are rounded to this many decimals. Reset to disable rounding.
   */
  std::optional<int> nDecimals = DefaultDecimals;

  SearchQuery() = default;
  SearchQuery(Timestamp start, Timestamp window, Timestamp interval)
      : startTime(start)
      , timeWindow(window)
      , timeInterval(interval) {}

  /**
   * @brief validate the query parameters. No file is touched.
   */
  Status validate() const;
};

/**
 * @brief Safety limits and I/O sizing used by readers.
 */
struct FINA_PUBLIC ReaderOptions {
  /**
   * @brief Data files larger than this many bytes are rejected with StatusCode::SizeLimit.
   */
  uint64_t maxDataSize = DefaultMaxDataSize;
  /**
   * @brief Meta files larger than this many bytes are rejected with StatusCode::SizeLimit.
   */
  uint64_t maxMetaSize = DefaultMaxMetaSize;
  /**
   * @brief Preferred number of points per chunk, before alignment to the output buckets.
   */
  uint64_t defaultChunkSize = DefaultChunkSize;
  /**
   * @brief Upper bound on the number of points read in one chunk.
   */
  uint64_t chunkSizeLimit = ChunkSizeLimit;

  /**
   * @brief validate the configuration.
   */
  Status validate() const;
};

}  // namespace fina

#ifdef FINA_IMPLEMENTATION
#  include "types.inl"
#endif
