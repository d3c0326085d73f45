#pragma once

#include "aggregator.hpp"
#include "dates.hpp"
#include "planner.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fina {

/**
 * @brief Query entry points for one PHPFina feed.
 *
 * Every call reads the meta file again, plans the read, maps the data file and releases the
 * mapping before returning. No state is shared between calls, so one FinaData may serve
 * concurrent callers. On failure the output vector is left empty.
 */
class FINA_PUBLIC FinaData final {
public:
  FinaData(std::string_view fileName, std::string_view dataDir,
           const ReaderOptions& options = {});

  /**
   * @brief Reads the current meta of the feed.
   */
  Status getMeta(FileMeta* output) const;

  /**
   * @brief Reads and aggregates the window described by `query`.
   *
   * @return Status StatusCode::ValidationError before any file access if the query, the options or
   *   the file name are invalid. Otherwise any error of MetaReader::read(),
   *   SearchPlanner::plan() or the chunk reader.
   */
  Status getValues(const SearchQuery& query, std::vector<OutputRow>* output) const;

  /**
   * @brief Same as getValues(), with the window starting at the UTC date `startDate`. The start
   * time of `query` is replaced and its window kept.
   */
  Status getValuesByDate(std::string_view startDate, SearchQuery query,
                         std::vector<OutputRow>* output,
                         std::string_view dateFormat = DefaultDateFormat) const;

  /**
   * @brief Same as getValues(), over the UTC date range `[startDate, endDate)`. The start time and
   * window of `query` are replaced.
   */
  Status getValuesByDateRange(std::string_view startDate, std::string_view endDate,
                              SearchQuery query, std::vector<OutputRow>* output,
                              std::string_view dateFormat = DefaultDateFormat) const;

  /**
   * @brief Returns `[time, value]` rows at the source resolution, without realignment.
   */
  Status readDirectValues(Timestamp startTime, Timestamp timeWindow,
                          std::vector<OutputRow>* output) const;

  /**
   * @brief Same as getValues(), then replaces every value column outside `[minValue, maxValue]`
   * by NaN.
   */
  Status getFinaValues(const SearchQuery& query, double minValue, double maxValue,
                       std::vector<OutputRow>* output) const;

  /**
   * @brief Checks that `fileName` is 1 to 60 characters of `[A-Za-z0-9_-]`.
   */
  static Status ValidateFileName(std::string_view fileName);

  const std::string& fileName() const {
    return fileName_;
  }
  const std::string& dataDir() const {
    return dataDir_;
  }
  const ReaderOptions& options() const {
    return options_;
  }

private:
  std::string fileName_;
  std::string dataDir_;
  ReaderOptions options_;

  Status readValues(const SearchQuery& query, std::vector<OutputRow>* output) const;
};

}  // namespace fina

#ifdef FINA_IMPLEMENTATION
#  include "fina_data.inl"
#endif
