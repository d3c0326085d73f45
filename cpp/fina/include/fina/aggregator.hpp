#pragma once

#include "planner.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <utility>
#include <vector>

namespace fina {

/**
 * @brief Running statistics of one output bucket. Non-finite samples only count towards `total`.
 */
struct FINA_PUBLIC BucketStats {
  uint64_t total = 0;
  uint64_t finite = 0;
  double sum = 0;
  double min = 0;
  double max = 0;

  void add(float value);
  void reset() {
    *this = BucketStats{};
  }
  /**
   * @brief Mean of the finite samples, NaN if there are none.
   */
  double mean() const;
};

/**
 * @brief Folds the chunks of a read into output rows, one per output interval.
 *
 * Under OutputAverage::Complete and OutputAverage::Partial, points are assigned to buckets of
 * `plan.timeInterval` seconds starting at `plan.firstBucketStart`. Under OutputAverage::AsIs,
 * consecutive runs of `plan.blockSize` points form the rows, after `plan.initialOutputStep` empty
 * rows.
 */
class FINA_PUBLIC Aggregator final {
public:
  Aggregator(const ReadPlan& plan, const SearchQuery& query);

  /**
   * @brief Adds the points of `chunk`. Chunks must be supplied in file order.
   */
  void consume(const Chunk& chunk);

  /**
   * @brief Closes the last bucket and returns every row produced so far. If no point was consumed,
   * a single empty row is produced for the bucket at the read position.
   */
  std::vector<OutputRow> finish();

  /**
   * @brief Builds the row of `type` for a bucket starting at `bucketStart`.
   */
  static OutputRow Reduce(OutputType type, Timestamp bucketStart, const BucketStats& stats);

  /**
   * @brief Replaces value columns outside `[minValue, maxValue]` by NaN and rounds the remaining
   * ones to `nDecimals` when set. Time and count columns are left untouched.
   */
  static void ShapeRow(OutputType type, const SearchQuery& query, OutputRow& row);

private:
  ReadPlan plan_;
  SearchQuery query_;
  std::vector<OutputRow> rows_;
  BucketStats stats_;
  int64_t bucket_ = -1;
  uint64_t blocks_ = 0;
  uint64_t points_ = 0;

  void add(PointIndex position, float value);
  void closeBucket(int64_t bucket, const BucketStats& stats);
  void emit(Timestamp bucketStart, const BucketStats& stats);
};

/**
 * @brief Indices of the columns of `type` holding values, as a half-open range.
 */
FINA_PUBLIC
std::pair<size_t, size_t> ValueColumns(OutputType type);

/**
 * @brief Replaces value columns of `rows` outside `[minValue, maxValue]` by NaN.
 *
 * @return Status StatusCode::ValidationError if `minValue >= maxValue`.
 */
FINA_PUBLIC
Status FilterValuesByRange(std::vector<OutputRow>& rows, OutputType type, double minValue,
                           double maxValue);

}  // namespace fina

#ifdef FINA_IMPLEMENTATION
#  include "aggregator.inl"
#endif
