#pragma once

#include "types.hpp"
#include "visibility.hpp"

namespace fina {

/**
 * @brief Iteration plan for one query against one file. Computed once by SearchPlanner::plan()
 * and never modified while reading.
 */
struct FINA_PUBLIC ReadPlan {
  FileMeta meta;
  /**
   * @brief Output sampling period in seconds, `blockSize` source intervals. The requested interval
   * is rounded up to a multiple of the source interval.
   */
  Timestamp timeInterval = 0;
  OutputAverage outputAverage = OutputAverage::Complete;
  /**
   * @brief Number of source points aggregated into one output row.
   */
  uint64_t blockSize = 1;
  /**
   * @brief Index of the first point to read.
   */
  PointIndex startPos = 0;
  /**
   * @brief Signed offset in points between the first output bucket and the file. Negative when
   * the query starts before the first recorded point.
   */
  PointIndex startSearch = 0;
  /**
   * @brief Points spanned by the requested time window.
   */
  PointIndex windowSearch = 0;
  /**
   * @brief Points actually read, starting at `startPos`.
   */
  PointIndex windowMax = 0;
  /**
   * @brief Epoch seconds of the start of the first output bucket.
   */
  Timestamp firstBucketStart = 0;
  /**
   * @brief Epoch seconds where the requested window ends (exclusive).
   */
  Timestamp windowEnd = 0;
  /**
   * @brief Number of empty buckets preceding the first point under OutputAverage::AsIs.
   */
  uint64_t initialOutputStep = 0;

  Timestamp readStart() const {
    return meta.pointTime(startPos);
  }
  Timestamp readEnd() const {
    return meta.pointTime(startPos + windowMax);
  }
};

/**
 * @brief Mutable state of a chunked read, advanced between chunks.
 *
 * Invariants after SearchPlanner::begin() and every SearchPlanner::advance():
 *  - `plan.startPos <= currentPos <= plan.meta.npoints`
 *  - `remainingPoints == max(0, plan.windowMax - (currentPos - plan.startPos))`
 */
struct FINA_PUBLIC ReadCursor {
  PointIndex currentPos = 0;
  PointIndex remainingPoints = 0;
  /**
   * @brief Number of points to read in the next chunk, a multiple of `currentWindow`.
   */
  uint64_t chunkSize = 0;
  /**
   * @brief Number of points contributing to the current output bucket, 1..blockSize.
   */
  uint64_t currentWindow = 0;
  Timestamp currentStart = 0;
  Timestamp nextStart = 0;
};

/**
 * @brief Translates a SearchQuery and a FileMeta into file positions, bucket boundaries and I/O
 * chunk sizes.
 */
class FINA_PUBLIC SearchPlanner final {
public:
  SearchPlanner() = default;
  explicit SearchPlanner(const ReaderOptions& options);

  /**
   * @brief Computes the read plan for `query` against a file described by `meta`.
   *
   * @return Status StatusCode::ValidationError for an invalid query, StatusCode::Arithmetic when
   *   `meta.interval` is zero, StatusCode::Corrupt when the meta has points but no start time.
   */
  Status plan(const FileMeta& meta, const SearchQuery& query, ReadPlan* output) const;

  /**
   * @brief Initializes `cursor` at the start of `plan`.
   */
  Status begin(const ReadPlan& plan, ReadCursor* cursor) const;

  /**
   * @brief Moves `cursor` past a chunk of `consumed` points and to the next bucket boundaries.
   *
   * @return Status StatusCode::StuckRead if points remain but the cursor cannot move forward,
   *   StatusCode::Corrupt if the cursor invariants no longer hold.
   */
  Status advance(const ReadPlan& plan, ReadCursor& cursor, uint64_t consumed) const;

  /**
   * @brief Chooses the number of points for the next chunk.
   *
   * The result is a multiple of `cursor.currentWindow`, is at least the window rounded up to a
   * block multiple unless `bypassMin` is set, and fits under
   * `min(chunkSizeLimit, cursor.remainingPoints)` when possible. With `optimized` false, exactly
   * one bucket is read per chunk. Returns 0 once nothing remains.
   */
  uint64_t chunkSize(const ReadPlan& plan, const ReadCursor& cursor, bool bypassMin = false,
                     bool optimized = true) const;

  const ReaderOptions& options() const {
    return options_;
  }

  /**
   * @brief Returns the instant `base + n * interval` nearest to `timestamp`, ties to even `n`.
   */
  static Status NearestAlignedTimestamp(Timestamp base, Timestamp timestamp, Timestamp interval,
                                        Timestamp* output);

  /**
   * @brief Expresses the distance between `base` and `timestamp` in points of `baseInterval`.
   *
   * @param nbPoints Offset of `timestamp` from the closest whole `interval` step after `base`.
   * @param pointsRef Raw offset of `timestamp` from `base`, in points.
   */
  static Status CalculateNbPoints(Timestamp base, Timestamp timestamp, Timestamp interval,
                                  Timestamp baseInterval, PointIndex* nbPoints,
                                  PointIndex* pointsRef);

  static PointIndex RemainingPoints(const ReadPlan& plan, const ReadCursor& cursor);

  /**
   * @brief Number of points of the file inside the bucket `[currentStart, nextStart)`, clamped to
   * 1..blockSize.
   */
  static uint64_t CurrentWindow(const ReadPlan& plan, Timestamp currentStart,
                                Timestamp nextStart);

  /**
   * @brief Number of points of the file inside `[bucketStart, bucketEnd)`, clipped to the end of
   * the requested window and clamped to 1..blockSize. A bucket holding the last point of the file
   * counts that point.
   */
  static uint64_t BucketCoverage(const ReadPlan& plan, Timestamp bucketStart,
                                 Timestamp bucketEnd);

  static uint64_t InitialOutputStep(PointIndex startSearch, uint64_t blockSize);

  static Status CheckInvariants(const ReadPlan& plan, const ReadCursor& cursor);

private:
  ReaderOptions options_;
};

}  // namespace fina

#ifdef FINA_IMPLEMENTATION
#  include "planner.inl"
#endif
