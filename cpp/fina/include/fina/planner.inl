#include "internal.hpp"
#include <cstdlib>

namespace fina {

namespace internal {

inline uint64_t PointsWithin(const ReadPlan& plan, Timestamp lower, Timestamp upper) {
  const auto& meta = plan.meta;
  const Timestamp span = upper - std::max(meta.startTime, lower);
  const int64_t points = std::max<int64_t>(1, CeilDiv(span, meta.interval));
  return std::min(plan.blockSize, uint64_t(points));
}

}  // namespace internal

SearchPlanner::SearchPlanner(const ReaderOptions& options)
    : options_(options) {}

Status SearchPlanner::plan(const FileMeta& meta, const SearchQuery& query,
                           ReadPlan* output) const {
  if (auto status = query.validate(); !status.ok()) {
    return status;
  }
  if (meta.interval <= 0) {
    const auto msg = internal::StrCat("cannot plan a read with a source interval of ",
                                      meta.interval, " seconds");
    return Status{StatusCode::Arithmetic, msg};
  }
  if (meta.startTime == 0 && meta.npoints > 0) {
    const auto msg =
      internal::StrCat("meta has no start time but the data file holds ", meta.npoints, " points");
    return Status{StatusCode::Corrupt, msg};
  }

  ReadPlan plan;
  plan.meta = meta;
  plan.outputAverage = query.outputAverage;
  const Timestamp requested = query.timeInterval > 0 ? query.timeInterval : meta.interval;
  plan.blockSize = uint64_t(std::max<int64_t>(1, internal::CeilDiv(requested, meta.interval)));
  plan.timeInterval = Timestamp(plan.blockSize) * meta.interval;

  const auto npoints = PointIndex(meta.npoints);
  const auto block = PointIndex(plan.blockSize);
  const bool complete = query.outputAverage == OutputAverage::Complete;
  const PointIndex nominalPos = std::clamp(
    internal::FloorDiv(query.startTime - meta.startTime, meta.interval), PointIndex(0), npoints);
  plan.startPos = nominalPos;

  if (nominalPos > 0) {
    // The query starts inside the file
    plan.startSearch = complete ? internal::FloorMod(-nominalPos, block) : nominalPos;
  } else {
    Timestamp anchor = query.startTime;
    if (query.timeRefStart == TimeRef::ByTime) {
      anchor -= internal::FloorMod(query.startTime, plan.timeInterval);
    }
    PointIndex nbPoints = 0;
    PointIndex pointsRef = 0;
    if (auto status = CalculateNbPoints(meta.startTime, anchor, plan.timeInterval, meta.interval,
                                        &nbPoints, &pointsRef);
        !status.ok()) {
      return status;
    }
    plan.startSearch = query.outputAverage == OutputAverage::AsIs ? pointsRef : nbPoints;
  }

  if (plan.startSearch < 0 && complete) {
    // Skip the leading partial bucket
    plan.startPos = std::min(npoints, internal::FloorMod(plan.startSearch, block));
  }

  // A positive startSearch only describes the bucket grid when realigning
  const PointIndex gridOffset = (nominalPos > 0 && !complete) ? 0 : plan.startSearch;
  if (query.timeWindow == 0) {
    plan.windowSearch = npoints - plan.startPos;
  } else {
    plan.windowSearch = internal::FloorDiv(gridOffset, meta.interval) +
                        internal::FloorDiv(query.timeWindow, meta.interval);
  }
  if (plan.windowSearch > 0) {
    plan.windowMax = plan.windowSearch - std::abs(gridOffset);
  } else {
    plan.windowMax = npoints - plan.startPos;
  }
  plan.windowMax = std::clamp(plan.windowMax, PointIndex(0), npoints - plan.startPos);

  if (query.startTime >= meta.startTime) {
    plan.firstBucketStart = meta.pointTime(plan.startPos);
  } else {
    plan.firstBucketStart = meta.pointTime(plan.startSearch);
  }
  plan.windowEnd = query.timeWindow > 0 ? query.startTime + query.timeWindow
                                        : std::numeric_limits<Timestamp>::max();
  plan.initialOutputStep = InitialOutputStep(plan.startSearch, plan.blockSize);

  *output = plan;
  return StatusCode::Success;
}

Status SearchPlanner::begin(const ReadPlan& plan, ReadCursor* cursor) const {
  cursor->currentPos = plan.startPos;
  cursor->currentStart = plan.firstBucketStart;
  cursor->nextStart = cursor->currentStart + plan.timeInterval;
  cursor->remainingPoints = RemainingPoints(plan, *cursor);
  cursor->currentWindow = CurrentWindow(plan, cursor->currentStart, cursor->nextStart);
  cursor->chunkSize = chunkSize(plan, *cursor, true);
  return CheckInvariants(plan, *cursor);
}

Status SearchPlanner::advance(const ReadPlan& plan, ReadCursor& cursor, uint64_t consumed) const {
  if (cursor.remainingPoints > 0 && consumed == 0) {
    const auto msg = internal::StrCat("zero-length chunk at position ", cursor.currentPos, " with ",
                                      cursor.remainingPoints, " points remaining");
    return Status{StatusCode::StuckRead, msg};
  }
  if (PointIndex(consumed) > cursor.remainingPoints) {
    const auto msg = internal::StrCat("chunk of ", consumed, " points at position ",
                                      cursor.currentPos, " overruns the ",
                                      cursor.remainingPoints, " remaining points");
    return Status{StatusCode::Corrupt, msg};
  }

  cursor.currentStart = cursor.nextStart;
  cursor.nextStart += plan.timeInterval;
  cursor.currentWindow = CurrentWindow(plan, cursor.currentStart, cursor.nextStart);
  cursor.currentPos += PointIndex(consumed);
  cursor.remainingPoints = RemainingPoints(plan, cursor);
  cursor.chunkSize = chunkSize(plan, cursor, true);
  if (cursor.remainingPoints > 0 && cursor.chunkSize == 0) {
    const auto msg = internal::StrCat("chunk size is zero at position ", cursor.currentPos,
                                      " with ", cursor.remainingPoints, " points remaining");
    return Status{StatusCode::StuckRead, msg};
  }
  return CheckInvariants(plan, cursor);
}

uint64_t SearchPlanner::chunkSize(const ReadPlan& plan, const ReadCursor& cursor, bool bypassMin,
                                  bool optimized) const {
  if (cursor.remainingPoints <= 0) {
    return 0;
  }
  const uint64_t window = std::max<uint64_t>(1, cursor.currentWindow);
  if (!optimized) {
    return window;
  }

  const uint64_t maxAllowed = std::min(options_.chunkSizeLimit, uint64_t(cursor.remainingPoints));
  const uint64_t efficientMin =
    internal::RoundUpTo(uint64_t(std::max<PointIndex>(0, plan.windowMax)), plan.blockSize);

  uint64_t preferred = internal::RoundUpTo(options_.defaultChunkSize, window);
  if (!bypassMin && preferred < efficientMin) {
    preferred = internal::RoundUpTo(efficientMin, window);
  }
  if (preferred > maxAllowed) {
    preferred = internal::RoundDownTo(maxAllowed, window);
  }
  const uint64_t fallback = internal::RoundDownTo(maxAllowed, window);

  if (efficientMin <= preferred && preferred <= maxAllowed) {
    return preferred;
  }
  return fallback;
}

Status SearchPlanner::NearestAlignedTimestamp(Timestamp base, Timestamp timestamp,
                                              Timestamp interval, Timestamp* output) {
  if (interval <= 0) {
    const auto msg = internal::StrCat("cannot align timestamp ", timestamp, " on base ", base,
                                      " with an interval of ", interval);
    return Status{StatusCode::Arithmetic, msg};
  }
  *output = base + internal::RoundHalfEven(timestamp - base, interval) * interval;
  return StatusCode::Success;
}

Status SearchPlanner::CalculateNbPoints(Timestamp base, Timestamp timestamp, Timestamp interval,
                                        Timestamp baseInterval, PointIndex* nbPoints,
                                        PointIndex* pointsRef) {
  if (interval <= 0) {
    const auto msg = internal::StrCat("cannot count points with an interval of ", interval);
    return Status{StatusCode::Arithmetic, msg};
  }
  Timestamp nearest = 0;
  if (auto status = NearestAlignedTimestamp(base, timestamp, baseInterval, &nearest);
      !status.ok()) {
    return status;
  }
  const Timestamp diff = nearest - base;
  const Timestamp remainder = diff - internal::RoundHalfEven(diff, interval) * interval;
  *nbPoints = internal::FloorDiv(remainder, baseInterval);
  *pointsRef = internal::RoundHalfEven(diff, baseInterval);
  return StatusCode::Success;
}

PointIndex SearchPlanner::RemainingPoints(const ReadPlan& plan, const ReadCursor& cursor) {
  return std::max<PointIndex>(0, plan.windowMax - (cursor.currentPos - plan.startPos));
}

uint64_t SearchPlanner::CurrentWindow(const ReadPlan& plan, Timestamp currentStart,
                                      Timestamp nextStart) {
  return internal::PointsWithin(plan, currentStart, std::min(plan.meta.endTime, nextStart));
}

uint64_t SearchPlanner::BucketCoverage(const ReadPlan& plan, Timestamp bucketStart,
                                       Timestamp bucketEnd) {
  // The last point covers [endTime, endTime + interval)
  const Timestamp dataEnd = plan.meta.endTime + plan.meta.interval;
  const Timestamp upper = std::min({dataEnd, bucketEnd, plan.windowEnd});
  return internal::PointsWithin(plan, bucketStart, upper);
}

uint64_t SearchPlanner::InitialOutputStep(PointIndex startSearch, uint64_t blockSize) {
  const auto block = PointIndex(std::max<uint64_t>(1, blockSize));
  if (startSearch < 0 && -startSearch >= block) {
    return uint64_t(std::abs(internal::RoundHalfEven(startSearch, block)));
  }
  return 0;
}

Status SearchPlanner::CheckInvariants(const ReadPlan& plan, const ReadCursor& cursor) {
  if (cursor.currentPos < plan.startPos || cursor.currentPos > PointIndex(plan.meta.npoints)) {
    const auto msg = internal::StrCat("read position ", cursor.currentPos, " is outside [",
                                      plan.startPos, ", ", plan.meta.npoints, "]");
    return Status{StatusCode::Corrupt, msg};
  }
  if (cursor.remainingPoints != RemainingPoints(plan, cursor)) {
    const auto msg = internal::StrCat("remaining points ", cursor.remainingPoints,
                                      " do not match position ", cursor.currentPos);
    return Status{StatusCode::Corrupt, msg};
  }
  return StatusCode::Success;
}

}  // namespace fina
