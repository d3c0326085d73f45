#include "internal.hpp"
#include <cmath>

namespace fina {

// BucketStats /////////////////////////////////////////////////////////////////

void BucketStats::add(float value) {
  ++total;
  if (!std::isfinite(value)) {
    return;
  }
  const double v = double(value);
  if (finite == 0) {
    min = v;
    max = v;
  } else {
    min = std::min(min, v);
    max = std::max(max, v);
  }
  ++finite;
  sum += v;
}

double BucketStats::mean() const {
  if (finite == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return sum / double(finite);
}

// Aggregator //////////////////////////////////////////////////////////////////

Aggregator::Aggregator(const ReadPlan& plan, const SearchQuery& query)
    : plan_(plan)
    , query_(query) {
  if (plan_.outputAverage == OutputAverage::AsIs) {
    const BucketStats empty;
    for (uint64_t step = 0; step < plan_.initialOutputStep; ++step) {
      emit(plan_.firstBucketStart + Timestamp(step) * plan_.timeInterval, empty);
    }
  }
}

void Aggregator::consume(const Chunk& chunk) {
  for (size_t i = 0; i < chunk.size(); ++i) {
    add(chunk.positions[i], chunk.values[i]);
  }
}

std::vector<OutputRow> Aggregator::finish() {
  if (points_ == 0) {
    // Nothing was left to read: the bucket at the read position is reported empty
    const auto step =
      plan_.outputAverage == OutputAverage::AsIs ? Timestamp(plan_.initialOutputStep) : 0;
    emit(plan_.firstBucketStart + step * plan_.timeInterval, BucketStats{});
    return std::move(rows_);
  }
  if (plan_.outputAverage != OutputAverage::AsIs && bucket_ >= 0) {
    closeBucket(bucket_, stats_);
    bucket_ = -1;
    stats_.reset();
  }
  // An incomplete trailing block is dropped under AsIs
  return std::move(rows_);
}

void Aggregator::add(PointIndex position, float value) {
  ++points_;
  if (plan_.outputAverage == OutputAverage::AsIs) {
    stats_.add(value);
    if (stats_.total == plan_.blockSize) {
      const auto step = Timestamp(plan_.initialOutputStep + blocks_);
      emit(plan_.firstBucketStart + step * plan_.timeInterval, stats_);
      ++blocks_;
      stats_.reset();
    }
    return;
  }

  const Timestamp time = plan_.meta.pointTime(position);
  if (time < plan_.firstBucketStart) {
    return;
  }
  const int64_t bucket = internal::FloorDiv(time - plan_.firstBucketStart, plan_.timeInterval);
  if (bucket != bucket_) {
    if (bucket_ >= 0) {
      closeBucket(bucket_, stats_);
      const BucketStats empty;
      for (int64_t gap = bucket_ + 1; gap < bucket; ++gap) {
        closeBucket(gap, empty);
      }
    }
    bucket_ = bucket;
    stats_.reset();
  }
  stats_.add(value);
}

void Aggregator::closeBucket(int64_t bucket, const BucketStats& stats) {
  const Timestamp bucketStart = plan_.firstBucketStart + bucket * plan_.timeInterval;
  const Timestamp bucketEnd = bucketStart + plan_.timeInterval;

  const bool full = SearchPlanner::BucketCoverage(plan_, bucketStart, bucketEnd) ==
                      plan_.blockSize &&
                    bucketStart >= plan_.readStart() && bucketEnd <= plan_.readEnd();
  // Bucket holding the last recorded point, still being filled by the writer
  const bool tail = plan_.outputAverage == OutputAverage::Partial && stats.total > 0 &&
                    bucketStart <= plan_.meta.endTime && plan_.meta.endTime < bucketEnd &&
                    bucketEnd <= plan_.windowEnd;
  if (full || tail) {
    emit(bucketStart, stats);
  }
}

void Aggregator::emit(Timestamp bucketStart, const BucketStats& stats) {
  OutputRow row = Reduce(query_.outputType, bucketStart, stats);
  ShapeRow(query_.outputType, query_, row);
  rows_.push_back(std::move(row));
}

OutputRow Aggregator::Reduce(OutputType type, Timestamp bucketStart, const BucketStats& stats) {
  constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
  const double time = double(bucketStart);
  const double mean = stats.mean();
  const double min = stats.finite > 0 ? stats.min : NaN;
  const double max = stats.finite > 0 ? stats.max : NaN;

  switch (type) {
    case OutputType::Values:
      return {mean};
    case OutputType::ValuesMinMax:
      return {min, mean, max};
    case OutputType::TimeSeries:
      return {time, mean};
    case OutputType::TimeSeriesMinMax:
      return {time, min, mean, max};
    case OutputType::Integrity:
      return {time, double(stats.finite), double(stats.total)};
    default:
      return {};
  }
}

void Aggregator::ShapeRow(OutputType type, const SearchQuery& query, OutputRow& row) {
  const auto [first, last] = ValueColumns(type);
  for (size_t i = first; i < last && i < row.size(); ++i) {
    double& value = row[i];
    if (!std::isfinite(value)) {
      continue;
    }
    if ((query.minValue && value < *query.minValue) ||
        (query.maxValue && value > *query.maxValue)) {
      value = std::numeric_limits<double>::quiet_NaN();
      continue;
    }
    if (query.nDecimals) {
      const double scale = std::pow(10.0, *query.nDecimals);
      value = std::nearbyint(value * scale) / scale;
    }
  }
}

std::pair<size_t, size_t> ValueColumns(OutputType type) {
  switch (type) {
    case OutputType::Values:
      return {0, 1};
    case OutputType::ValuesMinMax:
      return {0, 3};
    case OutputType::TimeSeries:
      return {1, 2};
    case OutputType::TimeSeriesMinMax:
      return {1, 4};
    case OutputType::Integrity:
    default:
      return {0, 0};
  }
}

Status FilterValuesByRange(std::vector<OutputRow>& rows, OutputType type, double minValue,
                           double maxValue) {
  if (!(minValue < maxValue)) {
    const auto msg =
      internal::StrCat("min value ", minValue, " must be less than max value ", maxValue);
    return Status{StatusCode::ValidationError, msg};
  }
  const auto [first, last] = ValueColumns(type);
  for (auto& row : rows) {
    for (size_t i = first; i < last && i < row.size(); ++i) {
      if (row[i] < minValue || row[i] > maxValue) {
        row[i] = std::numeric_limits<double>::quiet_NaN();
      }
    }
  }
  return StatusCode::Success;
}

}  // namespace fina
