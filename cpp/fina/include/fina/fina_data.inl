#include "internal.hpp"

namespace fina {

namespace internal {

constexpr size_t MaxFileNameLength = 60;

inline bool IsFileNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
         c == '-';
}

}  // namespace internal

FinaData::FinaData(std::string_view fileName, std::string_view dataDir,
                   const ReaderOptions& options)
    : fileName_(fileName)
    , dataDir_(dataDir)
    , options_(options) {}

Status FinaData::ValidateFileName(std::string_view fileName) {
  if (fileName.empty() || fileName.size() > internal::MaxFileNameLength) {
    const auto msg = internal::StrCat("file name \"", fileName, "\" must be 1 to ",
                                      internal::MaxFileNameLength, " characters long");
    return Status{StatusCode::ValidationError, msg};
  }
  if (!std::all_of(fileName.begin(), fileName.end(), internal::IsFileNameChar)) {
    const auto msg =
      internal::StrCat("file name \"", fileName, "\" may only contain [A-Za-z0-9_-]");
    return Status{StatusCode::ValidationError, msg};
  }
  return StatusCode::Success;
}

Status FinaData::getMeta(FileMeta* output) const {
  if (auto status = options_.validate(); !status.ok()) {
    return status;
  }
  if (auto status = ValidateFileName(fileName_); !status.ok()) {
    return status;
  }
  MetaReader reader{dataDir_, options_};
  return reader.read(fileName_, output);
}

Status FinaData::getValues(const SearchQuery& query, std::vector<OutputRow>* output) const {
  output->clear();
  std::vector<OutputRow> rows;
  if (auto status = readValues(query, &rows); !status.ok()) {
    return status;
  }
  *output = std::move(rows);
  return StatusCode::Success;
}

Status FinaData::getValuesByDate(std::string_view startDate, SearchQuery query,
                                 std::vector<OutputRow>* output,
                                 std::string_view dateFormat) const {
  output->clear();
  if (auto status = ParseUtcDate(startDate, dateFormat, &query.startTime); !status.ok()) {
    return status;
  }
  return getValues(query, output);
}

Status FinaData::getValuesByDateRange(std::string_view startDate, std::string_view endDate,
                                      SearchQuery query, std::vector<OutputRow>* output,
                                      std::string_view dateFormat) const {
  output->clear();
  if (auto status =
        WindowByDates(startDate, endDate, dateFormat, &query.startTime, &query.timeWindow);
      !status.ok()) {
    return status;
  }
  return getValues(query, output);
}

Status FinaData::readDirectValues(Timestamp startTime, Timestamp timeWindow,
                                  std::vector<OutputRow>* output) const {
  SearchQuery query{startTime, timeWindow, 0};
  query.outputType = OutputType::TimeSeries;
  query.outputAverage = OutputAverage::Partial;
  query.nDecimals.reset();

  output->clear();
  std::vector<OutputRow> rows;
  if (auto status = readValues(query, &rows); !status.ok()) {
    return status;
  }
  if (timeWindow > 0) {
    const auto windowEnd = double(startTime + timeWindow);
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [windowEnd](const OutputRow& row) {
                                return row[0] >= windowEnd;
                              }),
               rows.end());
  }
  *output = std::move(rows);
  return StatusCode::Success;
}

Status FinaData::getFinaValues(const SearchQuery& query, double minValue, double maxValue,
                               std::vector<OutputRow>* output) const {
  output->clear();
  std::vector<OutputRow> rows;
  if (auto status = readValues(query, &rows); !status.ok()) {
    return status;
  }
  if (auto status = FilterValuesByRange(rows, query.outputType, minValue, maxValue);
      !status.ok()) {
    return status;
  }
  *output = std::move(rows);
  return StatusCode::Success;
}

Status FinaData::readValues(const SearchQuery& query, std::vector<OutputRow>* output) const {
  if (auto status = query.validate(); !status.ok()) {
    return status;
  }

  FileMeta meta;
  if (auto status = getMeta(&meta); !status.ok()) {
    return status;
  }
  if (meta.npoints == 0) {
    return StatusCode::Success;
  }

  const SearchPlanner planner{options_};
  ReadPlan plan;
  if (auto status = planner.plan(meta, query, &plan); !status.ok()) {
    return status;
  }
  ReadCursor cursor;
  if (auto status = planner.begin(plan, &cursor); !status.ok()) {
    return status;
  }

  std::string dataPath;
  if (auto status = MetaReader{dataDir_, options_}.resolvePath(fileName_, DataExtension, &dataPath);
      !status.ok()) {
    return status;
  }

  Status problem;
  const auto onProblem = [&problem](const Status& status) {
    if (problem.ok()) {
      problem = status;
    }
  };

  Aggregator aggregator{plan, query};
  ChunkView view{dataPath, planner, plan, cursor, true, onProblem};
  for (const auto& chunk : view) {
    aggregator.consume(chunk);
  }
  if (!problem.ok()) {
    return problem;
  }
  if (cursor.remainingPoints > 0) {
    const auto msg = internal::StrCat("read of \"", dataPath, "\" stopped at position ",
                                      cursor.currentPos, " with ", cursor.remainingPoints,
                                      " points remaining");
    return Status{StatusCode::Corrupt, msg};
  }

  *output = aggregator.finish();
  return StatusCode::Success;
}

}  // namespace fina
