#define FINA_IMPLEMENTATION
#include <fina/fina.hpp>

#include <fmt/core.h>

#include <charconv>
#include <iostream>
#include <string>

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::vformat(msg, fmt::make_format_args(args...));
}

bool ParseTimestamp(std::string_view value, fina::Timestamp* output) {
  const auto result = std::from_chars(value.data(), value.data() + value.size(), *output);
  return result.ec == std::errc() && result.ptr == value.data() + value.size();
}

std::string ToString(const fina::FileMeta& meta) {
  std::string start;
  std::string end;
  if (!fina::FormatUtcDate(meta.startTime, fina::DefaultDateFormat, &start).ok() ||
      !fina::FormatUtcDate(meta.endTime, fina::DefaultDateFormat, &end).ok()) {
    start = std::to_string(meta.startTime);
    end = std::to_string(meta.endTime);
  }
  return StrFormat(
    "[FileMeta] interval={}, start_time={} ({}), end_time={} ({}), npoints={}, size={}, "
    "days={}",
    meta.interval, meta.startTime, start, meta.endTime, end, meta.npoints, meta.size,
    meta.nbDays());
}

std::string ToString(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    out += out.empty() ? name : ", " + name;
  }
  return out;
}

std::string ToString(const fina::OutputRow& row) {
  std::string out;
  for (size_t i = 0; i < row.size(); ++i) {
    out += StrFormat(i == 0 ? "{}" : ", {}", row[i]);
  }
  return out;
}

// Prints every point of the file, one chunk at a time
void DumpPoints(const std::string& dataDir, const std::string& fileName,
                const fina::FileMeta& meta) {
  const fina::SearchPlanner planner;
  fina::ReadPlan plan;
  auto status = planner.plan(meta, fina::SearchQuery{meta.startTime, 0, 0}, &plan);
  fina::ReadCursor cursor;
  if (status.ok()) {
    status = planner.begin(plan, &cursor);
  }
  std::string dataPath;
  if (status.ok()) {
    status = fina::MetaReader{dataDir}.resolvePath(fileName, fina::DataExtension, &dataPath);
  }
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return;
  }

  auto onProblem = [](const fina::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  };

  fina::ChunkView view{dataPath, planner, plan, cursor, true, onProblem};
  for (const auto& chunk : view) {
    std::cout << StrFormat("[Chunk] positions={}..{}, points={}\n", chunk.positions.front(),
                           chunk.positions.back(), chunk.size());
    for (size_t i = 0; i < chunk.size(); ++i) {
      std::cout << StrFormat("  {} {}\n", meta.pointTime(chunk.positions[i]), chunk.values[i]);
    }
  }
}

int main(int argc, char* argv[]) {
  if (argc != 3 && argc != 6 && argc != 7) {
    std::cerr << "Usage: " << argv[0]
              << " <data_dir> <file_name> [<start> <window> <interval> [<output_type>]]\n";
    return 1;
  }

  const std::string dataDir = argv[1];
  const std::string fileName = argv[2];
  const fina::FinaData feed{fileName, dataDir};

  fina::FileMeta meta;
  if (auto status = feed.getMeta(&meta); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  std::cout << ToString(meta) << "\n";

  if (argc == 3) {
    DumpPoints(dataDir, fileName, meta);
    return 0;
  }

  fina::SearchQuery query;
  if (!ParseTimestamp(argv[3], &query.startTime) || !ParseTimestamp(argv[4], &query.timeWindow) ||
      !ParseTimestamp(argv[5], &query.timeInterval)) {
    std::cerr << "! start, window and interval must be integers\n";
    return 1;
  }
  if (argc == 7) {
    if (auto status = fina::ParseOutputType(argv[6], &query.outputType); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      return 1;
    }
  }

  std::vector<fina::OutputRow> rows;
  if (auto status = feed.getValues(query, &rows); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  std::cout << StrFormat("[Rows] type={}, columns={}, count={}\n",
                         fina::OutputTypeString(query.outputType),
                         ToString(fina::ColumnNames(query.outputType)), rows.size());
  for (const auto& row : rows) {
    std::cout << ToString(row) << "\n";
  }
  return 0;
}
