#define FINA_IMPLEMENTATION
#include <fina/fina.hpp>

#include <benchmark/benchmark.h>

#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>

constexpr char DataDir[] = ".";
constexpr char FeedName[] = "benchmark";
constexpr uint32_t FeedInterval = 10;
constexpr uint32_t FeedStart = 1575936000;
constexpr size_t FeedPoints = 8640;

static void WriteUint32(std::ofstream& out, uint32_t value) {
  char bytes[4];
  for (int i = 0; i < 4; ++i) {
    bytes[i] = char((value >> (8 * i)) & 0xff);
  }
  out.write(bytes, sizeof(bytes));
}

// One day of 10 second samples, with a missing reading every 97 points
static void WriteFeed() {
  std::ofstream meta(std::string(FeedName) + fina::MetaExtension, std::ios::binary);
  WriteUint32(meta, 0);
  WriteUint32(meta, 0);
  WriteUint32(meta, FeedInterval);
  WriteUint32(meta, FeedStart);

  std::ofstream data(std::string(FeedName) + fina::DataExtension, std::ios::binary);
  for (size_t i = 0; i < FeedPoints; ++i) {
    const float value =
      i % 97 == 0 ? std::nanf("") : float(20.0 + 5.0 * std::sin(double(i) / 360.0));
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    WriteUint32(data, bits);
  }
}

static void RemoveFeed() {
  std::remove((std::string(FeedName) + fina::MetaExtension).c_str());
  std::remove((std::string(FeedName) + fina::DataExtension).c_str());
}

static void BM_MetaReaderRead(benchmark::State& state) {
  const fina::MetaReader reader{DataDir};
  fina::FileMeta meta;

  while (state.KeepRunning()) {
    const auto status = reader.read(FeedName, &meta);
    if (!status.ok()) {
      state.SkipWithError(status.message.c_str());
      break;
    }
    benchmark::DoNotOptimize(meta);
  }
}

static void BM_ChunkViewRead(benchmark::State& state) {
  fina::ReaderOptions options;
  options.chunkSizeLimit = uint64_t(state.range(0));
  options.defaultChunkSize = std::min(options.defaultChunkSize, options.chunkSizeLimit);
  const fina::SearchPlanner planner{options};

  fina::FileMeta meta;
  std::string dataPath;
  const fina::MetaReader reader{DataDir, options};
  if (!reader.read(FeedName, &meta).ok() ||
      !reader.resolvePath(FeedName, fina::DataExtension, &dataPath).ok()) {
    state.SkipWithError("cannot open benchmark feed");
    return;
  }
  fina::ReadPlan plan;
  if (!planner.plan(meta, fina::SearchQuery{FeedStart, 0, 0}, &plan).ok()) {
    state.SkipWithError("cannot plan benchmark read");
    return;
  }

  bool failed = false;
  auto onProblem = [&failed](const fina::Status&) {
    failed = true;
  };

  while (state.KeepRunning()) {
    fina::ReadCursor cursor;
    if (!planner.begin(plan, &cursor).ok()) {
      state.SkipWithError("cannot start benchmark read");
      break;
    }
    double sum = 0;
    fina::ChunkView view{dataPath, planner, plan, cursor, true, onProblem};
    for (const auto& chunk : view) {
      for (float value : chunk.values) {
        sum += std::isfinite(value) ? value : 0.0;
      }
    }
    benchmark::DoNotOptimize(sum);
    if (failed) {
      state.SkipWithError("chunked read failed");
      break;
    }
  }
}

static void BM_FinaDataGetValues(benchmark::State& state) {
  const fina::FinaData feed{FeedName, DataDir};
  fina::SearchQuery query{FeedStart, 86400, state.range(0)};
  query.outputType = fina::OutputType::TimeSeriesMinMax;
  std::vector<fina::OutputRow> rows;

  while (state.KeepRunning()) {
    const auto status = feed.getValues(query, &rows);
    if (!status.ok()) {
      state.SkipWithError(status.message.c_str());
      break;
    }
    benchmark::DoNotOptimize(rows.data());
  }
}

int main(int argc, char* argv[]) {
  WriteFeed();

  benchmark::RegisterBenchmark("BM_MetaReaderRead", BM_MetaReaderRead);
  benchmark::RegisterBenchmark("BM_ChunkViewRead", BM_ChunkViewRead)
    ->Arg(64)
    ->Arg(512)
    ->Arg(fina::ChunkSizeLimit);
  benchmark::RegisterBenchmark("BM_FinaDataGetValues", BM_FinaDataGetValues)
    ->Arg(0)
    ->Arg(60)
    ->Arg(600)
    ->Arg(3600);
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();

  RemoveFeed();
  return 0;
}
