#define FINA_IMPLEMENTATION
#include <fina/fina.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <numeric>

#include <unistd.h>

namespace fs = std::filesystem;

void requireOk(const fina::Status& status) {
  CAPTURE(status.code);
  CAPTURE(status.message);
  REQUIRE(status.ok());
}

constexpr fina::Timestamp BigStart = 1575936000;
constexpr fina::Timestamp SlimStart = BigStart - 33;

// A data directory removed when the test ends
struct ScratchDir {
  fs::path path;

  ScratchDir() {
    static int counter = 0;
    path = fs::temp_directory_path() /
           ("fina-tests-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
    fs::create_directories(path);
  }

  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  std::string dir() const {
    return path.string();
  }
};

static void AppendUint32(std::vector<std::byte>& bytes, uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    bytes.push_back(std::byte((value >> (8 * i)) & 0xff));
  }
}

static void WriteBytes(const fs::path& path, const std::vector<std::byte>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()), std::streamsize(bytes.size()));
  REQUIRE(out.good());
}

static void WriteMeta(const ScratchDir& scratch, const std::string& name, uint32_t interval,
                      uint32_t startTime) {
  std::vector<std::byte> meta(fina::MetaHeaderSize);
  AppendUint32(meta, interval);
  AppendUint32(meta, startTime);
  WriteBytes(scratch.path / (name + ".meta"), meta);
}

static void WriteData(const ScratchDir& scratch, const std::string& name,
                      const std::vector<float>& values) {
  std::vector<std::byte> data;
  data.reserve(values.size() * fina::PointSize);
  for (float value : values) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    AppendUint32(data, bits);
  }
  WriteBytes(scratch.path / (name + ".dat"), data);
}

static std::vector<float> Ramp(size_t count) {
  std::vector<float> values(count);
  std::iota(values.begin(), values.end(), 0.0f);
  return values;
}

static void WriteFeed(const ScratchDir& scratch, const std::string& name, uint32_t interval,
                      uint32_t startTime, const std::vector<float>& values) {
  WriteMeta(scratch, name, interval, startTime);
  WriteData(scratch, name, values);
}

TEST_CASE("MetaReader::read()", "[reader]") {
  ScratchDir scratch;
  WriteFeed(scratch, "feed", 10, uint32_t(SlimStart), Ramp(360));
  const fina::MetaReader reader{scratch.dir()};

  SECTION("Fresh meta") {
    fina::FileMeta meta;
    requireOk(reader.read("feed", &meta));
    REQUIRE(meta.interval == 10);
    REQUIRE(meta.startTime == SlimStart);
    REQUIRE(meta.npoints == 360);
    REQUIRE(meta.size == 1440);
    REQUIRE(meta.endTime == SlimStart + 359 * 10);
  }

  SECTION("Idempotent") {
    fina::FileMeta first;
    fina::FileMeta second;
    requireOk(reader.read("feed", &first));
    requireOk(reader.read("feed", &second));
    REQUIRE(first == second);
  }

  SECTION("Growing data file") {
    fina::FileMeta before;
    requireOk(reader.read("feed", &before));
    WriteData(scratch, "feed", Ramp(400));
    fina::FileMeta after;
    requireOk(reader.read("feed", &after));
    REQUIRE(after != before);
    REQUIRE(after.npoints == 400);
    REQUIRE(after.endTime == SlimStart + 399 * 10);
  }

  SECTION("Missing files") {
    fina::FileMeta meta;
    auto status = reader.read("missing", &meta);
    REQUIRE(status.code == fina::StatusCode::NotFound);
    REQUIRE(status.message.rfind("error reading meta file '", 0) == 0);

    WriteMeta(scratch, "nodata", 10, uint32_t(SlimStart));
    status = reader.read("nodata", &meta);
    REQUIRE(status.code == fina::StatusCode::NotFound);
  }

  SECTION("Size limits") {
    fina::ReaderOptions options;
    options.maxDataSize = 1000;
    fina::FileMeta meta;
    REQUIRE(fina::MetaReader{scratch.dir(), options}.read("feed", &meta).code ==
            fina::StatusCode::SizeLimit);

    WriteBytes(scratch.path / "feed.meta", std::vector<std::byte>(2000));
    REQUIRE(reader.read("feed", &meta).code == fina::StatusCode::SizeLimit);
  }

  SECTION("Short meta record") {
    std::vector<std::byte> meta(fina::MetaHeaderSize);
    AppendUint32(meta, 10);
    WriteBytes(scratch.path / "feed.meta", meta);
    fina::FileMeta output;
    REQUIRE(reader.read("feed", &output).code == fina::StatusCode::Corrupt);
  }

  SECTION("Partial point") {
    fs::resize_file(scratch.path / "feed.dat", 1441);
    fina::FileMeta meta;
    const auto status = reader.read("feed", &meta);
    REQUIRE(status.code == fina::StatusCode::Corrupt);
  }
}

TEST_CASE("MetaReader::resolvePath()", "[reader]") {
  ScratchDir scratch;
  const fina::MetaReader reader{scratch.dir()};
  std::string path;

  SECTION("Inside the data directory") {
    requireOk(reader.resolvePath("feed", fina::DataExtension, &path));
    REQUIRE(fs::path(path).filename().string() == "feed.dat");
    REQUIRE(fs::path(path).parent_path().string() ==
            fs::absolute(scratch.path).lexically_normal().string());
  }

  SECTION("Traversal") {
    auto status = reader.resolvePath("../feed", fina::MetaExtension, &path);
    REQUIRE(status.code == fina::StatusCode::PathSecurity);
    status = reader.resolvePath("sub/../../feed", fina::DataExtension, &path);
    REQUIRE(status.code == fina::StatusCode::PathSecurity);
  }

  SECTION("Extension") {
    const auto status = reader.resolvePath("feed", ".txt", &path);
    REQUIRE(status.code == fina::StatusCode::PathSecurity);
  }
}

TEST_CASE("MappedFile", "[reader]") {
  ScratchDir scratch;
  WriteData(scratch, "feed", Ramp(16));

  SECTION("Missing file") {
    fina::MappedFile file;
    REQUIRE(file.open((scratch.path / "missing.dat").string()).code ==
            fina::StatusCode::NotFound);
    REQUIRE(!file.isOpen());
  }

  SECTION("Read") {
    fina::MappedFile file;
    requireOk(file.open((scratch.path / "feed.dat").string()));
    REQUIRE(file.isOpen());
    REQUIRE(file.size() == 64);

    std::byte* data = nullptr;
    REQUIRE(file.read(&data, 8, 8) == 8);
    REQUIRE(fina::internal::ParseFloat32(data) == 2.0f);
    REQUIRE(fina::internal::ParseFloat32(data + 4) == 3.0f);
    REQUIRE(file.read(&data, 60, 8) == 4);
    REQUIRE(file.read(&data, 64, 4) == 0);

    file.close();
    REQUIRE(!file.isOpen());
    REQUIRE(file.read(&data, 0, 4) == 0);
  }

  SECTION("Empty file") {
    WriteData(scratch, "empty", {});
    fina::MappedFile file;
    requireOk(file.open((scratch.path / "empty.dat").string()));
    std::byte* data = nullptr;
    REQUIRE(file.read(&data, 0, 4) == 0);
  }
}

TEST_CASE("ChunkView", "[reader]") {
  ScratchDir scratch;
  WriteFeed(scratch, "feed", 10, uint32_t(SlimStart), Ramp(360));
  const std::string dataPath = (scratch.path / "feed.dat").string();

  fina::ReaderOptions options;
  options.defaultChunkSize = 6;
  options.chunkSizeLimit = 12;
  const fina::SearchPlanner planner{options};

  fina::FileMeta meta;
  requireOk(fina::MetaReader{scratch.dir(), options}.read("feed", &meta));
  fina::ReadPlan plan;
  requireOk(planner.plan(meta, fina::SearchQuery{SlimStart - 142, 3600, 60}, &plan));
  fina::ReadCursor cursor;
  requireOk(planner.begin(plan, &cursor));

  std::vector<fina::Status> problems;
  const auto onProblem = [&problems](const fina::Status& status) {
    problems.push_back(status);
  };

  SECTION("Automatic advancement") {
    fina::ChunkView view{dataPath, planner, plan, cursor, true, onProblem};
    fina::PointIndex expected = plan.startPos;
    size_t chunks = 0;
    for (const auto& chunk : view) {
      REQUIRE(chunk.size() > 0);
      REQUIRE(chunk.size() <= 12);
      for (size_t i = 0; i < chunk.size(); ++i) {
        REQUIRE(chunk.positions[i] == expected);
        REQUIRE(chunk.values[i] == float(expected));
        ++expected;
      }
      REQUIRE(cursor.currentPos >= plan.startPos);
      REQUIRE(cursor.currentPos <= fina::PointIndex(meta.npoints));
      ++chunks;
    }
    REQUIRE(problems.empty());
    REQUIRE(chunks > 1);
    REQUIRE(expected == plan.startPos + plan.windowMax);
    REQUIRE(cursor.remainingPoints == 0);

    // Not restartable
    REQUIRE(view.begin() == view.end());
  }

  SECTION("Manual advancement") {
    fina::ChunkView view{dataPath, planner, plan, cursor, false, onProblem};
    fina::PointIndex total = 0;
    for (const auto& chunk : view) {
      REQUIRE(cursor.chunkSize % cursor.currentWindow == 0);
      total += fina::PointIndex(chunk.size());
      requireOk(planner.advance(plan, cursor, chunk.size()));
    }
    REQUIRE(problems.empty());
    REQUIRE(total == plan.windowMax);
  }

  SECTION("Cursor not advanced") {
    fina::ChunkView view{dataPath, planner, plan, cursor, false, onProblem};
    auto it = view.begin();
    REQUIRE(it != view.end());
    ++it;
    REQUIRE(it == view.end());
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0].code == fina::StatusCode::StuckRead);
  }

  SECTION("File truncated while reading") {
    fina::ChunkView view{dataPath, planner, plan, cursor, true, onProblem};
    auto it = view.begin();
    REQUIRE(it != view.end());
    fs::resize_file(dataPath, 40);
    ++it;
    REQUIRE(it == view.end());
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0].code == fina::StatusCode::Corrupt);
  }

  SECTION("Missing data file") {
    fs::remove(dataPath);
    fina::ChunkView view{dataPath, planner, plan, cursor, true, onProblem};
    REQUIRE(view.begin() == view.end());
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0].code == fina::StatusCode::NotFound);
  }
}

TEST_CASE("FinaData::getValues()", "[fina_data]") {
  ScratchDir scratch;
  WriteFeed(scratch, "big", 10, uint32_t(BigStart), Ramp(51840));
  WriteFeed(scratch, "slim", 10, uint32_t(SlimStart), Ramp(360));
  const fina::FinaData big{"big", scratch.dir()};
  const fina::FinaData slim{"slim", scratch.dir()};
  std::vector<fina::OutputRow> rows;

  SECTION("Down-sampling ratio") {
    requireOk(big.getValues(fina::SearchQuery{BigStart, 3600, 60}, &rows));
    REQUIRE(rows.size() == 60);
    REQUIRE(rows[0] == fina::OutputRow{double(BigStart), 2.5});
    requireOk(big.getValues(fina::SearchQuery{BigStart, 3600, 30}, &rows));
    REQUIRE(rows.size() == 120);
    REQUIRE(rows[0] == fina::OutputRow{double(BigStart), 1});
  }

  SECTION("Averaging policies") {
    fina::SearchQuery query{SlimStart - 142, 3600, 60};
    for (auto timeRef : {fina::TimeRef::ByTime, fina::TimeRef::BySearch}) {
      query.timeRefStart = timeRef;
      query.outputAverage = fina::OutputAverage::Complete;
      requireOk(slim.getValues(query, &rows));
      CAPTURE(fina::TimeRefString(timeRef));
      REQUIRE(rows.size() == 57);
    }

    for (auto timeRef : {fina::TimeRef::ByTime, fina::TimeRef::BySearch}) {
      query.timeRefStart = timeRef;
      CAPTURE(fina::TimeRefString(timeRef));
      query.outputAverage = fina::OutputAverage::Partial;
      requireOk(slim.getValues(query, &rows));
      REQUIRE(rows.size() == 57);

      query.outputAverage = fina::OutputAverage::AsIs;
      requireOk(slim.getValues(query, &rows));
      REQUIRE(rows.size() == 59);
    }

    query = fina::SearchQuery{SlimStart, 3600, 60};
    query.timeRefStart = fina::TimeRef::ByTime;
    requireOk(slim.getValues(query, &rows));
    REQUIRE(rows.size() == 59);
    query.timeRefStart = fina::TimeRef::BySearch;
    requireOk(slim.getValues(query, &rows));
    REQUIRE(rows.size() == 60);
    REQUIRE(rows.back() == fina::OutputRow{double(SlimStart + 3540), 356.5});
  }

  SECTION("Last bucket of the file") {
    WriteFeed(scratch, "short", 10, uint32_t(BigStart), std::vector<float>(12, 1.0f));
    const fina::FinaData feed{"short", scratch.dir()};
    fina::SearchQuery query{BigStart, 0, 60};
    query.outputType = fina::OutputType::Integrity;
    const std::vector<fina::OutputRow> expected{{double(BigStart), 6, 6},
                                                {double(BigStart + 60), 6, 6}};
    requireOk(feed.getValues(query, &rows));
    REQUIRE(rows == expected);
    query.timeWindow = 120;
    requireOk(feed.getValues(query, &rows));
    REQUIRE(rows == expected);

    requireOk(big.getValues(fina::SearchQuery{BigStart, 0, 60}, &rows));
    REQUIRE(rows.size() == 8640);
    REQUIRE(rows.back() == fina::OutputRow{double(BigStart + 518340), 51836.5});

    query = fina::SearchQuery{BigStart, 0, 86400};
    query.outputType = fina::OutputType::Integrity;
    requireOk(big.getValues(query, &rows));
    REQUIRE(rows.size() == 6);
    REQUIRE(rows.back() == fina::OutputRow{double(BigStart + 5 * 86400), 8640, 8640});
  }

  SECTION("Interval not a multiple of the source interval") {
    requireOk(big.getValues(fina::SearchQuery{BigStart, 3600, 25}, &rows));
    REQUIRE(rows.size() == 120);
    REQUIRE(rows[0] == fina::OutputRow{double(BigStart), 1});
    REQUIRE(rows[1] == fina::OutputRow{double(BigStart + 30), 4});
    REQUIRE(rows.back()[0] == BigStart + 3570);
  }

  SECTION("Read position at the end of the file") {
    WriteFeed(scratch, "short", 10, uint32_t(BigStart), std::vector<float>(12, 1.0f));
    const fina::FinaData feed{"short", scratch.dir()};
    fina::SearchQuery query{BigStart + 120, 0, 60};
    query.outputAverage = fina::OutputAverage::Partial;
    requireOk(feed.getValues(query, &rows));
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0][0] == BigStart + 120);
    REQUIRE(std::isnan(rows[0][1]));

    query.outputType = fina::OutputType::Integrity;
    requireOk(feed.getValues(query, &rows));
    REQUIRE(rows == std::vector<fina::OutputRow>{{double(BigStart + 120), 0, 0}});
  }

  SECTION("Search anchored on the query start") {
    fina::SearchQuery query{SlimStart - 120, 3600, 60};
    query.timeRefStart = fina::TimeRef::BySearch;
    requireOk(slim.getValues(query, &rows));
    REQUIRE(rows.size() == 58);
  }

  SECTION("Query starting inside the file") {
    requireOk(big.getValues(fina::SearchQuery{BigStart + 12, 3600, 60}, &rows));
    REQUIRE(rows.size() == 59);
    REQUIRE(rows[0][0] == BigStart + 10);
    REQUIRE(rows[1][0] == BigStart + 70);
    REQUIRE(rows[2][0] == BigStart + 130);
  }

  SECTION("Output shapes") {
    fina::SearchQuery query{SlimStart, 3600, 60};
    for (auto type : {fina::OutputType::Values, fina::OutputType::ValuesMinMax,
                      fina::OutputType::TimeSeries, fina::OutputType::TimeSeriesMinMax,
                      fina::OutputType::Integrity}) {
      query.outputType = type;
      requireOk(slim.getValues(query, &rows));
      CAPTURE(fina::OutputTypeString(type));
      REQUIRE(rows.size() == 59);
      for (const auto& row : rows) {
        REQUIRE(row.size() == fina::ColumnCount(type));
      }
    }
  }

  SECTION("Missing readings") {
    std::vector<float> values = Ramp(20);
    values[1] = values[4] = values[7] = std::numeric_limits<float>::quiet_NaN();
    WriteFeed(scratch, "gaps", 10, uint32_t(BigStart), values);

    fina::SearchQuery query{BigStart, 100, 100};
    query.outputType = fina::OutputType::Integrity;
    requireOk(fina::FinaData{"gaps", scratch.dir()}.getValues(query, &rows));
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0] == fina::OutputRow{double(BigStart), 7, 10});

    query.outputType = fina::OutputType::ValuesMinMax;
    requireOk(fina::FinaData{"gaps", scratch.dir()}.getValues(query, &rows));
    REQUIRE(rows[0] == fina::OutputRow{0, 4.714, 9});
    query.nDecimals.reset();
    requireOk(fina::FinaData{"gaps", scratch.dir()}.getValues(query, &rows));
    REQUIRE(rows[0] == fina::OutputRow{0, 33.0 / 7.0, 9});
  }

  SECTION("Empty feed") {
    WriteFeed(scratch, "empty", 10, 0, {});
    requireOk(fina::FinaData{"empty", scratch.dir()}.getValues(
      fina::SearchQuery{BigStart, 3600, 60}, &rows));
    REQUIRE(rows.empty());
  }

  SECTION("Data without start time") {
    WriteFeed(scratch, "nostart", 10, 0, Ramp(10));
    const auto status = fina::FinaData{"nostart", scratch.dir()}.getValues(
      fina::SearchQuery{BigStart, 3600, 60}, &rows);
    REQUIRE(status.code == fina::StatusCode::Corrupt);
    REQUIRE(rows.empty());
  }

  SECTION("Validation precedes file access") {
    const fina::FinaData missing{"missing", scratch.dir()};
    auto status = missing.getValues(fina::SearchQuery{-5, 3600, 60}, &rows);
    REQUIRE(status.code == fina::StatusCode::ValidationError);
    status = missing.getValues(fina::SearchQuery{BigStart, 3600, 60}, &rows);
    REQUIRE(status.code == fina::StatusCode::NotFound);

    const fina::FinaData badName{"../big", scratch.dir()};
    status = badName.getValues(fina::SearchQuery{BigStart, 3600, 60}, &rows);
    REQUIRE(status.code == fina::StatusCode::ValidationError);
  }

  SECTION("Truncated data file") {
    fs::resize_file(scratch.path / "slim.dat", 1441);
    const auto status = slim.getValues(fina::SearchQuery{SlimStart, 3600, 60}, &rows);
    REQUIRE(status.code == fina::StatusCode::Corrupt);
    REQUIRE(rows.empty());
  }
}

TEST_CASE("FinaData entry points", "[fina_data]") {
  ScratchDir scratch;
  WriteFeed(scratch, "feed", 10, uint32_t(BigStart), Ramp(51840));
  const fina::FinaData feed{"feed", scratch.dir()};
  std::vector<fina::OutputRow> rows;

  SECTION("getMeta()") {
    fina::FileMeta meta;
    requireOk(feed.getMeta(&meta));
    REQUIRE(meta.npoints == 51840);
    REQUIRE(meta.nbDays() == 6);
  }

  SECTION("getValuesByDate()") {
    requireOk(feed.getValuesByDate("2019-12-10 00:00:00", fina::SearchQuery{0, 3600, 30}, &rows));
    REQUIRE(rows.size() == 120);
    const auto status = feed.getValuesByDate("10/12/2019", fina::SearchQuery{0, 3600, 30}, &rows);
    REQUIRE(status.code == fina::StatusCode::ValidationError);
    REQUIRE(rows.empty());
  }

  SECTION("getValuesByDateRange()") {
    requireOk(feed.getValuesByDateRange("2019-12-10 00:00", "2019-12-10 01:00",
                                        fina::SearchQuery{0, 0, 60}, &rows, "%Y-%m-%d %H:%M"));
    REQUIRE(rows.size() == 60);
    REQUIRE(rows.front()[0] == BigStart);
    REQUIRE(rows.back()[0] == BigStart + 3540);
  }

  SECTION("readDirectValues()") {
    WriteFeed(scratch, "fine", 10, uint32_t(BigStart), {0.123456f, 1.5f});
    requireOk(fina::FinaData{"fine", scratch.dir()}.readDirectValues(BigStart, 20, &rows));
    REQUIRE(rows == std::vector<fina::OutputRow>{{double(BigStart), double(0.123456f)},
                                                 {double(BigStart + 10), 1.5}});

    requireOk(feed.readDirectValues(BigStart + 12, 100, &rows));
    REQUIRE(rows.size() == 10);
    for (size_t i = 0; i < rows.size(); ++i) {
      const auto position = fina::Timestamp(i + 1);
      REQUIRE(rows[i] == fina::OutputRow{double(BigStart + 10 * position), double(position)});
    }
  }

  SECTION("getFinaValues()") {
    requireOk(feed.getFinaValues(fina::SearchQuery{BigStart, 3600, 60}, 0, 100, &rows));
    REQUIRE(rows.size() == 60);
    REQUIRE(rows[16][1] == 98.5);
    REQUIRE(std::isnan(rows[17][1]));
    REQUIRE(rows[17][0] == BigStart + 17 * 60);

    const auto status = feed.getFinaValues(fina::SearchQuery{BigStart, 3600, 60}, 5, 5, &rows);
    REQUIRE(status.code == fina::StatusCode::ValidationError);
  }

  SECTION("ValidateFileName()") {
    requireOk(fina::FinaData::ValidateFileName("feed_1-a"));
    REQUIRE(fina::FinaData::ValidateFileName("").code == fina::StatusCode::ValidationError);
    REQUIRE(fina::FinaData::ValidateFileName(std::string(61, 'a')).code ==
            fina::StatusCode::ValidationError);
    REQUIRE(fina::FinaData::ValidateFileName("feed.dat").code ==
            fina::StatusCode::ValidationError);
  }
}
