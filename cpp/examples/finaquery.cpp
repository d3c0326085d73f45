#define FINA_IMPLEMENTATION
#include <fina/fina.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <fstream>
#include <iostream>

using json = nlohmann::ordered_json;

// Query settings read from the "query" object of the configuration
struct QueryConfig {
  fina::OutputType outputType = fina::OutputType::TimeSeries;
  fina::OutputAverage outputAverage = fina::OutputAverage::Complete;
  fina::TimeRef timeRefStart = fina::TimeRef::ByTime;
  std::optional<double> minValue;
  std::optional<double> maxValue;
  std::optional<int> nDecimals = fina::DefaultDecimals;
};

bool ParseTimestamp(std::string_view value, fina::Timestamp* output) {
  const auto result = std::from_chars(value.data(), value.data() + value.size(), *output);
  return result.ec == std::errc() && result.ptr == value.data() + value.size();
}

fina::Status ParseReaderOptions(const json& config, fina::ReaderOptions* options) {
  if (config.contains("reader")) {
    const auto& reader = config["reader"];
    options->maxDataSize = reader.value("maxDataSize", options->maxDataSize);
    options->maxMetaSize = reader.value("maxMetaSize", options->maxMetaSize);
    options->defaultChunkSize = reader.value("defaultChunkSize", options->defaultChunkSize);
    options->chunkSizeLimit = reader.value("chunkSizeLimit", options->chunkSizeLimit);
  }
  return options->validate();
}

fina::Status ParseQueryConfig(const json& config, QueryConfig* output) {
  if (!config.contains("query")) {
    return fina::StatusCode::Success;
  }
  const auto& query = config["query"];
  if (query.contains("outputType")) {
    auto status = fina::ParseOutputType(query["outputType"].get<std::string>(), &output->outputType);
    if (!status.ok()) {
      return status;
    }
  }
  if (query.contains("outputAverage")) {
    auto status = fina::ParseOutputAverage(query["outputAverage"].get<std::string>(),
                                           &output->outputAverage);
    if (!status.ok()) {
      return status;
    }
  }
  if (query.contains("timeRefStart")) {
    auto status =
      fina::ParseTimeRef(query["timeRefStart"].get<std::string>(), &output->timeRefStart);
    if (!status.ok()) {
      return status;
    }
  }
  if (query.contains("minValue")) {
    output->minValue = query["minValue"].get<double>();
  }
  if (query.contains("maxValue")) {
    output->maxValue = query["maxValue"].get<double>();
  }
  if (query.contains("nDecimals")) {
    // null disables rounding
    if (query["nDecimals"].is_null()) {
      output->nDecimals.reset();
    } else {
      output->nDecimals = query["nDecimals"].get<int>();
    }
  }
  return fina::StatusCode::Success;
}

json ToJson(const fina::FileMeta& meta) {
  return json::object({
    {"interval", meta.interval},
    {"start_time", meta.startTime},
    {"end_time", meta.endTime},
    {"npoints", meta.npoints},
    {"size", meta.size},
  });
}

json ToJson(const std::vector<fina::OutputRow>& rows) {
  json output = json::array();
  for (const auto& row : rows) {
    output.push_back(row);
  }
  return output;
}

int Run(const json& config, const std::string& source, const std::string& fileName,
        const fina::SearchQuery& query) {
  if (!config.contains("sources") || !config["sources"].contains(source)) {
    std::cerr << "! unknown data source \"" << source << "\"\n";
    return 1;
  }
  const auto dataDir = config["sources"][source].get<std::string>();

  fina::ReaderOptions options;
  if (auto status = ParseReaderOptions(config, &options); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  const fina::FinaData feed{fileName, dataDir, options};
  fina::FileMeta meta;
  if (auto status = feed.getMeta(&meta); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  std::vector<fina::OutputRow> rows;
  if (auto status = feed.getValues(query, &rows); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  const json output = json::object({
    {"meta", ToJson(meta)},
    {"columns", fina::ColumnNames(query.outputType)},
    {"rows", ToJson(rows)},
  });
  std::cout << output.dump(2) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc != 7) {
    std::cerr << "Usage: " << argv[0]
              << " <config.json> <source> <file_name> <start> <window> <interval>\n";
    return 1;
  }

  fina::SearchQuery query;
  if (!ParseTimestamp(argv[4], &query.startTime) || !ParseTimestamp(argv[5], &query.timeWindow) ||
      !ParseTimestamp(argv[6], &query.timeInterval)) {
    std::cerr << "! start, window and interval must be integers\n";
    return 1;
  }

  std::ifstream input(argv[1]);
  if (!input) {
    std::cerr << "! cannot open \"" << argv[1] << "\"\n";
    return 1;
  }
  const json config = json::parse(input, nullptr, false);
  if (config.is_discarded() || !config.is_object()) {
    std::cerr << "! \"" << argv[1] << "\" is not a JSON object\n";
    return 1;
  }

  try {
    QueryConfig queryConfig;
    if (auto status = ParseQueryConfig(config, &queryConfig); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      return 1;
    }
    query.outputType = queryConfig.outputType;
    query.outputAverage = queryConfig.outputAverage;
    query.timeRefStart = queryConfig.timeRefStart;
    query.minValue = queryConfig.minValue;
    query.maxValue = queryConfig.maxValue;
    query.nDecimals = queryConfig.nDecimals;

    return Run(config, argv[2], argv[3], query);
  } catch (const json::exception& e) {
    std::cerr << "! invalid configuration: " << e.what() << "\n";
    return 1;
  }
}
