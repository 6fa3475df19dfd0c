#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "coordinator.hpp"
#include "metrics.hpp"
#include "stages/indexer.hpp"

namespace {

void printUsage() {
  std::cout
    << "Usage: heatmap-preprocess --csv <file> [options]\n\n"
    << "Aggregates point events into year windows and spatial cells as a size-bounded JSON artifact.\n\n"
    << "Options:\n"
    << "  --csv <file>             Input CSV (alias: --input)\n"
    << "  --out <file>             Output JSON file (default: dist/aggregates.json, alias: --output)\n"
    << "  --grid <h3|bin>          Spatial grid (default: h3, falls back to bin without H3)\n"
    << "  --h3-res <level>         Starting H3 resolution, 0-15 (default: 6)\n"
    << "  --h3-min-res <level>     Coarsest H3 resolution when shrinking output (default: 5)\n"
    << "  --bin-size <degrees>     Starting bin size, at least 0.1 (default: 0.1)\n"
    << "  --bin-max-size <degrees> Largest bin size when shrinking output (default: 0.2)\n"
    << "  --years-per-window <n>   Years per time window (default: 3)\n"
    << "  --conus-only             Keep only points in the continental US\n"
    << "  --max-size-mb <mb>       Maximum output size in MB (default: 50)\n"
    << "  --max-retries <n>        Coarsening attempts before giving up (default: 5)\n"
    << "  --workers <number>       Aggregator threads (default: CPU count)\n"
    << "  -h, --help               Show this help message\n";
}

bool parseSize(const std::string& value, std::size_t& out) {
  char* end = nullptr;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str() || *end != '\0' || parsed <= 0) {
    return false;
  }
  out = static_cast<std::size_t>(parsed);
  return true;
}

bool parseInt(const std::string& value, int min, int max, int& out) {
  char* end = nullptr;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str() || *end != '\0' || parsed < min || parsed > max) {
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

bool parsePositive(const std::string& value, double& out) {
  char* end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end == value.c_str() || *end != '\0' || !std::isfinite(parsed) || parsed <= 0.0) {
    return false;
  }
  out = parsed;
  return true;
}

bool takeValue(int argc, char** argv, int& i, const std::string& arg, std::string& value, std::string& error) {
  if (i + 1 >= argc) {
    error = "Missing value for " + arg;
    return false;
  }
  value = argv[i + 1];
  i += 1;
  return true;
}

bool parseArguments(int argc, char** argv, heatmap::PipelineConfig& config, std::string& error) {
  for (int i = 1; i < argc; i += 1) {
    const std::string arg = argv[i];
    std::string value;

    if (arg == "--help" || arg == "-h") {
      printUsage();
      std::exit(0);
    }

    if (arg == "--conus-only") {
      config.conus_only = true;
      continue;
    }

    if (arg == "--csv" || arg == "--input") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      config.input_file = value;
      continue;
    }

    if (arg == "--out" || arg == "--output") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      config.output_file = value;
      continue;
    }

    if (arg == "--grid") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      if (value == "h3") {
        config.grid = heatmap::GridType::Hex;
      } else if (value == "bin") {
        config.grid = heatmap::GridType::Bin;
      } else {
        error = "Invalid value for --grid (expected h3 or bin): " + value;
        return false;
      }
      continue;
    }

    if (arg == "--h3-res" || arg == "--h3-min-res") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      int level = 0;
      if (!parseInt(value, heatmap::kMinHexLevel, heatmap::kMaxHexLevel, level)) {
        error = "Invalid value for " + arg;
        return false;
      }
      if (arg == "--h3-res") {
        config.h3_resolution = level;
      } else {
        config.budget.min_level = level;
      }
      continue;
    }

    if (arg == "--bin-size" || arg == "--bin-max-size" || arg == "--max-size-mb") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      double number = 0.0;
      if (!parsePositive(value, number)) {
        error = "Invalid value for " + arg;
        return false;
      }
      if (arg != "--max-size-mb" && number < heatmap::kMinBinSize) {
        error = arg + " must be at least 0.1 degrees";
        return false;
      }
      if (arg == "--bin-size") {
        config.bin_size = number;
      } else if (arg == "--bin-max-size") {
        config.budget.max_bin_size = number;
      } else {
        config.budget.max_size_mb = number;
      }
      continue;
    }

    if (arg == "--years-per-window") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      std::size_t years = 0;
      if (!parseSize(value, years) || years > 10000) {
        error = "Invalid value for --years-per-window";
        return false;
      }
      config.years_per_window = static_cast<int>(years);
      continue;
    }

    if (arg == "--max-retries") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      if (!parseInt(value, 0, 64, config.budget.max_retries)) {
        error = "Invalid value for --max-retries";
        return false;
      }
      continue;
    }

    if (arg == "--workers") {
      if (!takeValue(argc, argv, i, arg, value, error)) {
        return false;
      }
      std::size_t workers = 0;
      if (!parseSize(value, workers)) {
        error = "Invalid value for --workers";
        return false;
      }
      config.workers = workers;
      continue;
    }

    error = "Unknown argument: " + arg;
    return false;
  }

  if (config.input_file.empty()) {
    error = "Input file is required (--csv)";
    return false;
  }

  return true;
}

} // namespace

int main(int argc, char** argv) {
  heatmap::PipelineConfig config;

  const unsigned int hardware_threads = std::thread::hardware_concurrency();
  config.workers = hardware_threads > 0 ? hardware_threads : 4;

  std::string error;
  if (!parseArguments(argc, argv, config, error)) {
    std::cerr << error << "\n\n";
    printUsage();
    return 1;
  }

  heatmap::Metrics metrics;
  const heatmap::PipelineCoordinator coordinator(config);
  const int result = coordinator.run(metrics);

  const heatmap::MetricsSnapshot snapshot = metrics.snapshot();
  const double total_processing = snapshot.reader_processing_ms + snapshot.normalizer_processing_ms +
                                  snapshot.aggregator_processing_ms + snapshot.serializer_processing_ms +
                                  snapshot.writer_processing_ms;

  std::cout << "\n=== Run Summary ===\n"
            << "Rows read: " << snapshot.rows_read << "\n"
            << "Valid rows: " << snapshot.valid_rows << "\n"
            << "Rows excluded: " << snapshot.excluded_rows << "\n"
            << "Outside CONUS: " << snapshot.conus_filtered_rows << "\n"
            << "Aggregation attempts: " << snapshot.attempts << "\n"
            << "Duration: " << snapshot.duration_sec << " sec\n"
            << "Throughput: " << snapshot.records_per_sec << " records/sec\n";

  if (total_processing > 0) {
    std::cout << "\n=== Time Breakdown ===\n"
              << "Reader: " << snapshot.reader_processing_ms << "ms "
              << "(" << (snapshot.reader_processing_ms / total_processing * 100) << "%)\n"
              << "Normalizer: " << snapshot.normalizer_processing_ms << "ms "
              << "(" << (snapshot.normalizer_processing_ms / total_processing * 100) << "%)\n"
              << "Aggregator: " << snapshot.aggregator_processing_ms << "ms "
              << "(" << (snapshot.aggregator_processing_ms / total_processing * 100) << "%)\n"
              << "Serializer: " << snapshot.serializer_processing_ms << "ms "
              << "(" << (snapshot.serializer_processing_ms / total_processing * 100) << "%)\n"
              << "Writer: " << snapshot.writer_processing_ms << "ms "
              << "(" << (snapshot.writer_processing_ms / total_processing * 100) << "%)\n";
  }

  return result;
}
