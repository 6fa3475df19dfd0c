#include "coordinator.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "errors.hpp"
#include "stages/columns.hpp"
#include "stages/dates.hpp"
#include "stages/indexer.hpp"
#include "stages/reader.hpp"
#include "stages/records.hpp"
#include "stages/serializer.hpp"
#include "stages/windows.hpp"
#include "stages/writer.hpp"

namespace heatmap {

PipelineCoordinator::PipelineCoordinator(PipelineConfig config) : config_(std::move(config)) {}

BudgetOutcome PipelineCoordinator::buildArtifact(Metrics& metrics) const {
  std::cout << "Loading data from " << config_.input_file << "...\n";
  const Table table = readTable(config_.input_file, metrics);
  std::cout << "Loaded " << table.rows.size() << " rows\n";

  const ResolvedColumns columns = resolveColumns(table.columns);
  std::cout << "Using columns: lat=" << columns.latitude.name << ", lon=" << columns.longitude.name
            << ", date=" << columns.date.name << "\n";

  const auto dates = normalizeDates(table, columns, metrics);
  std::vector<Record> records = filterRecords(table, columns, dates, metrics);
  std::cout << "Valid rows: " << records.size() << " (" << (table.rows.size() - records.size())
            << " rows excluded)\n";

  const auto [min_year, max_year] = yearRange(records);
  const std::vector<Window> windows = buildWindows(min_year, max_year, config_.years_per_window);
  std::cout << "Created " << windows.size() << " time windows: " << min_year << "-" << max_year << "\n";

  if (config_.conus_only) {
    const std::size_t dropped = filterConus(records);
    metrics.addConusFiltered(static_cast<std::int64_t>(dropped));
    std::cout << "Filtered to CONUS: " << records.size() << " rows\n";
  }

  const SpatialIndexer indexer = SpatialIndexer::create(config_.grid);
  Resolution start;
  start.grid = indexer.grid();
  start.level = config_.h3_resolution;
  start.bin_size = config_.bin_size;

  const auto buckets = bucketByWindow(records, windows);

  std::cout << "Aggregating incidents...\n";
  const BudgetController controller(config_.budget, config_.workers);
  return controller.run(buckets, windows, indexer, start, metrics);
}

RunReport PipelineCoordinator::execute(Metrics& metrics) const {
  metrics.markStart();

  const BudgetOutcome outcome = buildArtifact(metrics);
  writeArtifact(config_.output_file, outcome.artifact, metrics);

  metrics.markEnd();

  RunReport report;
  report.grid = outcome.meta.resolution.grid;
  report.resolution = outcome.meta.resolution;
  report.window_count = outcome.meta.windows.size();
  report.feature_count = outcome.feature_count;
  report.size_bytes = outcome.artifact.size();
  report.attempts = outcome.attempts.size();
  report.exhausted = outcome.exhausted;
  return report;
}

int PipelineCoordinator::run(Metrics& metrics) const {
  try {
    const RunReport report = execute(metrics);
    const std::string resolution = report.grid == GridType::Hex ? std::to_string(report.resolution.level)
                                                                : formatFloat(report.resolution.bin_size);
    std::ostringstream size;
    size << std::fixed << std::setprecision(1) << report.size_bytes / (1024.0 * 1024.0) << "MB";

    std::cout << "Output written to " << config_.output_file << "\n"
              << "Final size: " << size.str() << (report.exhausted ? " (over budget)" : "") << "\n"
              << "Features: " << report.feature_count << "\n"
              << "Windows: " << report.window_count << "\n"
              << "Grid: " << gridName(report.grid) << " (resolution: " << resolution << ")\n";
    return 0;
  } catch (const PipelineError& error) {
    std::cerr << "Error: " << error.what() << "\n";
    metrics.markEnd();
    return 1;
  }
}

} // namespace heatmap
