#ifndef HEATMAP_PREPROCESS_COORDINATOR_HPP
#define HEATMAP_PREPROCESS_COORDINATOR_HPP

#include <cstddef>
#include <string>

#include "metrics.hpp"
#include "stages/budget.hpp"
#include "types.hpp"

namespace heatmap {

struct PipelineConfig {
  std::string input_file;
  std::string output_file = "dist/aggregates.json";
  GridType grid = GridType::Hex;
  int h3_resolution = 6;
  double bin_size = 0.1;
  int years_per_window = 3;
  bool conus_only = false;
  BudgetConfig budget;
  std::size_t workers = 0;
};

struct RunReport {
  GridType grid = GridType::Hex;
  Resolution resolution;
  std::size_t window_count = 0;
  std::size_t feature_count = 0;
  std::size_t size_bytes = 0;
  std::size_t attempts = 0;
  bool exhausted = false;
};

class PipelineCoordinator {
 public:
  explicit PipelineCoordinator(PipelineConfig config);

  // Full run: load, aggregate within budget, write. Throws PipelineError.
  RunReport execute(Metrics& metrics) const;

  // execute() with fatal errors reported on stderr. Returns the exit code.
  int run(Metrics& metrics) const;

  // Everything except the final write; the artifact is returned instead.
  BudgetOutcome buildArtifact(Metrics& metrics) const;

 private:
  PipelineConfig config_;
};

} // namespace heatmap

#endif
