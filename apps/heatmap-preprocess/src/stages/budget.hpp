#ifndef HEATMAP_PREPROCESS_BUDGET_HPP
#define HEATMAP_PREPROCESS_BUDGET_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../metrics.hpp"
#include "../types.hpp"
#include "indexer.hpp"

namespace heatmap {

struct BudgetConfig {
  double max_size_mb = 50.0;
  // Coarsest hex level the controller will step down to.
  int min_level = 5;
  // Largest bin size the controller will grow to.
  double max_bin_size = 0.2;
  int max_retries = 5;
};

enum class BudgetState { Aggregating, Measuring, Coarsening, Accepted, Done };

struct BudgetAttempt {
  Resolution resolution;
  std::size_t feature_count = 0;
  std::size_t size_bytes = 0;
};

struct BudgetOutcome {
  std::string artifact;
  RunMeta meta;
  std::size_t feature_count = 0;
  std::vector<BudgetAttempt> attempts;
  // Accepted over budget because no coarser resolution was left to try.
  bool exhausted = false;
};

class BudgetController {
 public:
  BudgetController(BudgetConfig config, std::size_t workers);

  std::size_t budgetBytes() const;

  // One step coarser than `current`, or std::nullopt when `current` already
  // sits at the floor (hex) or cap (grid). A starting resolution beyond the
  // configured floor/cap counts as the floor/cap itself.
  std::optional<Resolution> coarsen(const Resolution& current, const Resolution& start) const;

  // Aggregates at `start`, then coarsens until the serialized artifact fits
  // the budget or no coarser resolution remains. Never fails for size.
  BudgetOutcome run(
    const std::vector<std::vector<Record>>& buckets,
    const std::vector<Window>& windows,
    const SpatialIndexer& indexer,
    const Resolution& start,
    Metrics& metrics
  ) const;

 private:
  BudgetConfig config_;
  std::size_t workers_ = 1;
};

} // namespace heatmap

#endif
