#include "budget.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "aggregator.hpp"
#include "serializer.hpp"

namespace heatmap {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

std::string formatMb(double mb) {
  std::ostringstream output;
  output << std::fixed << std::setprecision(1) << mb << "MB";
  return output.str();
}

std::string describe(const Resolution& resolution) {
  if (resolution.grid == GridType::Hex) {
    return "H3 resolution " + std::to_string(resolution.level);
  }
  return "bin size " + formatFloat(resolution.bin_size);
}

} // namespace

BudgetController::BudgetController(BudgetConfig config, std::size_t workers)
    : config_(std::move(config)), workers_(std::max<std::size_t>(1, workers)) {}

std::size_t BudgetController::budgetBytes() const {
  return static_cast<std::size_t>(std::max(0.0, config_.max_size_mb) * kBytesPerMb);
}

std::optional<Resolution> BudgetController::coarsen(const Resolution& current, const Resolution& start) const {
  Resolution next = current;
  if (current.grid == GridType::Hex) {
    const int floor = std::min(config_.min_level, start.level);
    if (current.level <= floor) {
      return std::nullopt;
    }
    next.level = std::max(floor, current.level - 1);
    return next;
  }

  const double cap = std::max(config_.max_bin_size, start.bin_size);
  if (current.bin_size >= cap) {
    return std::nullopt;
  }
  next.bin_size = std::min(cap, current.bin_size * 2);
  return next;
}

BudgetOutcome BudgetController::run(
  const std::vector<std::vector<Record>>& buckets,
  const std::vector<Window>& windows,
  const SpatialIndexer& indexer,
  const Resolution& start,
  Metrics& metrics
) const {
  BudgetOutcome outcome;
  outcome.meta.windows = windows;

  Resolution resolution = start;
  resolution.grid = indexer.grid();
  const std::size_t budget = budgetBytes();

  std::vector<Aggregate> features;
  int retries = 0;
  BudgetState state = BudgetState::Aggregating;

  while (state != BudgetState::Done) {
    switch (state) {
      case BudgetState::Aggregating: {
        metrics.incrementAttempts();
        features = aggregateWindows(buckets, windows, indexer, resolution, workers_, metrics);
        state = BudgetState::Measuring;
        break;
      }

      case BudgetState::Measuring: {
        const auto serialize_start = std::chrono::steady_clock::now();
        outcome.meta.resolution = resolution;
        outcome.artifact = serializeArtifact(outcome.meta, features);
        outcome.feature_count = features.size();
        outcome.attempts.push_back(BudgetAttempt{resolution, features.size(), outcome.artifact.size()});
        metrics.addSerializerProcessing(elapsedMs(serialize_start));

        if (outcome.artifact.size() <= budget) {
          state = BudgetState::Accepted;
        } else {
          std::cout << "Output size " << formatMb(outcome.artifact.size() / kBytesPerMb) << " exceeds limit "
                    << formatMb(config_.max_size_mb) << " at " << describe(resolution) << "\n";
          state = BudgetState::Coarsening;
        }
        break;
      }

      case BudgetState::Coarsening: {
        std::optional<Resolution> next;
        if (retries < config_.max_retries) {
          next = coarsen(resolution, start);
        }
        if (!next) {
          outcome.exhausted = true;
          std::cerr << "Warning: output size " << formatMb(outcome.artifact.size() / kBytesPerMb)
                    << " still exceeds limit " << formatMb(config_.max_size_mb) << " at " << describe(resolution)
                    << " after " << retries << " retries; keeping the oversized result\n";
          state = BudgetState::Accepted;
          break;
        }
        resolution = *next;
        retries += 1;
        std::cout << "Retrying with " << describe(resolution) << "\n";
        state = BudgetState::Aggregating;
        break;
      }

      case BudgetState::Accepted:
        state = BudgetState::Done;
        break;

      case BudgetState::Done:
        break;
    }
  }

  return outcome;
}

} // namespace heatmap
