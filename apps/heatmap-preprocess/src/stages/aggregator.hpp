#ifndef HEATMAP_PREPROCESS_AGGREGATOR_HPP
#define HEATMAP_PREPROCESS_AGGREGATOR_HPP

#include <cstddef>
#include <vector>

#include "../metrics.hpp"
#include "../types.hpp"
#include "indexer.hpp"

namespace heatmap {

// Rounds half away from zero to 6 decimal places.
double roundCoordinate(double value);

// Groups one window's records by cell. Each aggregate carries the record
// count and the mean coordinate of its records; output is sorted by cell id.
std::vector<Aggregate> aggregateWindow(
  const std::vector<Record>& records,
  const Window& window,
  const SpatialIndexer& indexer,
  const Resolution& resolution
);

// Aggregates every window bucket on `workers` threads and concatenates the
// results in window order. `buckets[i]` holds the records of `windows[i]`.
std::vector<Aggregate> aggregateWindows(
  const std::vector<std::vector<Record>>& buckets,
  const std::vector<Window>& windows,
  const SpatialIndexer& indexer,
  const Resolution& resolution,
  std::size_t workers,
  Metrics& metrics
);

} // namespace heatmap

#endif
