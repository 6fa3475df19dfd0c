#include "aggregator.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>

#include "../errors.hpp"

namespace heatmap {

namespace {

struct CellStats {
  std::int64_t count = 0;
  double lat_sum = 0.0;
  double lon_sum = 0.0;
};

// Workers claim window indices from a shared cursor until the job list runs out.
void aggregatorThread(
  std::atomic<std::size_t>& cursor,
  const std::vector<std::size_t>& jobs,
  const std::vector<std::vector<Record>>& buckets,
  const std::vector<Window>& windows,
  const SpatialIndexer& indexer,
  const Resolution& resolution,
  std::vector<std::vector<Aggregate>>& results,
  std::exception_ptr& failure
) {
  for (std::size_t next = cursor.fetch_add(1, std::memory_order_relaxed); next < jobs.size();
       next = cursor.fetch_add(1, std::memory_order_relaxed)) {
    const std::size_t index = jobs[next];
    try {
      results[index] = aggregateWindow(buckets[index], windows[index], indexer, resolution);
    } catch (...) {
      // Rethrown by the coordinating thread once every worker has joined.
      failure = std::current_exception();
      return;
    }
  }
}

} // namespace

double roundCoordinate(double value) {
  return std::round(value * 1e6) / 1e6;
}

std::vector<Aggregate> aggregateWindow(
  const std::vector<Record>& records,
  const Window& window,
  const SpatialIndexer& indexer,
  const Resolution& resolution
) {
  std::unordered_map<std::string, CellStats> stats;
  for (const auto& record : records) {
    auto& entry = stats[indexer.cellFor(record.latitude, record.longitude, resolution)];
    entry.count += 1;
    entry.lat_sum += record.latitude;
    entry.lon_sum += record.longitude;
  }

  std::vector<Aggregate> aggregates;
  aggregates.reserve(stats.size());
  for (auto& [cell_id, value] : stats) {
    Aggregate aggregate;
    aggregate.window = window;
    aggregate.cell_id = cell_id;
    aggregate.count = value.count;
    aggregate.lat = roundCoordinate(value.lat_sum / value.count);
    aggregate.lon = roundCoordinate(value.lon_sum / value.count);
    aggregates.push_back(std::move(aggregate));
  }

  std::sort(aggregates.begin(), aggregates.end(), [](const Aggregate& lhs, const Aggregate& rhs) {
    return lhs.cell_id < rhs.cell_id;
  });
  return aggregates;
}

std::vector<Aggregate> aggregateWindows(
  const std::vector<std::vector<Record>>& buckets,
  const std::vector<Window>& windows,
  const SpatialIndexer& indexer,
  const Resolution& resolution,
  std::size_t workers,
  Metrics& metrics
) {
  if (buckets.size() != windows.size()) {
    throw std::invalid_argument("window buckets do not match window list");
  }

  const auto process_start = std::chrono::steady_clock::now();

  std::vector<std::size_t> jobs;
  for (std::size_t i = 0; i < windows.size(); i += 1) {
    if (!buckets[i].empty()) {
      jobs.push_back(i);
    }
  }

  const std::size_t thread_count = std::max<std::size_t>(1, std::min(workers, jobs.size()));
  std::vector<std::vector<Aggregate>> results(windows.size());
  std::vector<std::exception_ptr> failures(thread_count);
  std::atomic<std::size_t> cursor{0};

  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  try {
    for (std::size_t i = 0; i < thread_count; i += 1) {
      threads.emplace_back(
        aggregatorThread,
        std::ref(cursor),
        std::cref(jobs),
        std::cref(buckets),
        std::cref(windows),
        std::cref(indexer),
        std::cref(resolution),
        std::ref(results),
        std::ref(failures[i])
      );
    }
  } catch (const std::system_error& error) {
    // Started workers still drain the cursor; wait for them before failing.
    for (auto& thread : threads) {
      thread.join();
    }
    throw PipelineError(std::string("Failed to start aggregator worker: ") + error.what());
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (const auto& failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  std::vector<Aggregate> features;
  std::int64_t aggregated = 0;
  for (std::size_t i = 0; i < results.size(); i += 1) {
    aggregated += static_cast<std::int64_t>(buckets[i].size());
    features.insert(
      features.end(),
      std::make_move_iterator(results[i].begin()),
      std::make_move_iterator(results[i].end())
    );
  }

  metrics.addAggregated(aggregated);
  metrics.addAggregatorProcessing(elapsedMs(process_start));
  return features;
}

} // namespace heatmap
