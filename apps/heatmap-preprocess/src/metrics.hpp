#ifndef HEATMAP_PREPROCESS_METRICS_HPP
#define HEATMAP_PREPROCESS_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace heatmap {

struct MetricsSnapshot {
  std::int64_t rows_read = 0;
  std::int64_t valid_rows = 0;
  std::int64_t excluded_rows = 0;
  std::int64_t conus_filtered_rows = 0;
  std::int64_t aggregated_records = 0;
  std::int64_t attempts = 0;
  double records_per_sec = 0.0;
  double duration_sec = 0.0;
  double reader_processing_ms = 0.0;
  double normalizer_processing_ms = 0.0;
  double aggregator_processing_ms = 0.0;
  double serializer_processing_ms = 0.0;
  double writer_processing_ms = 0.0;
};

class Metrics {
 public:
  void markStart();
  void markEnd();

  void addRowsRead(std::int64_t rows);
  void addValid(std::int64_t rows);
  void addExcluded(std::int64_t rows);
  void addConusFiltered(std::int64_t rows);
  void addAggregated(std::int64_t records);
  void incrementAttempts();

  void addReaderProcessing(double ms);
  void addNormalizerProcessing(double ms);
  void addAggregatorProcessing(double ms);
  void addSerializerProcessing(double ms);
  void addWriterProcessing(double ms);

  MetricsSnapshot snapshot() const;

 private:
  std::atomic<std::int64_t> rows_read_{0};
  std::atomic<std::int64_t> valid_rows_{0};
  std::atomic<std::int64_t> excluded_rows_{0};
  std::atomic<std::int64_t> conus_filtered_rows_{0};
  std::atomic<std::int64_t> aggregated_records_{0};
  std::atomic<std::int64_t> attempts_{0};
  std::atomic<std::int64_t> reader_processing_us_{0};
  std::atomic<std::int64_t> normalizer_processing_us_{0};
  std::atomic<std::int64_t> aggregator_processing_us_{0};
  std::atomic<std::int64_t> serializer_processing_us_{0};
  std::atomic<std::int64_t> writer_processing_us_{0};
  std::chrono::steady_clock::time_point start_{};
  std::chrono::steady_clock::time_point end_{};
  bool started_ = false;
  bool ended_ = false;
};

// Milliseconds elapsed since `since`, for the add*Processing() calls.
inline double elapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
    std::chrono::steady_clock::now() - since
  ).count();
}

} // namespace heatmap

#endif
