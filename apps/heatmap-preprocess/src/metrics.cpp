#include "metrics.hpp"

namespace heatmap {

namespace {

std::int64_t toMicros(double ms) {
  return static_cast<std::int64_t>(ms * 1000);
}

} // namespace

void Metrics::markStart() {
  start_ = std::chrono::steady_clock::now();
  started_ = true;
}

void Metrics::markEnd() {
  end_ = std::chrono::steady_clock::now();
  ended_ = true;
}

void Metrics::addRowsRead(std::int64_t rows) {
  rows_read_.fetch_add(rows, std::memory_order_relaxed);
}

void Metrics::addValid(std::int64_t rows) {
  valid_rows_.fetch_add(rows, std::memory_order_relaxed);
}

void Metrics::addExcluded(std::int64_t rows) {
  excluded_rows_.fetch_add(rows, std::memory_order_relaxed);
}

void Metrics::addConusFiltered(std::int64_t rows) {
  conus_filtered_rows_.fetch_add(rows, std::memory_order_relaxed);
}

void Metrics::addAggregated(std::int64_t records) {
  aggregated_records_.fetch_add(records, std::memory_order_relaxed);
}

void Metrics::incrementAttempts() {
  attempts_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::addReaderProcessing(double ms) {
  reader_processing_us_.fetch_add(toMicros(ms), std::memory_order_relaxed);
}

void Metrics::addNormalizerProcessing(double ms) {
  normalizer_processing_us_.fetch_add(toMicros(ms), std::memory_order_relaxed);
}

void Metrics::addAggregatorProcessing(double ms) {
  aggregator_processing_us_.fetch_add(toMicros(ms), std::memory_order_relaxed);
}

void Metrics::addSerializerProcessing(double ms) {
  serializer_processing_us_.fetch_add(toMicros(ms), std::memory_order_relaxed);
}

void Metrics::addWriterProcessing(double ms) {
  writer_processing_us_.fetch_add(toMicros(ms), std::memory_order_relaxed);
}

MetricsSnapshot Metrics::snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.rows_read = rows_read_.load(std::memory_order_relaxed);
  snapshot.valid_rows = valid_rows_.load(std::memory_order_relaxed);
  snapshot.excluded_rows = excluded_rows_.load(std::memory_order_relaxed);
  snapshot.conus_filtered_rows = conus_filtered_rows_.load(std::memory_order_relaxed);
  snapshot.aggregated_records = aggregated_records_.load(std::memory_order_relaxed);
  snapshot.attempts = attempts_.load(std::memory_order_relaxed);
  snapshot.reader_processing_ms = reader_processing_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.normalizer_processing_ms = normalizer_processing_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.aggregator_processing_ms = aggregator_processing_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.serializer_processing_ms = serializer_processing_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.writer_processing_ms = writer_processing_us_.load(std::memory_order_relaxed) / 1000.0;

  if (started_ && ended_) {
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(end_ - start_);
    snapshot.duration_sec = duration.count();
    if (snapshot.duration_sec > 0.0) {
      snapshot.records_per_sec = snapshot.aggregated_records / snapshot.duration_sec;
    }
  }

  return snapshot;
}

} // namespace heatmap
