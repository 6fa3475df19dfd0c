#include "records.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace heatmap {

std::optional<double> parseCoordinate(const std::string& value) {
  const std::size_t start = value.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const char* begin = value.c_str() + start;
  char* end = nullptr;
  const double parsed = std::strtod(begin, &end);
  if (end == begin) {
    return std::nullopt;
  }
  while (*end == ' ' || *end == '\t') {
    end += 1;
  }
  if (*end != '\0' || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

bool isValidCoordinate(double latitude, double longitude) {
  return latitude >= -90.0 && latitude <= 90.0 && longitude >= -180.0 && longitude <= 180.0;
}

bool isInConus(const Record& record) {
  return record.latitude >= kConusMinLat && record.latitude <= kConusMaxLat &&
         record.longitude >= kConusMinLon && record.longitude <= kConusMaxLon;
}

std::vector<Record> filterRecords(
  const Table& table,
  const ResolvedColumns& columns,
  const std::vector<std::optional<Date>>& dates,
  Metrics& metrics
) {
  const auto process_start = std::chrono::steady_clock::now();

  std::vector<Record> records;
  records.reserve(table.rows.size());
  std::int64_t excluded = 0;

  for (std::size_t i = 0; i < table.rows.size(); i += 1) {
    const auto& row = table.rows[i];
    const auto latitude = parseCoordinate(row[columns.latitude.index]);
    const auto longitude = parseCoordinate(row[columns.longitude.index]);
    if (!dates[i] || !latitude || !longitude || !isValidCoordinate(*latitude, *longitude)) {
      excluded += 1;
      continue;
    }
    records.push_back(Record{*latitude, *longitude, *dates[i]});
  }

  metrics.addValid(static_cast<std::int64_t>(records.size()));
  metrics.addExcluded(excluded);
  metrics.addNormalizerProcessing(elapsedMs(process_start));
  return records;
}

std::size_t filterConus(std::vector<Record>& records) {
  const std::size_t before = records.size();
  records.erase(
    std::remove_if(records.begin(), records.end(), [](const Record& record) { return !isInConus(record); }),
    records.end()
  );
  return before - records.size();
}

} // namespace heatmap
