#ifndef HEATMAP_PREPROCESS_RECORDS_HPP
#define HEATMAP_PREPROCESS_RECORDS_HPP

#include <optional>
#include <string>
#include <vector>

#include "../metrics.hpp"
#include "../types.hpp"
#include "columns.hpp"

namespace heatmap {

// Continental US bounding box.
constexpr double kConusMinLat = 24.0;
constexpr double kConusMaxLat = 50.0;
constexpr double kConusMinLon = -125.0;
constexpr double kConusMaxLon = -66.0;

// Parses a coordinate cell. std::nullopt for empty, non-numeric or non-finite text.
std::optional<double> parseCoordinate(const std::string& value);

bool isValidCoordinate(double latitude, double longitude);

bool isInConus(const Record& record);

// Keeps rows with a usable date and in-range coordinates. Rejected rows are
// only counted (Metrics::addExcluded), never reported individually.
std::vector<Record> filterRecords(
  const Table& table,
  const ResolvedColumns& columns,
  const std::vector<std::optional<Date>>& dates,
  Metrics& metrics
);

// Drops records outside the continental US; returns how many were dropped.
std::size_t filterConus(std::vector<Record>& records);

} // namespace heatmap

#endif
