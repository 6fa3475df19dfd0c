#ifndef HEATMAP_PREPROCESS_DATES_HPP
#define HEATMAP_PREPROCESS_DATES_HPP

#include <optional>
#include <string>
#include <vector>

#include "../metrics.hpp"
#include "../types.hpp"
#include "columns.hpp"

namespace heatmap {

// Month and day used for values that only carry a year.
constexpr int kYearAnchorMonth = 7;
constexpr int kYearAnchorDay = 1;

bool isValidDate(int year, int month, int day);

// "1995" or "1995.0" -> 1995-07-01.
std::optional<Date> parseYear(const std::string& value);

// Tolerant parser over the common date layouts found in incident exports.
std::optional<Date> parseDate(const std::string& value);

// One entry per table row; std::nullopt marks a row whose date is unusable.
std::vector<std::optional<Date>> normalizeDates(
  const Table& table,
  const ResolvedColumns& columns,
  Metrics& metrics
);

} // namespace heatmap

#endif
