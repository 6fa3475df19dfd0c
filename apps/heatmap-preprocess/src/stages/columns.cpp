#include "columns.hpp"

#include <algorithm>

#include "../errors.hpp"

namespace heatmap {

namespace {

constexpr const char* kYearAlias = "year";

ResolvedColumn resolveField(
  const std::vector<std::string>& columns,
  const std::string& field,
  const std::vector<std::string>& aliases
) {
  for (const auto& alias : aliases) {
    const auto it = std::find(columns.begin(), columns.end(), alias);
    if (it != columns.end()) {
      return ResolvedColumn{alias, static_cast<std::size_t>(it - columns.begin())};
    }
  }

  std::string tried;
  for (const auto& alias : aliases) {
    if (!tried.empty()) {
      tried += ", ";
    }
    tried += alias;
  }
  throw MissingColumnError(field, "Could not find " + field + " column. Expected one of: " + tried);
}

} // namespace

const std::vector<std::string>& latitudeAliases() {
  static const std::vector<std::string> aliases = {"lat", "latitude", "Latitude", "LAT", "y"};
  return aliases;
}

const std::vector<std::string>& longitudeAliases() {
  static const std::vector<std::string> aliases = {"lon", "lng", "longitude", "Longitude", "LON", "x"};
  return aliases;
}

const std::vector<std::string>& dateAliases() {
  static const std::vector<std::string> aliases = {"date", "incident_date", "Date", "DATE", kYearAlias};
  return aliases;
}

ResolvedColumns resolveColumns(const std::vector<std::string>& columns) {
  ResolvedColumns resolved;
  resolved.latitude = resolveField(columns, "latitude", latitudeAliases());
  resolved.longitude = resolveField(columns, "longitude", longitudeAliases());
  resolved.date = resolveField(columns, "date", dateAliases());
  resolved.year_only = resolved.date.name == kYearAlias;
  return resolved;
}

} // namespace heatmap
