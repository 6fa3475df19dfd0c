#ifndef HEATMAP_PREPROCESS_COLUMNS_HPP
#define HEATMAP_PREPROCESS_COLUMNS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace heatmap {

// Candidate header names per logical field, highest priority first.
const std::vector<std::string>& latitudeAliases();
const std::vector<std::string>& longitudeAliases();
const std::vector<std::string>& dateAliases();

struct ResolvedColumn {
  std::string name;
  std::size_t index = 0;
};

struct ResolvedColumns {
  ResolvedColumn latitude;
  ResolvedColumn longitude;
  ResolvedColumn date;
  // The date field holds bare years rather than full dates.
  bool year_only = false;
};

// First alias (in priority order) present in `columns` wins for each field.
// Throws MissingColumnError when a field has no match.
ResolvedColumns resolveColumns(const std::vector<std::string>& columns);

} // namespace heatmap

#endif
