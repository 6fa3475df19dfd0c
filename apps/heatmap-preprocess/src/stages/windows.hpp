#ifndef HEATMAP_PREPROCESS_WINDOWS_HPP
#define HEATMAP_PREPROCESS_WINDOWS_HPP

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "../types.hpp"

namespace heatmap {

// Splits [min_year, max_year] into consecutive windows of `window_length`
// years; the last window takes whatever remains. Throws InvalidRangeError when
// min_year > max_year and std::invalid_argument when window_length < 1.
std::vector<Window> buildWindows(int min_year, int max_year, int window_length);

// Index of the window containing `year`, if any.
std::optional<std::size_t> windowIndexFor(const std::vector<Window>& windows, int year);

// Smallest and largest event year. Throws InvalidRangeError for an empty set.
std::pair<int, int> yearRange(const std::vector<Record>& records);

// Records grouped by the window their event year falls in, one bucket per window.
std::vector<std::vector<Record>> bucketByWindow(
  const std::vector<Record>& records,
  const std::vector<Window>& windows
);

} // namespace heatmap

#endif
