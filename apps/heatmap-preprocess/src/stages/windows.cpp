#include "windows.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../errors.hpp"

namespace heatmap {

std::vector<Window> buildWindows(int min_year, int max_year, int window_length) {
  if (window_length < 1) {
    throw std::invalid_argument("window length must be at least 1, got " + std::to_string(window_length));
  }
  if (min_year > max_year) {
    throw InvalidRangeError(
      "Invalid year range " + std::to_string(min_year) + "-" + std::to_string(max_year) +
      ": no valid records to window"
    );
  }

  std::vector<Window> windows;
  int current = min_year;
  while (current <= max_year) {
    // Widened so a huge window length cannot overflow int.
    const long long candidate = static_cast<long long>(current) + window_length - 1;
    const int end = static_cast<int>(std::min<long long>(candidate, max_year));
    windows.push_back(Window{current, end});
    if (end == max_year) {
      break;
    }
    current = end + 1;
  }
  return windows;
}

std::optional<std::size_t> windowIndexFor(const std::vector<Window>& windows, int year) {
  const auto it = std::lower_bound(windows.begin(), windows.end(), year, [](const Window& window, int value) {
    return window.end < value;
  });
  if (it == windows.end() || it->start > year) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - windows.begin());
}

std::pair<int, int> yearRange(const std::vector<Record>& records) {
  if (records.empty()) {
    throw InvalidRangeError("No valid records remain after filtering");
  }
  int min_year = records.front().event_date.year;
  int max_year = min_year;
  for (const auto& record : records) {
    min_year = std::min(min_year, record.event_date.year);
    max_year = std::max(max_year, record.event_date.year);
  }
  return {min_year, max_year};
}

std::vector<std::vector<Record>> bucketByWindow(
  const std::vector<Record>& records,
  const std::vector<Window>& windows
) {
  std::vector<std::vector<Record>> buckets(windows.size());
  for (const auto& record : records) {
    if (const auto index = windowIndexFor(windows, record.event_date.year)) {
      buckets[*index].push_back(record);
    }
  }
  return buckets;
}

} // namespace heatmap
