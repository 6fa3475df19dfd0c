#ifndef HEATMAP_PREPROCESS_TYPES_HPP
#define HEATMAP_PREPROCESS_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace heatmap {

struct Table {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
};

struct Date {
  int year = 0;
  int month = 0;
  int day = 0;
};

struct Record {
  double latitude = 0.0;
  double longitude = 0.0;
  Date event_date;
};

struct Window {
  int start = 0;
  int end = 0;
};

inline bool operator==(const Window& lhs, const Window& rhs) {
  return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const Window& lhs, const Window& rhs) {
  return !(lhs == rhs);
}

enum class GridType { Hex, Bin };

// Wire name used in the artifact.
inline const char* gridName(GridType grid) {
  return grid == GridType::Hex ? "h3" : "bin";
}

struct Resolution {
  GridType grid = GridType::Hex;
  int level = 6;
  double bin_size = 0.1;
};

struct Aggregate {
  Window window;
  std::string cell_id;
  double lat = 0.0;
  double lon = 0.0;
  std::int64_t count = 0;
};

struct RunMeta {
  Resolution resolution;
  std::vector<Window> windows;
};

} // namespace heatmap

#endif
