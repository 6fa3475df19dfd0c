#ifndef HEATMAP_PREPROCESS_INDEXER_HPP
#define HEATMAP_PREPROCESS_INDEXER_HPP

#include <string>
#include <variant>

#include "../types.hpp"

namespace heatmap {

constexpr int kMinHexLevel = 0;
constexpr int kMaxHexLevel = 15;

// Grid keys print one decimal place, so finer bins would share keys.
constexpr double kMinBinSize = 0.1;

// H3 hexagonal cells. The cell at `level` is taken as the ancestor of the
// finest cell holding the point, so cells at level n - 1 are exact unions of
// cells at level n.
class HexIndexer {
 public:
  // False when the binary was built without the H3 library.
  static bool available();

  std::string cellFor(double lat, double lon, int level) const;
};

// Uniform decimal-degree grid keyed "{binLat}_{binLon}" with one decimal place.
class GridIndexer {
 public:
  std::string cellFor(double lat, double lon, double bin_size) const;
};

class SpatialIndexer {
 public:
  explicit SpatialIndexer(HexIndexer hex) : strategy_(hex) {}
  explicit SpatialIndexer(GridIndexer grid) : strategy_(grid) {}

  // Picks the requested strategy, falling back to the grid when H3 is
  // unavailable. The fallback is logged, not an error.
  static SpatialIndexer create(GridType requested);

  GridType grid() const;

  std::string cellFor(double lat, double lon, const Resolution& resolution) const;

 private:
  std::variant<HexIndexer, GridIndexer> strategy_;
};

} // namespace heatmap

#endif
