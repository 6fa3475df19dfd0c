#include "indexer.hpp"

#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>

#include "../errors.hpp"

#ifdef HEATMAP_HAVE_H3
#include <h3api.h>
#endif

namespace heatmap {

namespace {

// Keeps exact multiples of the bin size (40.7 / 0.1 == 406.999...) in their own bin.
constexpr double kBinEpsilon = 1e-9;

double binFloor(double value, double bin_size) {
  // + 0.0 folds -0.0 so the key never reads "-0.0".
  return std::floor(value / bin_size + kBinEpsilon) * bin_size + 0.0;
}

} // namespace

bool HexIndexer::available() {
#ifdef HEATMAP_HAVE_H3
  return true;
#else
  return false;
#endif
}

std::string HexIndexer::cellFor(double lat, double lon, int level) const {
  if (level < kMinHexLevel || level > kMaxHexLevel) {
    throw PipelineError("H3 resolution out of range: " + std::to_string(level));
  }
#ifdef HEATMAP_HAVE_H3
  LatLng point;
  point.lat = degsToRads(lat);
  point.lng = degsToRads(lon);

  H3Index finest = 0;
  if (latLngToCell(&point, kMaxHexLevel, &finest) != E_SUCCESS) {
    throw PipelineError("H3 could not index point " + std::to_string(lat) + "," + std::to_string(lon));
  }
  H3Index cell = finest;
  if (level < kMaxHexLevel && cellToParent(finest, level, &cell) != E_SUCCESS) {
    throw PipelineError("H3 could not coarsen cell to resolution " + std::to_string(level));
  }

  char buffer[17] = {};
  if (h3ToString(cell, buffer, sizeof(buffer)) != E_SUCCESS) {
    throw PipelineError("H3 could not format cell index");
  }
  return buffer;
#else
  (void)lat;
  (void)lon;
  throw PipelineError("H3 support is not available in this build");
#endif
}

std::string GridIndexer::cellFor(double lat, double lon, double bin_size) const {
  if (!(bin_size > 0.0)) {
    throw PipelineError("Bin size must be positive, got " + std::to_string(bin_size));
  }
  if (bin_size + kBinEpsilon < kMinBinSize) {
    throw PipelineError("Bin size must be at least 0.1 degrees, got " + std::to_string(bin_size));
  }
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.1f_%.1f", binFloor(lat, bin_size), binFloor(lon, bin_size));
  return buffer;
}

SpatialIndexer SpatialIndexer::create(GridType requested) {
  if (requested == GridType::Hex) {
    if (HexIndexer::available()) {
      return SpatialIndexer(HexIndexer{});
    }
    std::cout << "H3 not available, switching to bin grid\n";
  }
  return SpatialIndexer(GridIndexer{});
}

GridType SpatialIndexer::grid() const {
  return std::holds_alternative<HexIndexer>(strategy_) ? GridType::Hex : GridType::Bin;
}

std::string SpatialIndexer::cellFor(double lat, double lon, const Resolution& resolution) const {
  if (const auto* hex = std::get_if<HexIndexer>(&strategy_)) {
    return hex->cellFor(lat, lon, resolution.level);
  }
  return std::get<GridIndexer>(strategy_).cellFor(lat, lon, resolution.bin_size);
}

} // namespace heatmap
