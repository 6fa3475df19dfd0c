#ifndef HEATMAP_PREPROCESS_SERIALIZER_HPP
#define HEATMAP_PREPROCESS_SERIALIZER_HPP

#include <string>
#include <vector>

#include "../types.hpp"

namespace heatmap {

// Shortest decimal form (up to 15 significant digits) that always keeps a
// decimal point, so JSON readers see a float: 0.1, 40.7128, 1.0.
std::string formatFloat(double value);

// Compact JSON artifact: {"meta":{...},"features":[...]}. Hex runs key each
// feature's cell as "c", grid runs as "bin_id".
std::string serializeArtifact(const RunMeta& meta, const std::vector<Aggregate>& features);

} // namespace heatmap

#endif
