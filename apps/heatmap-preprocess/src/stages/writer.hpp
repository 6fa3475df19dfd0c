#ifndef HEATMAP_PREPROCESS_WRITER_HPP
#define HEATMAP_PREPROCESS_WRITER_HPP

#include <string>

#include "../metrics.hpp"

namespace heatmap {

// Writes `artifact` to `output_file`, creating parent directories. The bytes
// go to "<output_file>.tmp" first and are renamed into place, so a failed run
// never leaves a truncated artifact behind. Throws OutputError.
void writeArtifact(const std::string& output_file, const std::string& artifact, Metrics& metrics);

} // namespace heatmap

#endif
