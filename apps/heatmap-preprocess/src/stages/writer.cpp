#include "writer.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "../errors.hpp"

namespace heatmap {

namespace fs = std::filesystem;

void writeArtifact(const std::string& output_file, const std::string& artifact, Metrics& metrics) {
  const auto process_start = std::chrono::steady_clock::now();

  const fs::path target(output_file);
  std::error_code error;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), error);
    if (error) {
      throw OutputError("Failed to create output directory " + target.parent_path().string() + ": " + error.message());
    }
  }

  const fs::path staging(output_file + ".tmp");
  {
    std::ofstream output(staging, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
      throw OutputError("Failed to open output file: " + staging.string());
    }
    output.write(artifact.data(), static_cast<std::streamsize>(artifact.size()));
    output.close();
    if (!output) {
      fs::remove(staging, error);
      throw OutputError("Failed to write output file: " + staging.string());
    }
  }

  fs::rename(staging, target, error);
  if (error) {
    const std::string reason = error.message();
    fs::remove(staging, error);
    throw OutputError("Failed to move " + staging.string() + " to " + output_file + ": " + reason);
  }

  metrics.addWriterProcessing(elapsedMs(process_start));
}

} // namespace heatmap
