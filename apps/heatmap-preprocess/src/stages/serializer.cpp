#include "serializer.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <locale>
#include <sstream>

namespace heatmap {

namespace {

void writeJsonString(std::ostream& output, const std::string& value) {
  output << '"';
  for (const char c : value) {
    switch (c) {
      case '"':
        output << "\\\"";
        break;
      case '\\':
        output << "\\\\";
        break;
      case '\n':
        output << "\\n";
        break;
      case '\r':
        output << "\\r";
        break;
      case '\t':
        output << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char escaped[8];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned>(c));
          output << escaped;
        } else {
          output << c;
        }
    }
  }
  output << '"';
}

void writeWindow(std::ostream& output, const Window& window) {
  output << "{\"start\":" << window.start << ",\"end\":" << window.end << "}";
}

void writeFeature(std::ostream& output, const Aggregate& feature, GridType grid) {
  output << "{\"w\":[" << feature.window.start << "," << feature.window.end << "]"
         << ",\"lat\":" << formatFloat(feature.lat)
         << ",\"lon\":" << formatFloat(feature.lon)
         << ",\"n\":" << feature.count
         << (grid == GridType::Hex ? ",\"c\":" : ",\"bin_id\":");
  writeJsonString(output, feature.cell_id);
  output << "}";
}

} // namespace

std::string formatFloat(double value) {
  if (!std::isfinite(value)) {
    // JSON has no NaN/Infinity; never produced by validated records.
    return "null";
  }
  std::ostringstream output;
  output.imbue(std::locale::classic());
  output << std::setprecision(15) << value;
  std::string text = output.str();
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

std::string serializeArtifact(const RunMeta& meta, const std::vector<Aggregate>& features) {
  std::ostringstream output;
  output.imbue(std::locale::classic());

  output << "{\"meta\":{\"grid\":\"" << gridName(meta.resolution.grid) << "\",\"resolution\":";
  if (meta.resolution.grid == GridType::Hex) {
    output << meta.resolution.level;
  } else {
    output << formatFloat(meta.resolution.bin_size);
  }

  output << ",\"windows\":[";
  for (std::size_t i = 0; i < meta.windows.size(); i += 1) {
    if (i > 0) {
      output << ",";
    }
    writeWindow(output, meta.windows[i]);
  }
  output << "]},\"features\":[";

  for (std::size_t i = 0; i < features.size(); i += 1) {
    if (i > 0) {
      output << ",";
    }
    writeFeature(output, features[i], meta.resolution.grid);
  }
  output << "]}";

  return output.str();
}

} // namespace heatmap
