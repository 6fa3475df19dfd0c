#ifndef HEATMAP_PREPROCESS_READER_HPP
#define HEATMAP_PREPROCESS_READER_HPP

#include <string>

#include "../metrics.hpp"
#include "../types.hpp"

namespace heatmap {

// Loads a whole CSV file. The first record is the header. Throws InputError
// when the file cannot be opened, has no header, or is malformed.
Table readTable(const std::string& input_file, Metrics& metrics);

// Parses CSV text already in memory. `source` only labels error messages.
Table parseCsv(const std::string& text, const std::string& source);

} // namespace heatmap

#endif
