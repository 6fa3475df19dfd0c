#include "reader.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "../errors.hpp"

namespace heatmap {

namespace {

std::string trim(const std::string& value) {
  const std::size_t start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const std::size_t end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

bool isBlank(const std::vector<std::string>& fields) {
  return fields.size() == 1 && trim(fields[0]).empty();
}

class CsvScanner {
 public:
  CsvScanner(const std::string& text, const std::string& source) : text_(text), source_(source) {
    // UTF-8 byte order mark written by spreadsheet exports.
    if (text_.compare(0, 3, "\xEF\xBB\xBF") == 0) {
      pos_ = 3;
    }
  }

  // Reads the next record into `fields`. Returns false at end of input.
  bool next(std::vector<std::string>& fields) {
    fields.clear();
    if (pos_ >= text_.size()) {
      return false;
    }

    record_line_ = line_;
    std::string field;
    bool in_quotes = false;
    bool was_quoted = false;

    while (pos_ < text_.size()) {
      const char c = text_[pos_++];

      if (in_quotes) {
        if (c == '"') {
          if (pos_ < text_.size() && text_[pos_] == '"') {
            field += '"';
            pos_ += 1;
          } else {
            in_quotes = false;
          }
        } else {
          if (c == '\n') {
            line_ += 1;
          }
          field += c;
        }
        continue;
      }

      if (c == '"' && !was_quoted && trim(field).empty()) {
        field.clear();
        in_quotes = true;
        was_quoted = true;
      } else if (c == ',') {
        fields.push_back(was_quoted ? field : trim(field));
        field.clear();
        was_quoted = false;
      } else if (c == '\n') {
        line_ += 1;
        fields.push_back(was_quoted ? field : trim(field));
        return true;
      } else if (c != '\r') {
        field += c;
      }
    }

    if (in_quotes) {
      std::ostringstream message;
      message << source_ << ":" << record_line_ << ": unterminated quoted field";
      throw InputError(message.str());
    }
    fields.push_back(was_quoted ? field : trim(field));
    return true;
  }

  std::size_t recordLine() const { return record_line_; }

 private:
  const std::string& text_;
  const std::string& source_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t record_line_ = 1;
};

} // namespace

Table parseCsv(const std::string& text, const std::string& source) {
  CsvScanner scanner(text, source);
  Table table;

  std::vector<std::string> fields;
  while (scanner.next(fields)) {
    if (!isBlank(fields)) {
      table.columns = fields;
      break;
    }
  }
  if (table.columns.empty()) {
    throw InputError(source + ": no header row");
  }

  while (scanner.next(fields)) {
    if (isBlank(fields)) {
      continue;
    }
    if (fields.size() > table.columns.size()) {
      std::ostringstream message;
      message << source << ":" << scanner.recordLine() << ": expected " << table.columns.size()
              << " fields, saw " << fields.size();
      throw InputError(message.str());
    }
    fields.resize(table.columns.size());
    table.rows.push_back(std::move(fields));
    fields = std::vector<std::string>();
  }

  return table;
}

Table readTable(const std::string& input_file, Metrics& metrics) {
  const auto process_start = std::chrono::steady_clock::now();

  std::ifstream input(input_file, std::ios::binary);
  if (!input.is_open()) {
    throw InputError("Failed to open input file: " + input_file);
  }

  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (input.bad()) {
    throw InputError("Failed to read input file: " + input_file);
  }

  Table table = parseCsv(buffer.str(), input_file);
  metrics.addRowsRead(static_cast<std::int64_t>(table.rows.size()));
  metrics.addReaderProcessing(elapsedMs(process_start));
  return table;
}

} // namespace heatmap
