#include "dates.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace heatmap {

namespace {

constexpr int kMinYear = 1;
constexpr int kMaxYear = 9999;

// Tried in order; the first layout that consumes the whole value wins.
constexpr std::array<const char*, 14> kDateFormats = {
  "%Y-%m-%d",
  "%Y-%m-%dT%H:%M:%S",
  "%Y-%m-%d %H:%M:%S",
  "%Y-%m-%d %H:%M",
  "%Y/%m/%d",
  "%m/%d/%Y",
  "%m/%d/%Y %H:%M:%S",
  "%m/%d/%Y %H:%M",
  "%m-%d-%Y",
  "%d %B %Y",
  "%B %d, %Y",
  "%B %d %Y",
  "%d-%b-%Y",
  "%d.%m.%Y",
};

std::string trim(const std::string& value) {
  const std::size_t start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const std::size_t end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

bool isMissingMarker(const std::string& value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered.empty() || lowered == "nan" || lowered == "nat" || lowered == "null" ||
         lowered == "na" || lowered == "none";
}

bool isAllDigits(const std::string& value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

bool matchesOffset(const std::string& value, std::size_t pos, bool with_colon) {
  if (pos == 0 || (value[pos] != '+' && value[pos] != '-')) {
    return false;
  }
  if (with_colon && value[pos + 3] != ':') {
    return false;
  }
  const std::string digits = with_colon ? value.substr(pos + 1, 2) + value.substr(pos + 4, 2) : value.substr(pos + 1);
  // The offset must follow a time part ("...10:15:30+02:00").
  const bool after_time = std::isdigit(static_cast<unsigned char>(value[pos - 1])) != 0 && value.find(':') < pos;
  return digits.size() == 4 && isAllDigits(digits) && after_time;
}

// Drops a trailing UTC designator or "+HH:MM" / "+HHMM" offset, then
// fractional seconds ("...T10:00:00.250Z", "...10:00:00-05:00"). Only the
// local calendar date is kept.
std::string stripTimeSuffix(std::string value) {
  if (!value.empty() && (value.back() == 'Z' || value.back() == 'z')) {
    value.pop_back();
  } else if (value.size() > 6 && matchesOffset(value, value.size() - 6, true)) {
    value.erase(value.size() - 6);
  } else if (value.size() > 5 && matchesOffset(value, value.size() - 5, false)) {
    value.erase(value.size() - 5);
  }
  const std::size_t colon = value.rfind(':');
  if (colon != std::string::npos) {
    const std::size_t dot = value.find('.', colon);
    if (dot != std::string::npos) {
      value.erase(dot);
    }
  }
  return value;
}

// "20200105" -> 2020-01-05.
std::optional<Date> parseCompactDate(const std::string& value) {
  const Date date{std::stoi(value.substr(0, 4)), std::stoi(value.substr(4, 2)), std::stoi(value.substr(6, 2))};
  if (!isValidDate(date.year, date.month, date.day)) {
    return std::nullopt;
  }
  return date;
}

std::optional<Date> parseWithFormat(const std::string& value, const char* format) {
  std::tm tm = {};
  std::istringstream stream(value);
  stream.imbue(std::locale::classic());
  stream >> std::get_time(&tm, format);
  if (stream.fail()) {
    return std::nullopt;
  }

  char extra = 0;
  if (stream >> extra) {
    return std::nullopt;
  }

  const Date date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
  if (!isValidDate(date.year, date.month, date.day)) {
    return std::nullopt;
  }
  return date;
}

} // namespace

bool isValidDate(int year, int month, int day) {
  if (year < kMinYear || year > kMaxYear || month < 1 || month > 12 || day < 1) {
    return false;
  }
  static const std::array<int, 12> kDaysInMonth = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  const int limit = (month == 2 && leap) ? 29 : kDaysInMonth[month - 1];
  return day <= limit;
}

std::optional<Date> parseYear(const std::string& value) {
  const std::string trimmed = trim(value);
  if (isMissingMarker(trimmed)) {
    return std::nullopt;
  }

  const char* start = trimmed.c_str();
  char* end = nullptr;
  const double parsed = std::strtod(start, &end);
  if (end == start || *end != '\0' || !std::isfinite(parsed) || std::floor(parsed) != parsed) {
    return std::nullopt;
  }
  if (parsed < kMinYear || parsed > kMaxYear) {
    return std::nullopt;
  }
  return Date{static_cast<int>(parsed), kYearAnchorMonth, kYearAnchorDay};
}

std::optional<Date> parseDate(const std::string& value) {
  const std::string trimmed = trim(value);
  if (isMissingMarker(trimmed)) {
    return std::nullopt;
  }

  // A bare year in a date column gets the same mid-year anchor.
  if (isAllDigits(trimmed) && trimmed.size() <= 4) {
    return parseYear(trimmed);
  }
  if (isAllDigits(trimmed) && trimmed.size() == 8) {
    return parseCompactDate(trimmed);
  }

  const std::string candidate = stripTimeSuffix(trimmed);
  for (const char* format : kDateFormats) {
    if (auto date = parseWithFormat(candidate, format)) {
      return date;
    }
  }
  return std::nullopt;
}

std::vector<std::optional<Date>> normalizeDates(
  const Table& table,
  const ResolvedColumns& columns,
  Metrics& metrics
) {
  const auto process_start = std::chrono::steady_clock::now();

  std::vector<std::optional<Date>> dates;
  dates.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    const std::string& raw = row[columns.date.index];
    dates.push_back(columns.year_only ? parseYear(raw) : parseDate(raw));
  }

  metrics.addNormalizerProcessing(elapsedMs(process_start));
  return dates;
}

} // namespace heatmap
