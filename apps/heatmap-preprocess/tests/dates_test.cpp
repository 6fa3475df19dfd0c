#include <gtest/gtest.h>

#include "stages/dates.hpp"

using namespace heatmap;

namespace {

void expectDate(const std::optional<Date>& date, int year, int month, int day) {
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(date->year, year);
  EXPECT_EQ(date->month, month);
  EXPECT_EQ(date->day, day);
}

} // namespace

TEST(DatesTest, BareYearAnchorsToJulyFirst) {
  expectDate(parseYear("1995"), 1995, 7, 1);
  expectDate(parseYear(" 2018 "), 2018, 7, 1);
  expectDate(parseYear("1995.0"), 1995, 7, 1);
}

TEST(DatesTest, BareYearsAlwaysNormalizeToJuly) {
  for (int year = 1; year <= 9999; year += 37) {
    const auto date = parseYear(std::to_string(year));
    ASSERT_TRUE(date.has_value()) << year;
    EXPECT_EQ(date->year, year);
    EXPECT_EQ(date->month, 7);
  }
}

TEST(DatesTest, RejectsNonYearValues) {
  EXPECT_FALSE(parseYear("").has_value());
  EXPECT_FALSE(parseYear("NaN").has_value());
  EXPECT_FALSE(parseYear("19x5").has_value());
  EXPECT_FALSE(parseYear("1995.5").has_value());
  EXPECT_FALSE(parseYear("0").has_value());
  EXPECT_FALSE(parseYear("12000").has_value());
}

TEST(DatesTest, ParsesCommonLayouts) {
  expectDate(parseDate("2020-01-02"), 2020, 1, 2);
  expectDate(parseDate("2020-01-02T10:15:30"), 2020, 1, 2);
  expectDate(parseDate("2020-01-02T10:15:30.250Z"), 2020, 1, 2);
  expectDate(parseDate("2020-01-02 10:15:30"), 2020, 1, 2);
  expectDate(parseDate("2020/01/02"), 2020, 1, 2);
  expectDate(parseDate("01/02/2020"), 2020, 1, 2);
  expectDate(parseDate("1/2/2020"), 2020, 1, 2);
  expectDate(parseDate("01-02-2020"), 2020, 1, 2);
  expectDate(parseDate("15.08.2017"), 2017, 8, 15);
  expectDate(parseDate("5 May 2019"), 2019, 5, 5);
  expectDate(parseDate("2020-01-02T10:15:30+00:00"), 2020, 1, 2);
  expectDate(parseDate("2020-01-02 10:15:30-05:00"), 2020, 1, 2);
  expectDate(parseDate("2020-01-02T10:15:30.250+0530"), 2020, 1, 2);
  expectDate(parseDate("2020-01-02T23:59:59-0800"), 2020, 1, 2);
}

TEST(DatesTest, ParsesCompactDates) {
  expectDate(parseDate("20200105"), 2020, 1, 5);
  expectDate(parseDate("19991231"), 1999, 12, 31);
  EXPECT_FALSE(parseDate("20200230").has_value());
  EXPECT_FALSE(parseDate("20201301").has_value());
}

TEST(DatesTest, OffsetWithoutTimePartIsRejected) {
  EXPECT_FALSE(parseDate("2020-01-02+05:00").has_value());
  EXPECT_FALSE(parseDate("2020-01-02 10:15:30+5:00").has_value());
}

TEST(DatesTest, BareYearInDateColumnIsAnchored) {
  expectDate(parseDate("1999"), 1999, 7, 1);
}

TEST(DatesTest, RejectsImpossibleCalendarDates) {
  EXPECT_FALSE(parseDate("2019-02-30").has_value());
  EXPECT_FALSE(parseDate("2019-02-29").has_value());
  expectDate(parseDate("2020-02-29"), 2020, 2, 29);
  EXPECT_FALSE(parseDate("2019-13-01").has_value());
}

TEST(DatesTest, RejectsMissingAndGarbage) {
  EXPECT_FALSE(parseDate("").has_value());
  EXPECT_FALSE(parseDate("NaT").has_value());
  EXPECT_FALSE(parseDate("null").has_value());
  EXPECT_FALSE(parseDate("not a date").has_value());
  EXPECT_FALSE(parseDate("2020-01-02 garbage").has_value());
}

TEST(DatesTest, ValidatesLeapYears) {
  EXPECT_TRUE(isValidDate(2000, 2, 29));
  EXPECT_FALSE(isValidDate(1900, 2, 29));
  EXPECT_TRUE(isValidDate(2024, 2, 29));
  EXPECT_FALSE(isValidDate(2023, 4, 31));
  EXPECT_FALSE(isValidDate(2023, 0, 1));
}

TEST(DatesTest, NormalizeKeepsRowAlignment) {
  Table table;
  table.columns = {"year", "lat", "lon"};
  table.rows = {{"1995", "1", "1"}, {"oops", "1", "1"}, {"", "1", "1"}, {"2001", "1", "1"}};
  ResolvedColumns columns;
  columns.date = ResolvedColumn{"year", 0};
  columns.year_only = true;

  Metrics metrics;
  const auto dates = normalizeDates(table, columns, metrics);

  ASSERT_EQ(dates.size(), 4u);
  expectDate(dates[0], 1995, 7, 1);
  EXPECT_FALSE(dates[1].has_value());
  EXPECT_FALSE(dates[2].has_value());
  expectDate(dates[3], 2001, 7, 1);
}

TEST(DatesTest, NormalizeUsesDateParserOutsideYearMode) {
  Table table;
  table.columns = {"date"};
  table.rows = {{"2010-03-04"}, {"2010"}};
  ResolvedColumns columns;
  columns.date = ResolvedColumn{"date", 0};

  Metrics metrics;
  const auto dates = normalizeDates(table, columns, metrics);

  ASSERT_EQ(dates.size(), 2u);
  expectDate(dates[0], 2010, 3, 4);
  expectDate(dates[1], 2010, 7, 1);
}
