#include <gtest/gtest.h>

#include <stdexcept>

#include "errors.hpp"
#include "stages/windows.hpp"
#include "test_support.hpp"

using namespace heatmap;
using heatmap::testing_support::record;

TEST(WindowsTest, ThreeYearWindowsWithShortTail) {
  const auto windows = buildWindows(1995, 2002, 3);

  const std::vector<Window> expected = {{1995, 1997}, {1998, 2000}, {2001, 2002}};
  EXPECT_EQ(windows, expected);
}

TEST(WindowsTest, SingleYearRangeYieldsOneWindow) {
  const auto windows = buildWindows(2010, 2010, 3);

  ASSERT_EQ(windows.size(), 1u);
  EXPECT_EQ(windows[0], (Window{2010, 2010}));
}

TEST(WindowsTest, WindowsTileTheRangeExactly) {
  for (int min_year = 1980; min_year <= 1990; min_year += 1) {
    for (int max_year = min_year; max_year <= min_year + 25; max_year += 1) {
      for (int length = 1; length <= 8; length += 1) {
        const auto windows = buildWindows(min_year, max_year, length);
        ASSERT_FALSE(windows.empty());
        EXPECT_EQ(windows.front().start, min_year);
        EXPECT_EQ(windows.back().end, max_year);

        for (std::size_t i = 0; i < windows.size(); i += 1) {
          const auto& window = windows[i];
          EXPECT_LE(window.start, window.end);
          EXPECT_LE(window.end - window.start + 1, length);
          if (i + 1 < windows.size()) {
            EXPECT_EQ(window.end - window.start + 1, length);
            EXPECT_EQ(windows[i + 1].start, window.end + 1);
          }
        }
      }
    }
  }
}

TEST(WindowsTest, InvertedRangeThrows) {
  EXPECT_THROW(buildWindows(2001, 2000, 3), InvalidRangeError);
}

TEST(WindowsTest, NonPositiveLengthThrows) {
  EXPECT_THROW(buildWindows(2000, 2001, 0), std::invalid_argument);
  EXPECT_THROW(buildWindows(2000, 2001, -2), std::invalid_argument);
}

TEST(WindowsTest, HugeLengthDoesNotOverflow) {
  const auto windows = buildWindows(2000, 2005, 2147483647);
  ASSERT_EQ(windows.size(), 1u);
  EXPECT_EQ(windows[0], (Window{2000, 2005}));
}

TEST(WindowsTest, FindsWindowForYear) {
  const auto windows = buildWindows(1995, 2002, 3);

  EXPECT_EQ(windowIndexFor(windows, 1995), std::optional<std::size_t>(0));
  EXPECT_EQ(windowIndexFor(windows, 1997), std::optional<std::size_t>(0));
  EXPECT_EQ(windowIndexFor(windows, 1998), std::optional<std::size_t>(1));
  EXPECT_EQ(windowIndexFor(windows, 2002), std::optional<std::size_t>(2));
  EXPECT_FALSE(windowIndexFor(windows, 1994).has_value());
  EXPECT_FALSE(windowIndexFor(windows, 2003).has_value());
}

TEST(WindowsTest, YearRangeOfRecords) {
  const std::vector<Record> records = {record(1, 1, 2003), record(1, 1, 1999), record(1, 1, 2010)};
  const auto [min_year, max_year] = yearRange(records);
  EXPECT_EQ(min_year, 1999);
  EXPECT_EQ(max_year, 2010);
}

TEST(WindowsTest, YearRangeOfNothingThrows) {
  EXPECT_THROW(yearRange({}), InvalidRangeError);
}

TEST(WindowsTest, BucketsEveryRecordOnce) {
  const std::vector<Record> records = {
    record(1, 1, 1995), record(1, 1, 1996), record(1, 1, 2000), record(1, 1, 2002), record(1, 1, 2002),
  };
  const auto windows = buildWindows(1995, 2002, 3);
  const auto buckets = bucketByWindow(records, windows);

  ASSERT_EQ(buckets.size(), 3u);
  EXPECT_EQ(buckets[0].size(), 2u);
  EXPECT_EQ(buckets[1].size(), 1u);
  EXPECT_EQ(buckets[2].size(), 2u);
}
