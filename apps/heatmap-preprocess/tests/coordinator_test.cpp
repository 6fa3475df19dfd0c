#include <gtest/gtest.h>

#include <filesystem>
#include <map>

#include "coordinator.hpp"
#include "errors.hpp"
#include "stages/indexer.hpp"
#include "test_support.hpp"

using namespace heatmap;
namespace fs = std::filesystem;

class CoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.input_file = dir_.write("incidents.csv", testing_support::syntheticCsv());
    config_.output_file = (dir_.path() / "dist" / "aggregates.json").string();
    config_.grid = GridType::Bin;
    config_.bin_size = 0.1;
    config_.years_per_window = 3;
    config_.workers = 2;
  }

  testing_support::TempDir dir_;
  PipelineConfig config_;
  Metrics metrics_;
};

TEST_F(CoordinatorTest, SyntheticIncidentsEndToEnd) {
  const PipelineCoordinator coordinator(config_);
  const BudgetOutcome outcome = coordinator.buildArtifact(metrics_);

  const std::vector<Window> expected = {{1995, 1997}, {1998, 2000}, {2001, 2002}};
  EXPECT_EQ(outcome.meta.windows, expected);
  EXPECT_EQ(outcome.meta.resolution.grid, GridType::Bin);
  EXPECT_FALSE(outcome.exhausted);

  std::map<int, int> features_per_window;
  std::map<int, std::int64_t> records_per_window;
  bool has_pair = false;
  for (const auto& window : outcome.meta.windows) {
    features_per_window[window.start] = 0;
  }
  // Every feature's "w" must be one of the meta windows.
  ASSERT_EQ(outcome.attempts.size(), 1u);
  const std::string& artifact = outcome.artifact;
  EXPECT_EQ(artifact.rfind("{\"meta\":{\"grid\":\"bin\",\"resolution\":0.1,", 0), 0u);
  for (const auto& window : expected) {
    const std::string key =
      "\"w\":[" + std::to_string(window.start) + "," + std::to_string(window.end) + "]";
    std::size_t pos = artifact.find(key);
    while (pos != std::string::npos) {
      features_per_window[window.start] += 1;
      const std::size_t n_pos = artifact.find("\"n\":", pos);
      const std::int64_t n = std::stoll(artifact.substr(n_pos + 4));
      EXPECT_GE(n, 1);
      records_per_window[window.start] += n;
      has_pair = has_pair || n == 2;
      pos = artifact.find(key, pos + key.size());
    }
  }

  std::size_t matched = 0;
  for (const auto& [start, count] : features_per_window) {
    EXPECT_GE(count, 1) << "window starting " << start;
    matched += static_cast<std::size_t>(count);
  }
  EXPECT_EQ(matched, outcome.feature_count);
  EXPECT_EQ(records_per_window[1995], 4);
  EXPECT_EQ(records_per_window[1998], 4);
  EXPECT_EQ(records_per_window[2001], 2);
  EXPECT_TRUE(has_pair);
  EXPECT_EQ(outcome.feature_count, 6u);
}

TEST_F(CoordinatorTest, ExecuteWritesArtifact) {
  const PipelineCoordinator coordinator(config_);
  const RunReport report = coordinator.execute(metrics_);

  ASSERT_TRUE(fs::exists(config_.output_file));
  EXPECT_FALSE(fs::exists(config_.output_file + ".tmp"));
  const std::string written = testing_support::readFile(config_.output_file);
  EXPECT_EQ(written.size(), report.size_bytes);
  EXPECT_EQ(report.window_count, 3u);
  EXPECT_EQ(report.feature_count, 6u);
  EXPECT_EQ(report.attempts, 1u);

  const auto snapshot = metrics_.snapshot();
  EXPECT_EQ(snapshot.rows_read, 10);
  EXPECT_EQ(snapshot.valid_rows, 10);
  EXPECT_EQ(snapshot.excluded_rows, 0);
}

TEST_F(CoordinatorTest, ExcludedRowsAreCountedNotFatal) {
  config_.input_file = dir_.write(
    "holes.csv",
    testing_support::syntheticCsv() + "1999,,-80.0,FL\n19xx,30.0,-80.0,FL\n2001,0,500,FL\n"
  );
  const PipelineCoordinator coordinator(config_);
  const RunReport report = coordinator.execute(metrics_);

  EXPECT_EQ(report.feature_count, 6u);
  const auto snapshot = metrics_.snapshot();
  EXPECT_EQ(snapshot.rows_read, 13);
  EXPECT_EQ(snapshot.excluded_rows, 3);
}

TEST_F(CoordinatorTest, ConusFilterNeverAddsFeatures) {
  config_.input_file = dir_.write(
    "with_islands.csv",
    testing_support::syntheticCsv() + "1995,21.3099,-157.8581,HI\n1995,61.2181,-149.9003,AK\n"
  );
  const PipelineCoordinator all(config_);
  const auto unfiltered = all.buildArtifact(metrics_);

  config_.conus_only = true;
  Metrics conus_metrics;
  const PipelineCoordinator conus(config_);
  const auto filtered = conus.buildArtifact(conus_metrics);

  EXPECT_LT(filtered.feature_count, unfiltered.feature_count);
  EXPECT_EQ(filtered.meta.windows, unfiltered.meta.windows);
  EXPECT_EQ(conus_metrics.snapshot().conus_filtered_rows, 2);
}

TEST_F(CoordinatorTest, MissingColumnAbortsWithoutOutput) {
  config_.input_file = dir_.write("no_lat.csv", "year,Longitude\n1995,-74.0\n");
  const PipelineCoordinator coordinator(config_);

  EXPECT_THROW(coordinator.execute(metrics_), MissingColumnError);
  EXPECT_FALSE(fs::exists(config_.output_file));
}

TEST_F(CoordinatorTest, NoValidRowsIsInvalidRange) {
  config_.input_file = dir_.write("empty.csv", "year,lat,lon\nnope,1,1\n1999,,\n");
  const PipelineCoordinator coordinator(config_);

  EXPECT_THROW(coordinator.execute(metrics_), InvalidRangeError);
  EXPECT_FALSE(fs::exists(config_.output_file));
}

TEST_F(CoordinatorTest, RunReturnsNonZeroOnFatalError) {
  config_.input_file = (dir_.path() / "missing.csv").string();
  const PipelineCoordinator coordinator(config_);

  EXPECT_EQ(coordinator.run(metrics_), 1);
  EXPECT_FALSE(fs::exists(config_.output_file));
}

TEST_F(CoordinatorTest, SubDecimalBinSizeAbortsWithoutOutput) {
  config_.bin_size = 0.05;
  const PipelineCoordinator coordinator(config_);
  EXPECT_THROW(coordinator.execute(metrics_), PipelineError);
  EXPECT_FALSE(fs::exists(config_.output_file));
}

TEST_F(CoordinatorTest, RunReturnsZeroOnSuccess) {
  const PipelineCoordinator coordinator(config_);
  EXPECT_EQ(coordinator.run(metrics_), 0);
  EXPECT_TRUE(fs::exists(config_.output_file));
}

TEST_F(CoordinatorTest, HexRequestDowngradesWithoutH3) {
  config_.grid = GridType::Hex;
  const PipelineCoordinator coordinator(config_);
  const auto outcome = coordinator.buildArtifact(metrics_);

  const GridType expected = HexIndexer::available() ? GridType::Hex : GridType::Bin;
  EXPECT_EQ(outcome.meta.resolution.grid, expected);
  EXPECT_NE(outcome.artifact.find(HexIndexer::available() ? "\"c\":" : "\"bin_id\":"), std::string::npos);
}

TEST_F(CoordinatorTest, OversizedRunStillWritesArtifact) {
  config_.budget.max_size_mb = 1e-9;
  const PipelineCoordinator coordinator(config_);
  const RunReport report = coordinator.execute(metrics_);

  EXPECT_TRUE(report.exhausted);
  EXPECT_DOUBLE_EQ(report.resolution.bin_size, 0.2);
  EXPECT_TRUE(fs::exists(config_.output_file));
}
