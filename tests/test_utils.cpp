#include "utils/statistics.hpp"
#include "utils/utils.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

// --- Tests for string helpers ---
TEST(UtilsTest, SplitString) {
  auto parts = Utils::split_string("a,b,,c", ',');
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[2], "");
  EXPECT_EQ(parts[3], "c");
}

TEST(UtilsTest, TrimAndLower) {
  EXPECT_EQ(Utils::trim_copy("  Health \t"), "Health");
  EXPECT_EQ(Utils::to_lower_copy("FiNaNcE"), "finance");
}

TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("42"), 42);
  EXPECT_EQ(Utils::string_to_number<uint64_t>("18446744073709551615"),
            std::numeric_limits<uint64_t>::max());
  EXPECT_FALSE(Utils::string_to_number<int>("12abc").has_value());
  EXPECT_FALSE(Utils::string_to_number<size_t>("-3").has_value());
  // Empty means zero, like the config files expect
  EXPECT_EQ(Utils::string_to_number<double>(""), 0.0);
}

// --- Tests for parse_range ---
TEST(UtilsTest, ParseRange) {
  auto range = Utils::parse_range(" 40 , 120 ");
  ASSERT_TRUE(range.has_value());
  EXPECT_DOUBLE_EQ(range->first, 40.0);
  EXPECT_DOUBLE_EQ(range->second, 120.0);

  EXPECT_FALSE(Utils::parse_range("40").has_value());
  EXPECT_FALSE(Utils::parse_range("40,").has_value());
  EXPECT_FALSE(Utils::parse_range("low,high").has_value());
  EXPECT_FALSE(Utils::parse_range("1,2,3").has_value());
}

// --- Tests for the statistics helpers ---
TEST(StatisticsTest, MeanAndPopulationSpread) {
  std::vector<double> values = {2, 4, 4, 4, 5, 5, 7, 9};
  EXPECT_DOUBLE_EQ(Stats::mean(values), 5.0);
  EXPECT_DOUBLE_EQ(Stats::population_variance(values), 4.0);
  EXPECT_DOUBLE_EQ(Stats::population_stddev(values), 2.0);

  EXPECT_EQ(Stats::mean({}), 0.0);
  EXPECT_EQ(Stats::population_stddev({}), 0.0);
}

TEST(StatisticsTest, PearsonEdgeCases) {
  std::vector<double> x = {1, 2, 3, 4, 5};
  std::vector<double> y = {2, 4, 6, 8, 10};
  std::vector<double> flat = {3, 3, 3, 3, 3};

  EXPECT_NEAR(Stats::pearson(x, y), 1.0, 1e-12);
  EXPECT_EQ(Stats::pearson(x, flat), 0.0);
  EXPECT_EQ(Stats::pearson(x, {1, 2}), 0.0);
  EXPECT_EQ(Stats::pearson({}, {}), 0.0);
}

TEST(StatisticsTest, ArgExtremesPickFirstOccurrence) {
  std::vector<double> values = {1, 5, 5, 0, 0};
  EXPECT_EQ(Stats::argmax(values), 1u);
  EXPECT_EQ(Stats::argmin(values), 3u);
}

TEST(StatisticsTest, ClampFiniteMapsNaNToLowerBound) {
  EXPECT_EQ(Stats::clamp_finite(std::nan(""), -1.0, 1.0), -1.0);
  EXPECT_EQ(Stats::clamp_finite(2.0, 0.0, 1.0), 1.0);
  EXPECT_EQ(Stats::clamp_finite(0.25, 0.0, 1.0), 0.25);
}
