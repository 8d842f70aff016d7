#include "core/event.hpp"
#include "detection/cycle_detector.hpp"
#include "features/feature_extractor.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace detection;

namespace {

constexpr int64_t MONDAY_MIDNIGHT = 1704067200000LL; // 2024-01-01
constexpr int64_t HOUR_MS = 3600000LL;
constexpr int64_t DAY_MS = 24 * HOUR_MS;

bool has_period(const std::vector<Cycle> &cycles, CyclePeriod period) {
  return std::any_of(cycles.begin(), cycles.end(),
                     [period](const Cycle &c) { return c.period == period; });
}

} // namespace

class CycleDetectorTest : public ::testing::Test {
protected:
  features::FeatureExtractor extractor;
  Config::CycleConfig config;
  CycleDetector detector{config, extractor};
};

TEST_F(CycleDetectorTest, EmptyInputHasNoCycles) {
  EXPECT_TRUE(detector.detect(DataCategory::HEALTH, {}).empty());
}

TEST_F(CycleDetectorTest, BucketCounts) {
  EXPECT_EQ(CycleDetector::bucket_count(CyclePeriod::DAILY), 24u);
  EXPECT_EQ(CycleDetector::bucket_count(CyclePeriod::WEEKLY), 7u);
  EXPECT_EQ(CycleDetector::bucket_count(CyclePeriod::MONTHLY), 31u);
}

TEST_F(CycleDetectorTest, ProfileAveragesEachBucket) {
  std::vector<Event> events = {
      make_scalar_event("a", DataCategory::HEALTH, "t", 10,
                        MONDAY_MIDNIGHT + 7 * HOUR_MS),
      make_scalar_event("b", DataCategory::HEALTH, "t", 20,
                        MONDAY_MIDNIGHT + DAY_MS + 7 * HOUR_MS),
      // January 31st
      make_scalar_event("c", DataCategory::HEALTH, "t", 6,
                        MONDAY_MIDNIGHT + 30 * DAY_MS + 22 * HOUR_MS)};

  CycleProfile daily = detector.compute_profile(events, CyclePeriod::DAILY);
  ASSERT_EQ(daily.averages.size(), 24u);
  EXPECT_DOUBLE_EQ(daily.averages[7], 15.0);
  EXPECT_DOUBLE_EQ(daily.averages[22], 6.0);
  EXPECT_DOUBLE_EQ(daily.averages[0], 0.0);
  EXPECT_EQ(daily.counts[7], 2u);
  EXPECT_EQ(daily.peak_bucket, 7u);
  EXPECT_EQ(daily.trough_bucket, 0u);

  CycleProfile monthly = detector.compute_profile(events, CyclePeriod::MONTHLY);
  EXPECT_DOUBLE_EQ(monthly.averages[0], 10.0);
  EXPECT_DOUBLE_EQ(monthly.averages[30], 6.0);
}

TEST_F(CycleDetectorTest, MorningOnlyActivityIsADailyCycle) {
  // One reading at 08:00 on each day of one week
  std::vector<Event> events;
  for (int day = 0; day < 7; ++day)
    events.push_back(make_scalar_event("d" + std::to_string(day),
                                       DataCategory::PRODUCTIVITY, "timer", 100,
                                       MONDAY_MIDNIGHT + day * DAY_MS +
                                           8 * HOUR_MS));

  auto cycles = detector.detect(DataCategory::PRODUCTIVITY, events);
  ASSERT_TRUE(has_period(cycles, CyclePeriod::DAILY));
  // Every weekday has the same average, so there is no weekly rhythm
  EXPECT_FALSE(has_period(cycles, CyclePeriod::WEEKLY));

  const Cycle &daily = *std::find_if(
      cycles.begin(), cycles.end(),
      [](const Cycle &c) { return c.period == CyclePeriod::DAILY; });
  EXPECT_EQ(daily.peak_bucket, 8u);
  EXPECT_DOUBLE_EQ(daily.strength, 1.0);
  EXPECT_EQ(daily.profile.size(), 24u);
  EXPECT_NE(daily.description.find("8:00"), std::string::npos);
}

TEST_F(CycleDetectorTest, StrengthStaysWithinUnitInterval) {
  std::vector<Event> events;
  for (int hour = 0; hour < 24; ++hour)
    events.push_back(make_scalar_event("h" + std::to_string(hour),
                                       DataCategory::HEALTH, "t", 1000,
                                       MONDAY_MIDNIGHT + hour * HOUR_MS));

  CycleProfile daily = detector.compute_profile(events, CyclePeriod::DAILY);
  EXPECT_DOUBLE_EQ(daily.strength, 0.0);

  for (auto period :
       {CyclePeriod::DAILY, CyclePeriod::WEEKLY, CyclePeriod::MONTHLY}) {
    CycleProfile profile = detector.compute_profile(events, period);
    EXPECT_GE(profile.strength, 0.0);
    EXPECT_LE(profile.strength, 1.0);
  }
}

TEST_F(CycleDetectorTest, WeekendHeavyActivityIsAWeeklyCycle) {
  // Four weeks of 09:00 readings, high on weekends
  std::vector<Event> events;
  for (int day = 0; day < 28; ++day) {
    int64_t ts = MONDAY_MIDNIGHT + day * DAY_MS + 9 * HOUR_MS;
    bool weekend = day % 7 == 5 || day % 7 == 6;
    events.push_back(make_scalar_event("w" + std::to_string(day),
                                       DataCategory::FINANCE, "bank",
                                       weekend ? 300 : 30, ts));
  }

  auto cycles = detector.detect(DataCategory::FINANCE, events);
  ASSERT_TRUE(has_period(cycles, CyclePeriod::WEEKLY));

  const Cycle &weekly = *std::find_if(
      cycles.begin(), cycles.end(),
      [](const Cycle &c) { return c.period == CyclePeriod::WEEKLY; });
  EXPECT_GT(weekly.strength, config.min_strength);
  EXPECT_DOUBLE_EQ(weekly.strength, 1.0);
  ASSERT_EQ(weekly.profile.size(), 7u);
  EXPECT_DOUBLE_EQ(weekly.profile[0], 300.0);
  EXPECT_DOUBLE_EQ(weekly.profile[3], 30.0);
  // Sunday and Saturday tie, the first one wins
  EXPECT_EQ(weekly.peak_bucket, 0u);
  EXPECT_EQ(weekly.trough_bucket, 1u);
  EXPECT_EQ(weekly.description,
            "Your finance data follows a weekly rhythm, peaking at Sunday and "
            "lowest at Monday");
}

TEST_F(CycleDetectorTest, MidMonthReadingsAreAMonthlyCycle) {
  // The 15th of January, February and March 2024 at 10:00
  std::vector<Event> events;
  for (int offset_days : {14, 45, 74})
    events.push_back(make_scalar_event("m" + std::to_string(offset_days),
                                       DataCategory::CAREER, "review", 100,
                                       MONDAY_MIDNIGHT + offset_days * DAY_MS +
                                           10 * HOUR_MS));

  auto cycles = detector.detect(DataCategory::CAREER, events);
  ASSERT_TRUE(has_period(cycles, CyclePeriod::MONTHLY));

  const Cycle &monthly = *std::find_if(
      cycles.begin(), cycles.end(),
      [](const Cycle &c) { return c.period == CyclePeriod::MONTHLY; });
  EXPECT_GT(monthly.strength, config.min_strength);
  ASSERT_EQ(monthly.profile.size(), 31u);
  EXPECT_DOUBLE_EQ(monthly.profile[14], 100.0);
  EXPECT_EQ(monthly.peak_bucket, 14u);
  EXPECT_EQ(monthly.trough_bucket, 0u);
  EXPECT_NE(monthly.description.find("peaking at day 15"), std::string::npos);
  EXPECT_NE(monthly.description.find("lowest at day 1"), std::string::npos);
}
