#include "core/event.hpp"
#include "detection/anomaly_detector.hpp"
#include "features/feature_extractor.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>

using namespace detection;

namespace {

constexpr int64_t MONDAY_MIDNIGHT = 1704067200000LL;
constexpr int64_t HOUR_MS = 3600000LL;
constexpr int64_t WEEK_MS = 7 * 24 * HOUR_MS;

// One event per hour so no two events share an hour/weekday context
std::vector<Event> hourly(const std::vector<double> &values) {
  std::vector<Event> events;
  for (size_t i = 0; i < values.size(); ++i)
    events.push_back(make_scalar_event("h" + std::to_string(i),
                                       DataCategory::HEALTH, "watch", values[i],
                                       MONDAY_MIDNIGHT +
                                           static_cast<int64_t>(i) * HOUR_MS));
  return events;
}

} // namespace

class AnomalyDetectorTest : public ::testing::Test {
protected:
  features::FeatureExtractor extractor;
  Config::AnomalyConfig config;
  AnomalyDetector detector{config, extractor};
};

TEST_F(AnomalyDetectorTest, ClassifiesBySeverity) {
  EXPECT_FALSE(detector.classify(2.5).has_value());
  EXPECT_EQ(detector.classify(2.6), AnomalySeverity::MEDIUM);
  EXPECT_EQ(detector.classify(-3.0), AnomalySeverity::MEDIUM);
  EXPECT_EQ(detector.classify(-3.1), AnomalySeverity::HIGH);
}

TEST_F(AnomalyDetectorTest, BaselineOfFlatSeries) {
  ZScoreBaseline stats = AnomalyDetector::baseline({4, 4, 4});
  EXPECT_DOUBLE_EQ(stats.mean, 4.0);
  EXPECT_DOUBLE_EQ(stats.std_dev, 0.0);
  EXPECT_DOUBLE_EQ(stats.z_score(100.0), 0.0);
}

TEST_F(AnomalyDetectorTest, MediumOutlier) {
  std::vector<double> values(8, 10.0);
  values.push_back(20.0);
  auto anomalies = detector.detect(DataCategory::HEALTH, hourly(values));

  ASSERT_EQ(anomalies.size(), 1u);
  const Anomaly &a = anomalies[0];
  EXPECT_EQ(a.event_id, "h8");
  EXPECT_EQ(a.kind, AnomalyKind::STATISTICAL);
  EXPECT_EQ(a.severity, AnomalySeverity::MEDIUM);
  ASSERT_TRUE(a.z_score.has_value());
  EXPECT_NEAR(*a.z_score, std::sqrt(8.0), 1e-9);
  EXPECT_DOUBLE_EQ(a.value, 20.0);
  EXPECT_EQ(a.description,
            "Unusual health value of 20.00 detected (2.8 standard deviations "
            "from normal)");
}

TEST_F(AnomalyDetectorTest, HighOutlier) {
  std::vector<double> values;
  for (int i = 0; i < 20; ++i)
    values.push_back(i % 2 == 0 ? 10.0 : 11.0);
  values.push_back(100.0);

  auto anomalies = detector.detect_statistical(DataCategory::HEALTH, hourly(values));
  ASSERT_EQ(anomalies.size(), 1u);
  EXPECT_EQ(anomalies[0].event_id, "h20");
  EXPECT_EQ(anomalies[0].severity, AnomalySeverity::HIGH);
  EXPECT_GT(*anomalies[0].z_score, 3.0);
}

TEST_F(AnomalyDetectorTest, NothingForSmallOrFlatBatches) {
  EXPECT_TRUE(detector.detect(DataCategory::HEALTH, hourly({1, 1, 1, 100}))
                  .empty());
  EXPECT_TRUE(detector.detect(DataCategory::HEALTH, hourly(std::vector<double>(12, 5.0)))
                  .empty());
  EXPECT_TRUE(detector.detect(DataCategory::HEALTH, {}).empty());
}

TEST_F(AnomalyDetectorTest, ContextualOutlierAmongSameSlotPeers) {
  // Nine Mondays at 09:00
  std::vector<Event> events;
  for (int week = 0; week < 9; ++week)
    events.push_back(make_scalar_event("w" + std::to_string(week),
                                       DataCategory::FINANCE, "bank",
                                       week == 4 ? 20.0 : 10.0,
                                       MONDAY_MIDNIGHT + week * WEEK_MS +
                                           9 * HOUR_MS));

  auto contextual = detector.detect_contextual(DataCategory::FINANCE, events);
  ASSERT_EQ(contextual.size(), 1u);
  EXPECT_EQ(contextual[0].event_id, "w4");
  EXPECT_EQ(contextual[0].kind, AnomalyKind::CONTEXTUAL);
  EXPECT_EQ(contextual[0].severity, AnomalySeverity::MEDIUM);
  EXPECT_FALSE(contextual[0].z_score.has_value());
  EXPECT_EQ(contextual[0].description,
            "Unusual finance pattern for this time of day/week");

  auto all = detector.detect(DataCategory::FINANCE, events);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].kind, AnomalyKind::STATISTICAL);
  EXPECT_EQ(all[1].kind, AnomalyKind::CONTEXTUAL);
  EXPECT_EQ(all[0].event_id, all[1].event_id);
}

TEST_F(AnomalyDetectorTest, ContextualNeedsEnoughPeers) {
  std::vector<Event> events;
  for (int week = 0; week < 3; ++week)
    events.push_back(make_scalar_event("w" + std::to_string(week),
                                       DataCategory::FINANCE, "bank",
                                       week == 2 ? 50.0 : 10.0,
                                       MONDAY_MIDNIGHT + week * WEEK_MS));
  EXPECT_TRUE(detector.detect_contextual(DataCategory::FINANCE, events).empty());

  Config::AnomalyConfig disabled;
  disabled.contextual_enabled = false;
  AnomalyDetector off(disabled, extractor);
  EXPECT_TRUE(off.detect_contextual(DataCategory::FINANCE, events).empty());
}
