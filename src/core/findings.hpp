#ifndef FINDINGS_HPP
#define FINDINGS_HPP

#include "core/event.hpp"
#include "features/feature_extractor.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TrendDirection { INCREASING, DECREASING };
enum class CyclePeriod { DAILY, WEEKLY, MONTHLY };
enum class CorrelationDirection { POSITIVE, NEGATIVE };
enum class AnomalyKind { STATISTICAL, CONTEXTUAL };
enum class AnomalySeverity { MEDIUM, HIGH };

// Which kind of finding a piece of user feedback refers to.
enum class InsightType { TREND, CYCLE, CORRELATION, ANOMALY, CLUSTER, PREDICTION };

constexpr std::array<InsightType, 6> ALL_INSIGHT_TYPES = {
    InsightType::TREND,   InsightType::CYCLE,   InsightType::CORRELATION,
    InsightType::ANOMALY, InsightType::CLUSTER, InsightType::PREDICTION};

const char *trend_direction_to_string(TrendDirection direction);
const char *cycle_period_to_string(CyclePeriod period);
const char *correlation_direction_to_string(CorrelationDirection direction);
const char *anomaly_kind_to_string(AnomalyKind kind);
const char *anomaly_severity_to_string(AnomalySeverity severity);
const char *insight_type_to_string(InsightType type);
std::optional<InsightType> insight_type_from_string(const std::string &name);

struct Trend {
  DataCategory category;
  TrendDirection direction;
  double strength;   // |slope|
  double slope;
  double intercept;
  double confidence; // R², [0, 1]
  size_t sample_count;
  int64_t duration_ms;
  std::string description;
};

struct Cycle {
  DataCategory category;
  CyclePeriod period;
  double strength; // [0, 1]
  std::vector<double> profile;
  size_t peak_bucket;
  size_t trough_bucket;
  std::string description;
};

struct Correlation {
  DataCategory category_a;
  DataCategory category_b;
  double coefficient; // [-1, 1]
  double strength;    // |coefficient|
  double confidence;  // [0, 1]
  size_t aligned_pairs;
  CorrelationDirection direction;
  std::string description;
};

struct Anomaly {
  std::string event_id;
  DataCategory category;
  int64_t timestamp_ms;
  double value;
  AnomalyKind kind;
  AnomalySeverity severity;
  std::optional<double> z_score; // statistical anomalies only
  std::string description;
};

struct ClusterCenter {
  double mean;
  double min;
  double max;
  double std_dev;
};

struct ClusterCharacteristics {
  int dominant_hour_of_day;
  int dominant_day_of_week;
  features::TimeOfDay dominant_time_of_day;
  std::string dominant_source;
};

struct Cluster {
  size_t id;
  size_t size;
  std::vector<std::string> member_ids;
  // Absent when no point ended up in this cluster.
  std::optional<ClusterCenter> center;
  std::optional<ClusterCharacteristics> characteristics;
};

struct ClusterAnalysis {
  DataCategory category;
  std::vector<Cluster> clusters;
  std::vector<size_t> assignments; // cluster id per event, time-ordered
  double silhouette;               // [-1, 1]
  size_t iterations;
  uint64_t seed;
  std::string description;
};

struct PredictionPoint {
  int64_t timestamp_ms;
  double value;
  double confidence;
};

struct Prediction {
  DataCategory category;
  TrendDirection direction;
  double confidence;
  double slope;
  std::vector<PredictionPoint> points;
  std::string description;
};

#endif // FINDINGS_HPP
