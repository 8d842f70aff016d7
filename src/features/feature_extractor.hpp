#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "core/config.hpp"
#include "core/event.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace features {

enum class TimeOfDay { MORNING, AFTERNOON, EVENING, NIGHT };

const char *time_of_day_to_string(TimeOfDay time_of_day);

struct TemporalFeatures {
  int hour_of_day = 0;  // 0-23
  int day_of_week = 0;  // 0-6, 0 = Sunday
  int day_of_month = 1; // 1-31
  int month = 0;        // 0-11
  int season = 0;       // 0-3, month / 3
  bool is_weekend = false;
  TimeOfDay time_of_day = TimeOfDay::NIGHT;
};

struct NumericalFeature {
  std::string name;
  double raw_value;
  double normalized_value;
};

struct DerivedFeature {
  std::string name; // "<field>_abs", "<field>_log" or "<field>_sqrt"
  double value;
};

struct CategoricalFeature {
  std::string name;
  std::string value;
};

struct FeatureVector {
  int64_t timestamp_ms = 0;
  DataCategory category = DataCategory::HEALTH;
  std::string source;
  std::vector<NumericalFeature> numerical_features;
  std::vector<DerivedFeature> derived_features;
  std::vector<CategoricalFeature> categorical_features;
  TemporalFeatures temporal;
};

struct FeatureRange {
  double min;
  double max;
};

/**
 * Turns events into feature vectors. Stateless apart from the configuration
 * it was built with, so one instance can be shared across threads.
 */
class FeatureExtractor {
public:
  FeatureExtractor();
  explicit FeatureExtractor(const Config::FeatureConfig &config);

  /**
   * Extract the full feature vector of an event.
   * @throws FeatureExtractionError if the timestamp is negative
   */
  FeatureVector extract(const Event &event) const;

  /**
   * Calendar features of a timestamp, shifted by the configured UTC offset.
   * @throws FeatureExtractionError if the timestamp is negative or cannot
   * be represented as a calendar date
   */
  TemporalFeatures extract_temporal(int64_t timestamp_ms) const;

  // Min-max normalization against the range table. A degenerate range
  // (min == max) maps everything to 0.5.
  double normalize(double value, const std::string &field_name) const;

  FeatureRange range_for(const std::string &field_name) const;

  static TimeOfDay time_of_day_for_hour(int hour);

private:
  int utc_offset_minutes_ = 0;
  std::map<std::string, FeatureRange> ranges_;
};

} // namespace features

#endif // FEATURE_EXTRACTOR_HPP
