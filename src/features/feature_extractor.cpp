#include "feature_extractor.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <ctime>
#include <string>

namespace features {

namespace {

constexpr int64_t MS_PER_MINUTE = 60000;
const FeatureRange DEFAULT_RANGE{0.0, 100.0};

std::map<std::string, FeatureRange> builtin_ranges() {
  return {{"steps", {0.0, 20000.0}},   {"heartRate", {40.0, 120.0}},
          {"sleep", {0.0, 12.0}},      {"amount", {0.0, 1000.0}},
          {"timeSpent", {0.0, 480.0}}, {"weight", {100.0, 300.0}},
          {"energy", {1.0, 10.0}}};
}

} // namespace

const char *time_of_day_to_string(TimeOfDay time_of_day) {
  switch (time_of_day) {
  case TimeOfDay::MORNING:
    return "morning";
  case TimeOfDay::AFTERNOON:
    return "afternoon";
  case TimeOfDay::EVENING:
    return "evening";
  case TimeOfDay::NIGHT:
    return "night";
  }
  return "night";
}

FeatureExtractor::FeatureExtractor() : ranges_(builtin_ranges()) {}

FeatureExtractor::FeatureExtractor(const Config::FeatureConfig &config)
    : utc_offset_minutes_(config.utc_offset_minutes),
      ranges_(builtin_ranges()) {
  for (const auto &[name, range] : config.range_overrides)
    ranges_[name] = FeatureRange{range.first, range.second};
}

TimeOfDay FeatureExtractor::time_of_day_for_hour(int hour) {
  if (hour >= 6 && hour < 12)
    return TimeOfDay::MORNING;
  if (hour >= 12 && hour < 17)
    return TimeOfDay::AFTERNOON;
  if (hour >= 17 && hour < 21)
    return TimeOfDay::EVENING;
  return TimeOfDay::NIGHT;
}

TemporalFeatures FeatureExtractor::extract_temporal(int64_t timestamp_ms) const {
  if (timestamp_ms < 0)
    throw FeatureExtractionError("Negative timestamp: " +
                                 std::to_string(timestamp_ms));

  int64_t shifted_ms = timestamp_ms + utc_offset_minutes_ * MS_PER_MINUTE;
  time_t t = static_cast<time_t>(shifted_ms / 1000);
  struct tm tmval {};
  if (gmtime_r(&t, &tmval) == nullptr)
    throw FeatureExtractionError("Timestamp out of calendar range: " +
                                 std::to_string(timestamp_ms));

  TemporalFeatures temporal;
  temporal.hour_of_day = tmval.tm_hour;
  temporal.day_of_week = tmval.tm_wday;
  temporal.day_of_month = tmval.tm_mday;
  temporal.month = tmval.tm_mon;
  temporal.season = tmval.tm_mon / 3;
  temporal.is_weekend = tmval.tm_wday == 0 || tmval.tm_wday == 6;
  temporal.time_of_day = time_of_day_for_hour(tmval.tm_hour);
  return temporal;
}

FeatureRange FeatureExtractor::range_for(const std::string &field_name) const {
  auto it = ranges_.find(field_name);
  return it != ranges_.end() ? it->second : DEFAULT_RANGE;
}

double FeatureExtractor::normalize(double value,
                                   const std::string &field_name) const {
  FeatureRange range = range_for(field_name);
  if (range.min == range.max)
    return 0.5;
  return (value - range.min) / (range.max - range.min);
}

FeatureVector FeatureExtractor::extract(const Event &event) const {
  FeatureVector vector;
  vector.timestamp_ms = event.timestamp_ms;
  vector.category = event.category;
  vector.source = event.source;
  vector.temporal = extract_temporal(event.timestamp_ms);

  for (const auto &field : event.fields) {
    if (auto number = field.as_number()) {
      double v = *number;
      vector.numerical_features.push_back(
          NumericalFeature{field.name, v, normalize(v, field.name)});
      vector.derived_features.push_back({field.name + "_abs", std::abs(v)});
      vector.derived_features.push_back(
          {field.name + "_log", v > 0 ? std::log(v) : 0.0});
      vector.derived_features.push_back(
          {field.name + "_sqrt", std::sqrt(std::abs(v))});
    } else {
      vector.categorical_features.push_back(
          CategoricalFeature{field.name, field.as_text()});
    }
  }

  LOG(LogLevel::TRACE, LogComponent::FEATURES,
      "Extracted " << vector.numerical_features.size() << " numeric and "
                   << vector.categorical_features.size()
                   << " categorical features from event '" << event.id
                   << "'");
  return vector;
}

} // namespace features
