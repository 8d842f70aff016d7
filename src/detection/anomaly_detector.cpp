#include "anomaly_detector.hpp"
#include "core/logger.hpp"
#include "detection/trend_detector.hpp"
#include "utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <string>

namespace detection {

namespace {

std::string format_value(double value, int precision) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
  return buffer;
}

} // namespace

AnomalyDetector::AnomalyDetector(const Config::AnomalyConfig &config,
                                 const features::FeatureExtractor &extractor)
    : config_(config), extractor_(extractor) {}

ZScoreBaseline AnomalyDetector::baseline(const std::vector<double> &values) {
  ZScoreBaseline result;
  result.count = values.size();
  result.mean = Stats::mean(values);
  result.std_dev = Stats::population_stddev(values);
  return result;
}

std::optional<AnomalySeverity> AnomalyDetector::classify(double z_score) const {
  double magnitude = std::abs(z_score);
  if (magnitude > config_.high_z_threshold)
    return AnomalySeverity::HIGH;
  if (magnitude > config_.medium_z_threshold)
    return AnomalySeverity::MEDIUM;
  return std::nullopt;
}

std::vector<Anomaly>
AnomalyDetector::detect_statistical(DataCategory category,
                                    const std::vector<Event> &events) const {
  std::vector<Anomaly> anomalies;
  if (events.size() < std::max<size_t>(config_.min_samples, 1))
    return anomalies;

  std::vector<Event> sorted = sorted_by_time(events);
  std::vector<double> values;
  values.reserve(sorted.size());
  for (const auto &event : sorted)
    values.push_back(event.numeric_value());

  ZScoreBaseline stats = baseline(values);
  LOG(LogLevel::DEBUG, LogComponent::DETECT_ANOMALY,
      category_to_string(category) << ": mean=" << stats.mean
                                   << " std=" << stats.std_dev << " n="
                                   << stats.count);

  for (size_t i = 0; i < sorted.size(); ++i) {
    double z = stats.z_score(values[i]);
    auto severity = classify(z);
    if (!severity)
      continue;

    Anomaly anomaly;
    anomaly.event_id = sorted[i].id;
    anomaly.category = category;
    anomaly.timestamp_ms = sorted[i].timestamp_ms;
    anomaly.value = values[i];
    anomaly.kind = AnomalyKind::STATISTICAL;
    anomaly.severity = *severity;
    anomaly.z_score = z;
    anomaly.description = std::string("Unusual ") +
                          category_to_string(category) + " value of " +
                          format_value(values[i], 2) + " detected (" +
                          format_value(std::abs(z), 1) +
                          " standard deviations from normal)";
    anomalies.push_back(std::move(anomaly));
  }
  return anomalies;
}

std::vector<Anomaly>
AnomalyDetector::detect_contextual(DataCategory category,
                                   const std::vector<Event> &events) const {
  std::vector<Anomaly> anomalies;
  if (!config_.contextual_enabled || events.empty())
    return anomalies;

  std::vector<Event> sorted = sorted_by_time(events);
  std::vector<features::TemporalFeatures> temporal;
  temporal.reserve(sorted.size());
  for (const auto &event : sorted)
    temporal.push_back(extractor_.extract_temporal(event.timestamp_ms));

  for (size_t i = 0; i < sorted.size(); ++i) {
    std::vector<double> peers;
    for (size_t j = 0; j < sorted.size(); ++j) {
      if (j == i)
        continue;
      if (temporal[j].hour_of_day == temporal[i].hour_of_day &&
          temporal[j].day_of_week == temporal[i].day_of_week)
        peers.push_back(sorted[j].numeric_value());
    }
    if (peers.size() < config_.min_context_peers)
      continue;

    double peer_mean = Stats::mean(peers);
    double value = sorted[i].numeric_value();
    if (std::abs(value - peer_mean) <=
        config_.context_deviation_ratio * std::abs(peer_mean))
      continue;

    Anomaly anomaly;
    anomaly.event_id = sorted[i].id;
    anomaly.category = category;
    anomaly.timestamp_ms = sorted[i].timestamp_ms;
    anomaly.value = value;
    anomaly.kind = AnomalyKind::CONTEXTUAL;
    anomaly.severity = AnomalySeverity::MEDIUM;
    anomaly.description = std::string("Unusual ") +
                          category_to_string(category) +
                          " pattern for this time of day/week";
    anomalies.push_back(std::move(anomaly));
  }
  return anomalies;
}

std::vector<Anomaly> AnomalyDetector::detect(DataCategory category,
                                             const std::vector<Event> &events) const {
  std::vector<Anomaly> anomalies = detect_statistical(category, events);
  std::vector<Anomaly> contextual = detect_contextual(category, events);
  if (!anomalies.empty() || !contextual.empty()) {
    LOG(LogLevel::INFO, LogComponent::DETECT_ANOMALY,
        category_to_string(category) << ": " << anomalies.size()
                                     << " statistical, " << contextual.size()
                                     << " contextual anomalies");
  }
  anomalies.insert(anomalies.end(),
                   std::make_move_iterator(contextual.begin()),
                   std::make_move_iterator(contextual.end()));
  return anomalies;
}

} // namespace detection
