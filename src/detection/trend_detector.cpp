#include "trend_detector.hpp"
#include "core/logger.hpp"
#include "utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace detection {

std::vector<Event> sorted_by_time(const std::vector<Event> &events) {
  std::vector<Event> sorted = events;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Event &a, const Event &b) {
                     return a.timestamp_ms < b.timestamp_ms;
                   });
  return sorted;
}

TrendDetector::TrendDetector() = default;

TrendDetector::TrendDetector(const Config::TrendConfig &config)
    : config_(config) {}

LinearFit TrendDetector::fit(const std::vector<double> &values) const {
  LinearFit result;
  result.sample_count = values.size();
  if (values.size() < std::max<size_t>(config_.min_samples, 3))
    return result;

  const double n = static_cast<double>(values.size());
  double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_xx = 0.0;
  for (size_t i = 0; i < values.size(); ++i) {
    double x = static_cast<double>(i);
    sum_x += x;
    sum_y += values[i];
    sum_xy += x * values[i];
    sum_xx += x * x;
  }

  double denominator = n * sum_xx - sum_x * sum_x;
  if (denominator == 0.0)
    return result;

  result.slope = (n * sum_xy - sum_x * sum_y) / denominator;
  result.intercept = (sum_y - result.slope * sum_x) / n;

  double mean_y = sum_y / n;
  double total_ss = 0.0;
  double residual_ss = 0.0;
  for (size_t i = 0; i < values.size(); ++i) {
    double predicted = result.slope * static_cast<double>(i) + result.intercept;
    total_ss += (values[i] - mean_y) * (values[i] - mean_y);
    residual_ss += (values[i] - predicted) * (values[i] - predicted);
  }

  // A flat series explains nothing.
  if (total_ss > 0.0)
    result.confidence =
        Stats::clamp_finite(1.0 - residual_ss / total_ss, 0.0, 1.0);

  return result;
}

LinearFit TrendDetector::fit_events(const std::vector<Event> &events) const {
  std::vector<double> values;
  values.reserve(events.size());
  for (const auto &event : sorted_by_time(events))
    values.push_back(event.numeric_value());
  return fit(values);
}

std::string TrendDetector::describe(DataCategory category,
                                    const LinearFit &fit) const {
  const std::string direction = fit.slope > 0 ? "improving" : "declining";
  const std::string strength =
      std::abs(fit.slope) > config_.strong_slope ? "strongly" : "moderately";

  switch (category) {
  case DataCategory::HEALTH:
    return "Your health metrics are " + strength + " " + direction;
  case DataCategory::FINANCE:
    return "Your financial patterns show a " + strength + " " + direction +
           " trend";
  case DataCategory::PRODUCTIVITY:
    return "Your productivity is " + strength + " " + direction;
  case DataCategory::RELATIONSHIPS:
    return "Your relationship activities are " + strength + " " + direction;
  case DataCategory::CAREER:
    return "Your career development is " + strength + " " + direction;
  default:
    return std::string("Your ") + category_to_string(category) +
           " data shows a " + strength + " " + direction + " pattern";
  }
}

std::optional<Trend> TrendDetector::detect(DataCategory category,
                                           const std::vector<Event> &events) const {
  if (events.size() < config_.min_samples) {
    LOG(LogLevel::DEBUG, LogComponent::DETECT_TREND,
        "Skipping " << category_to_string(category) << ": only "
                    << events.size() << " samples");
    return std::nullopt;
  }

  std::vector<Event> sorted = sorted_by_time(events);
  std::vector<double> values;
  values.reserve(sorted.size());
  for (const auto &event : sorted)
    values.push_back(event.numeric_value());

  LinearFit result = fit(values);
  LOG(LogLevel::DEBUG, LogComponent::DETECT_TREND,
      category_to_string(category) << ": slope=" << result.slope
                                   << " r2=" << result.confidence);

  if (result.slope == 0.0 || result.confidence <= config_.min_confidence)
    return std::nullopt;

  Trend trend;
  trend.category = category;
  trend.direction = result.slope > 0 ? TrendDirection::INCREASING
                                     : TrendDirection::DECREASING;
  trend.strength = std::abs(result.slope);
  trend.slope = result.slope;
  trend.intercept = result.intercept;
  trend.confidence = result.confidence;
  trend.sample_count = result.sample_count;
  trend.duration_ms = sorted.back().timestamp_ms - sorted.front().timestamp_ms;
  trend.description = describe(category, result);
  return trend;
}

} // namespace detection
