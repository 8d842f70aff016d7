#include "prediction_engine.hpp"
#include "core/logger.hpp"
#include "utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace prediction {

PredictionEngine::PredictionEngine(
    const Config::PredictionConfig &config,
    const detection::TrendDetector &trend_detector)
    : config_(config), trend_detector_(trend_detector) {}

std::vector<PredictionPoint>
PredictionEngine::project(const detection::LinearFit &fit, double last_value,
                          int64_t reference_time_ms) const {
  std::vector<PredictionPoint> points;
  const size_t horizon = config_.horizon_days;
  if (horizon == 0)
    return points;

  points.reserve(horizon);
  for (size_t i = 1; i <= horizon; ++i) {
    const double step = static_cast<double>(i);
    PredictionPoint point;
    point.timestamp_ms = reference_time_ms + static_cast<int64_t>(i) * MS_PER_DAY;
    point.value = std::max(0.0, last_value + fit.slope * step);
    point.confidence = Stats::clamp_finite(
        fit.confidence *
            (1.0 - (step / static_cast<double>(horizon)) *
                       config_.confidence_decay),
        0.0, 1.0);
    points.push_back(point);
  }
  return points;
}

std::string PredictionEngine::describe(DataCategory category,
                                       double slope) const {
  const std::string magnitude =
      std::abs(slope) > config_.strong_slope ? "significantly" : "moderately";
  const std::string direction = slope > 0 ? "improve" : "decline";
  return std::string("Based on current patterns, your ") +
         category_to_string(category) + " is expected to " + magnitude + " " +
         direction + " over the next " + std::to_string(config_.horizon_days) +
         " days";
}

std::optional<Prediction>
PredictionEngine::predict(DataCategory category,
                          const std::vector<Event> &events,
                          int64_t reference_time_ms) const {
  if (events.empty() || config_.horizon_days == 0)
    return std::nullopt;

  std::vector<Event> sorted = detection::sorted_by_time(events);
  std::vector<double> values;
  values.reserve(sorted.size());
  for (const auto &event : sorted)
    values.push_back(event.numeric_value());

  detection::LinearFit fit = trend_detector_.fit(values);
  if (fit.confidence <= config_.min_confidence) {
    LOG(LogLevel::DEBUG, LogComponent::PREDICTION,
        "No forecast for " << category_to_string(category)
                           << ": fit confidence " << fit.confidence);
    return std::nullopt;
  }

  Prediction prediction;
  prediction.category = category;
  prediction.direction =
      fit.slope > 0 ? TrendDirection::INCREASING : TrendDirection::DECREASING;
  prediction.confidence = fit.confidence;
  prediction.slope = fit.slope;
  prediction.points = project(fit, values.back(), reference_time_ms);
  prediction.description = describe(category, fit.slope);
  return prediction;
}

} // namespace prediction
