#ifndef PREDICTION_ENGINE_HPP
#define PREDICTION_ENGINE_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "core/findings.hpp"
#include "detection/trend_detector.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace prediction {

constexpr int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

// Extends the per-category trend line forward one step per day.
class PredictionEngine {
public:
  PredictionEngine(const Config::PredictionConfig &config,
                   const detection::TrendDetector &trend_detector);

  std::vector<PredictionPoint> project(const detection::LinearFit &fit,
                                       double last_value,
                                       int64_t reference_time_ms) const;

  std::optional<Prediction> predict(DataCategory category,
                                    const std::vector<Event> &events,
                                    int64_t reference_time_ms) const;

private:
  std::string describe(DataCategory category, double slope) const;

  Config::PredictionConfig config_;
  const detection::TrendDetector &trend_detector_;
};

} // namespace prediction

#endif // PREDICTION_ENGINE_HPP
