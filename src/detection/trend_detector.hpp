#ifndef TREND_DETECTOR_HPP
#define TREND_DETECTOR_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "core/findings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace detection {

struct LinearFit {
  double slope = 0.0;
  double intercept = 0.0;
  double confidence = 0.0; // R², clamped to [0, 1]
  size_t sample_count = 0;
};

/**
 * Ordinary least squares of value against sample index. The index is used
 * instead of wall-clock time so the slope does not depend on sampling
 * density.
 */
class TrendDetector {
public:
  TrendDetector();
  explicit TrendDetector(const Config::TrendConfig &config);

  // Fit over raw values. Fewer than min_samples values yield a zero fit.
  LinearFit fit(const std::vector<double> &values) const;

  // Sorts by timestamp and fits the per-event numeric value.
  LinearFit fit_events(const std::vector<Event> &events) const;

  std::optional<Trend> detect(DataCategory category,
                              const std::vector<Event> &events) const;

  std::string describe(DataCategory category, const LinearFit &fit) const;

private:
  Config::TrendConfig config_;
};

// Stable time ordering shared by the detectors that care about sequence.
std::vector<Event> sorted_by_time(const std::vector<Event> &events);

} // namespace detection

#endif // TREND_DETECTOR_HPP
