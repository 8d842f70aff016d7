#ifndef ANOMALY_DETECTOR_HPP
#define ANOMALY_DETECTOR_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "core/findings.hpp"
#include "features/feature_extractor.hpp"

#include <optional>
#include <vector>

namespace detection {

struct ZScoreBaseline {
  double mean = 0.0;
  double std_dev = 0.0;
  size_t count = 0;

  // 0 when the spread is zero, so a flat series never flags.
  double z_score(double value) const {
    return std_dev > 0.0 ? (value - mean) / std_dev : 0.0;
  }
};

class AnomalyDetector {
public:
  AnomalyDetector(const Config::AnomalyConfig &config,
                  const features::FeatureExtractor &extractor);

  static ZScoreBaseline baseline(const std::vector<double> &values);

  // Severity for a z-score, or nullopt when it stays within the medium
  // threshold.
  std::optional<AnomalySeverity> classify(double z_score) const;

  std::vector<Anomaly> detect_statistical(DataCategory category,
                                          const std::vector<Event> &events) const;

  std::vector<Anomaly> detect_contextual(DataCategory category,
                                         const std::vector<Event> &events) const;

  // Statistical findings first, then contextual ones.
  std::vector<Anomaly> detect(DataCategory category,
                              const std::vector<Event> &events) const;

private:
  Config::AnomalyConfig config_;
  const features::FeatureExtractor &extractor_;
};

} // namespace detection

#endif // ANOMALY_DETECTOR_HPP
