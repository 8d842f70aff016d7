#ifndef CYCLE_DETECTOR_HPP
#define CYCLE_DETECTOR_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "core/findings.hpp"
#include "features/feature_extractor.hpp"

#include <vector>

namespace detection {

struct CycleProfile {
  CyclePeriod period;
  std::vector<double> averages; // 0 for buckets without samples
  std::vector<size_t> counts;
  double strength = 0.0;
  size_t peak_bucket = 0;
  size_t trough_bucket = 0;
};

/**
 * Bucket-average periodicity detection. Buckets are hour of day (24),
 * day of week (7) and day of month (31, bucket 0 = the 1st).
 */
class CycleDetector {
public:
  CycleDetector(const Config::CycleConfig &config,
                const features::FeatureExtractor &extractor);

  CycleProfile compute_profile(const std::vector<Event> &events,
                               CyclePeriod period) const;

  std::vector<Cycle> detect(DataCategory category,
                            const std::vector<Event> &events) const;

  static size_t bucket_count(CyclePeriod period);

private:
  size_t bucket_for(const features::TemporalFeatures &temporal,
                    CyclePeriod period) const;
  std::string describe(DataCategory category, const CycleProfile &profile) const;

  Config::CycleConfig config_;
  const features::FeatureExtractor &extractor_;
};

} // namespace detection

#endif // CYCLE_DETECTOR_HPP
