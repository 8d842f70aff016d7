#include "cycle_detector.hpp"
#include "core/logger.hpp"
#include "utils/statistics.hpp"

#include <array>
#include <string>

namespace detection {

namespace {

const std::array<const char *, 7> DAY_NAMES = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday",
    "Saturday"};

std::string bucket_label(CyclePeriod period, size_t bucket) {
  switch (period) {
  case CyclePeriod::DAILY:
    return std::to_string(bucket) + ":00";
  case CyclePeriod::WEEKLY:
    return bucket < DAY_NAMES.size() ? DAY_NAMES[bucket] : "?";
  case CyclePeriod::MONTHLY:
    return "day " + std::to_string(bucket + 1);
  }
  return std::to_string(bucket);
}

} // namespace

CycleDetector::CycleDetector(const Config::CycleConfig &config,
                             const features::FeatureExtractor &extractor)
    : config_(config), extractor_(extractor) {}

size_t CycleDetector::bucket_count(CyclePeriod period) {
  switch (period) {
  case CyclePeriod::DAILY:
    return 24;
  case CyclePeriod::WEEKLY:
    return 7;
  case CyclePeriod::MONTHLY:
    return 31;
  }
  return 0;
}

size_t CycleDetector::bucket_for(const features::TemporalFeatures &temporal,
                                 CyclePeriod period) const {
  switch (period) {
  case CyclePeriod::DAILY:
    return static_cast<size_t>(temporal.hour_of_day);
  case CyclePeriod::WEEKLY:
    return static_cast<size_t>(temporal.day_of_week);
  case CyclePeriod::MONTHLY:
    return static_cast<size_t>(temporal.day_of_month - 1);
  }
  return 0;
}

CycleProfile CycleDetector::compute_profile(const std::vector<Event> &events,
                                            CyclePeriod period) const {
  const size_t buckets = bucket_count(period);
  std::vector<double> sums(buckets, 0.0);

  CycleProfile profile;
  profile.period = period;
  profile.counts.assign(buckets, 0);
  profile.averages.assign(buckets, 0.0);

  if (events.empty())
    return profile;

  for (const auto &event : events) {
    size_t bucket = bucket_for(extractor_.extract_temporal(event.timestamp_ms),
                               period);
    if (bucket >= buckets)
      continue;
    sums[bucket] += event.numeric_value();
    profile.counts[bucket]++;
  }

  for (size_t i = 0; i < buckets; ++i) {
    if (profile.counts[i] > 0)
      profile.averages[i] = sums[i] / static_cast<double>(profile.counts[i]);
  }

  double m = Stats::mean(profile.averages);
  double variance = Stats::population_variance(profile.averages);
  // +1 keeps the ratio bounded when the mean is near zero
  profile.strength = Stats::clamp_finite(variance / (m * m + 1.0), 0.0, 1.0);
  profile.peak_bucket = Stats::argmax(profile.averages);
  profile.trough_bucket = Stats::argmin(profile.averages);
  return profile;
}

std::string CycleDetector::describe(DataCategory category,
                                    const CycleProfile &profile) const {
  return std::string("Your ") + category_to_string(category) + " data follows a " +
         cycle_period_to_string(profile.period) + " rhythm, peaking at " +
         bucket_label(profile.period, profile.peak_bucket) +
         " and lowest at " +
         bucket_label(profile.period, profile.trough_bucket);
}

std::vector<Cycle> CycleDetector::detect(DataCategory category,
                                         const std::vector<Event> &events) const {
  std::vector<Cycle> cycles;
  if (events.empty())
    return cycles;

  for (CyclePeriod period :
       {CyclePeriod::DAILY, CyclePeriod::WEEKLY, CyclePeriod::MONTHLY}) {
    CycleProfile profile = compute_profile(events, period);
    LOG(LogLevel::DEBUG, LogComponent::DETECT_CYCLE,
        category_to_string(category)
            << " " << cycle_period_to_string(period)
            << " strength=" << profile.strength);

    if (profile.strength <= config_.min_strength)
      continue;

    Cycle cycle;
    cycle.category = category;
    cycle.period = period;
    cycle.strength = profile.strength;
    cycle.peak_bucket = profile.peak_bucket;
    cycle.trough_bucket = profile.trough_bucket;
    cycle.description = describe(category, profile);
    cycle.profile = std::move(profile.averages);
    cycles.push_back(std::move(cycle));
  }
  return cycles;
}

} // namespace detection
