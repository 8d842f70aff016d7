#include "correlation_detector.hpp"
#include "core/logger.hpp"
#include "utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace detection {

CorrelationDetector::CorrelationDetector() = default;

CorrelationDetector::CorrelationDetector(
    const Config::CorrelationConfig &config)
    : config_(config) {}

AlignedSeries CorrelationDetector::align(const std::vector<Event> &a,
                                         const std::vector<Event> &b) const {
  AlignedSeries series;
  if (a.empty() || b.empty())
    return series;

  std::vector<const Event *> sorted_b;
  sorted_b.reserve(b.size());
  for (const auto &event : b)
    sorted_b.push_back(&event);
  std::stable_sort(sorted_b.begin(), sorted_b.end(),
                   [](const Event *x, const Event *y) {
                     return x->timestamp_ms < y->timestamp_ms;
                   });

  const auto tolerance = static_cast<double>(config_.alignment_tolerance_ms);

  for (const auto &event : a) {
    auto it = std::lower_bound(sorted_b.begin(), sorted_b.end(),
                               event.timestamp_ms,
                               [](const Event *x, int64_t ts) {
                                 return x->timestamp_ms < ts;
                               });

    // Candidates are the neighbours on either side. On equal distance the
    // earlier event wins.
    const Event *best = nullptr;
    double best_distance = 0.0;
    if (it != sorted_b.begin()) {
      const Event *before = *(it - 1);
      best = before;
      best_distance =
          static_cast<double>(event.timestamp_ms - before->timestamp_ms);
    }
    if (it != sorted_b.end()) {
      const Event *after = *it;
      double distance =
          static_cast<double>(after->timestamp_ms - event.timestamp_ms);
      if (best == nullptr || distance < best_distance) {
        best = after;
        best_distance = distance;
      }
    }

    if (best != nullptr && best_distance < tolerance) {
      series.a.push_back(event.numeric_value());
      series.b.push_back(best->numeric_value());
    }
  }
  return series;
}

std::string CorrelationDetector::describe(DataCategory category_a,
                                          DataCategory category_b,
                                          double coefficient) const {
  const std::string strength = std::abs(coefficient) > config_.strong_coefficient
                                   ? "strongly"
                                   : "moderately";
  const std::string other =
      coefficient > 0 ? "increase as well" : "decrease";
  return std::string("Your ") + category_to_string(category_a) + " and " +
         category_to_string(category_b) + " data " + strength +
         " correlate - when one increases, the other tends to " + other;
}

std::optional<Correlation>
CorrelationDetector::detect_pair(DataCategory category_a,
                                 const std::vector<Event> &a,
                                 DataCategory category_b,
                                 const std::vector<Event> &b) const {
  AlignedSeries series = align(a, b);
  const size_t min_pairs = std::max<size_t>(config_.min_aligned_pairs, 3);
  if (series.size() < min_pairs) {
    LOG(LogLevel::TRACE, LogComponent::DETECT_CORRELATION,
        category_to_string(category_a)
            << "/" << category_to_string(category_b) << ": "
            << series.size() << " aligned pairs, need " << min_pairs);
    return std::nullopt;
  }

  double coefficient = Stats::pearson(series.a, series.b);
  LOG(LogLevel::DEBUG, LogComponent::DETECT_CORRELATION,
      category_to_string(category_a)
          << "/" << category_to_string(category_b) << ": r=" << coefficient
          << " over " << series.size() << " pairs");

  if (std::abs(coefficient) <= config_.min_abs_coefficient)
    return std::nullopt;

  Correlation correlation;
  correlation.category_a = category_a;
  correlation.category_b = category_b;
  correlation.coefficient = coefficient;
  correlation.strength = std::abs(coefficient);
  correlation.confidence = std::min(
      1.0, static_cast<double>(series.size()) /
               static_cast<double>(std::max<size_t>(
                   config_.confidence_saturation_pairs, 1)));
  correlation.aligned_pairs = series.size();
  correlation.direction = coefficient > 0 ? CorrelationDirection::POSITIVE
                                          : CorrelationDirection::NEGATIVE;
  correlation.description = describe(category_a, category_b, coefficient);
  return correlation;
}

std::vector<Correlation> CorrelationDetector::detect(
    const std::map<DataCategory, std::vector<Event>> &groups) const {
  std::vector<Correlation> correlations;

  // std::map iterates in enumerator order, which fixes the pair order.
  for (auto first = groups.begin(); first != groups.end(); ++first) {
    if (first->second.empty())
      continue;
    for (auto second = std::next(first); second != groups.end(); ++second) {
      if (second->second.empty())
        continue;
      auto found = detect_pair(first->first, first->second, second->first,
                               second->second);
      if (found)
        correlations.push_back(std::move(*found));
    }
  }
  return correlations;
}

} // namespace detection
