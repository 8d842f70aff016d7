#ifndef CORRELATION_DETECTOR_HPP
#define CORRELATION_DETECTOR_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "core/findings.hpp"

#include <map>
#include <optional>
#include <vector>

namespace detection {

struct AlignedSeries {
  std::vector<double> a;
  std::vector<double> b;

  size_t size() const { return a.size(); }
};

class CorrelationDetector {
public:
  CorrelationDetector();
  explicit CorrelationDetector(const Config::CorrelationConfig &config);

  // Pairs every event of `a` with the nearest-in-time event of `b` closer
  // than the alignment tolerance. Unmatched events are dropped.
  AlignedSeries align(const std::vector<Event> &a,
                      const std::vector<Event> &b) const;

  std::optional<Correlation> detect_pair(DataCategory category_a,
                                         const std::vector<Event> &a,
                                         DataCategory category_b,
                                         const std::vector<Event> &b) const;

  // All unordered pairs of the non-empty groups, in category order.
  std::vector<Correlation>
  detect(const std::map<DataCategory, std::vector<Event>> &groups) const;

private:
  std::string describe(DataCategory category_a, DataCategory category_b,
                       double coefficient) const;

  Config::CorrelationConfig config_;
};

} // namespace detection

#endif // CORRELATION_DETECTOR_HPP
