#ifndef CLUSTER_DETECTOR_HPP
#define CLUSTER_DETECTOR_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "core/findings.hpp"
#include "features/feature_extractor.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace detection {

using Point = std::vector<double>;

struct KMeansResult {
  std::vector<size_t> assignments;
  std::vector<Point> centroids;
  size_t iterations = 0;
  bool converged = false;
};

/**
 * K-means over per-event feature points.
 *
 * A point is the event's normalized numeric features followed by hour / 24
 * and weekday / 7. Events with fewer numeric fields than the widest one in
 * the batch are zero-padded before the temporal part, so every point has the
 * same dimension.
 *
 * Everything random flows from the seed passed in: same seed and same input
 * give the same assignments.
 */
class ClusterDetector {
public:
  ClusterDetector(const Config::ClusteringConfig &config,
                  const features::FeatureExtractor &extractor);

  // Points for time-ordered events.
  std::vector<Point> build_points(const std::vector<Event> &events) const;

  KMeansResult kmeans(const std::vector<Point> &points, size_t k,
                      uint64_t seed) const;

  // Mean silhouette in [-1, 1]. Points whose silhouette is undefined
  // (no other non-empty cluster, or all distances zero) contribute 0.
  static double silhouette(const std::vector<Point> &points,
                           const std::vector<size_t> &assignments, size_t k);

  std::optional<ClusterAnalysis> detect(DataCategory category,
                                        const std::vector<Event> &events,
                                        uint64_t seed) const;

private:
  ClusterCharacteristics
  characterize(const std::vector<const Event *> &members) const;
  std::string describe(DataCategory category,
                       const std::vector<Cluster> &clusters) const;

  Config::ClusteringConfig config_;
  const features::FeatureExtractor &extractor_;
};

} // namespace detection

#endif // CLUSTER_DETECTOR_HPP
