#include "cluster_detector.hpp"
#include "core/logger.hpp"
#include "detection/trend_detector.hpp"
#include "utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <random>
#include <string>

namespace detection {

namespace {

// Most frequent value; ties go to whichever value was seen first.
template <typename T> T dominant_value(const std::vector<T> &values) {
  std::map<T, size_t> counts;
  size_t best_count = 0;
  for (const auto &value : values)
    best_count = std::max(best_count, ++counts[value]);
  for (const auto &value : values) {
    if (counts[value] == best_count)
      return value;
  }
  return T{};
}

} // namespace

ClusterDetector::ClusterDetector(const Config::ClusteringConfig &config,
                                 const features::FeatureExtractor &extractor)
    : config_(config), extractor_(extractor) {}

std::vector<Point>
ClusterDetector::build_points(const std::vector<Event> &events) const {
  std::vector<features::FeatureVector> vectors;
  vectors.reserve(events.size());
  size_t width = 0;
  for (const auto &event : events) {
    vectors.push_back(extractor_.extract(event));
    width = std::max(width, vectors.back().numerical_features.size());
  }

  std::vector<Point> points;
  points.reserve(vectors.size());
  for (const auto &fv : vectors) {
    Point point(width + 2, 0.0);
    for (size_t i = 0; i < fv.numerical_features.size(); ++i)
      point[i] = fv.numerical_features[i].normalized_value;
    point[width] = static_cast<double>(fv.temporal.hour_of_day) / 24.0;
    point[width + 1] = static_cast<double>(fv.temporal.day_of_week) / 7.0;
    points.push_back(std::move(point));
  }
  return points;
}

KMeansResult ClusterDetector::kmeans(const std::vector<Point> &points,
                                     size_t k, uint64_t seed) const {
  KMeansResult result;
  const size_t n = points.size();
  k = std::min(k, n);
  if (k == 0)
    return result;

  // Partial Fisher-Yates: the first k slots become k distinct indices.
  std::mt19937_64 rng(seed);
  std::vector<size_t> indices(n);
  std::iota(indices.begin(), indices.end(), 0);
  for (size_t i = 0; i < k; ++i) {
    std::uniform_int_distribution<size_t> pick(i, n - 1);
    std::swap(indices[i], indices[pick(rng)]);
  }
  for (size_t i = 0; i < k; ++i)
    result.centroids.push_back(points[indices[i]]);

  result.assignments.assign(n, 0);
  const size_t dimension = points.front().size();
  const size_t max_iterations = std::max<size_t>(config_.max_iterations, 1);

  auto assign_nearest = [&]() {
    for (size_t p = 0; p < n; ++p) {
      size_t best = 0;
      double best_distance = std::numeric_limits<double>::infinity();
      for (size_t c = 0; c < k; ++c) {
        double d = Stats::euclidean_distance(points[p], result.centroids[c]);
        if (d < best_distance) {
          best_distance = d;
          best = c;
        }
      }
      result.assignments[p] = best;
    }
  };

  while (result.iterations < max_iterations) {
    ++result.iterations;
    assign_nearest();

    std::vector<Point> sums(k, Point(dimension, 0.0));
    std::vector<size_t> counts(k, 0);
    for (size_t p = 0; p < n; ++p) {
      size_t c = result.assignments[p];
      for (size_t d = 0; d < dimension; ++d)
        sums[c][d] += points[p][d];
      counts[c]++;
    }

    double max_shift = 0.0;
    for (size_t c = 0; c < k; ++c) {
      if (counts[c] == 0)
        continue; // keeps its previous centroid
      for (size_t d = 0; d < dimension; ++d)
        sums[c][d] /= static_cast<double>(counts[c]);
      max_shift = std::max(
          max_shift, Stats::euclidean_distance(result.centroids[c], sums[c]));
      result.centroids[c] = std::move(sums[c]);
    }

    if (max_shift < config_.convergence_threshold) {
      result.converged = true;
      break;
    }
  }
  // The last update moved the centroids, so the assignments must follow them.
  if (!result.converged)
    assign_nearest();
  return result;
}

double ClusterDetector::silhouette(const std::vector<Point> &points,
                                   const std::vector<size_t> &assignments,
                                   size_t k) {
  const size_t n = points.size();
  if (n < 2 || assignments.size() != n || k == 0)
    return 0.0;

  std::vector<size_t> cluster_sizes(k, 0);
  for (size_t c : assignments) {
    if (c < k)
      cluster_sizes[c]++;
  }

  double total = 0.0;
  for (size_t i = 0; i < n; ++i) {
    std::vector<double> distance_sums(k, 0.0);
    for (size_t j = 0; j < n; ++j) {
      if (j == i)
        continue;
      distance_sums[assignments[j]] +=
          Stats::euclidean_distance(points[i], points[j]);
    }

    const size_t own = assignments[i];
    const size_t peers = cluster_sizes[own] - 1;
    double a = peers > 0 ? distance_sums[own] / static_cast<double>(peers)
                         : 0.0;

    double b = std::numeric_limits<double>::infinity();
    for (size_t c = 0; c < k; ++c) {
      if (c == own || cluster_sizes[c] == 0)
        continue;
      b = std::min(b, distance_sums[c] / static_cast<double>(cluster_sizes[c]));
    }

    double denominator = std::max(a, b);
    if (std::isinf(b) || denominator == 0.0)
      continue;
    total += (b - a) / denominator;
  }

  return Stats::clamp_finite(total / static_cast<double>(n), -1.0, 1.0);
}

ClusterCharacteristics ClusterDetector::characterize(
    const std::vector<const Event *> &members) const {
  std::vector<int> hours;
  std::vector<int> weekdays;
  std::vector<features::TimeOfDay> times_of_day;
  std::vector<std::string> sources;
  for (const Event *event : members) {
    features::TemporalFeatures temporal =
        extractor_.extract_temporal(event->timestamp_ms);
    hours.push_back(temporal.hour_of_day);
    weekdays.push_back(temporal.day_of_week);
    times_of_day.push_back(temporal.time_of_day);
    sources.push_back(event->source);
  }

  ClusterCharacteristics characteristics;
  characteristics.dominant_hour_of_day = dominant_value(hours);
  characteristics.dominant_day_of_week = dominant_value(weekdays);
  characteristics.dominant_time_of_day = dominant_value(times_of_day);
  characteristics.dominant_source = dominant_value(sources);
  return characteristics;
}

std::string
ClusterDetector::describe(DataCategory category,
                          const std::vector<Cluster> &clusters) const {
  size_t total = 0;
  for (const auto &cluster : clusters)
    total += cluster.size;

  std::string parts;
  for (const auto &cluster : clusters) {
    if (cluster.size == 0 || !cluster.characteristics)
      continue;
    long percent = std::lround(static_cast<double>(cluster.size) * 100.0 /
                               static_cast<double>(total));
    if (!parts.empty())
      parts += ", ";
    parts += "Cluster " + std::to_string(cluster.id + 1) + ": " +
             std::to_string(percent) + "% of data points, " +
             features::time_of_day_to_string(
                 cluster.characteristics->dominant_time_of_day) +
             " patterns";
  }

  return "Identified " + std::to_string(clusters.size()) + " distinct " +
         category_to_string(category) + " patterns: " + parts;
}

std::optional<ClusterAnalysis>
ClusterDetector::detect(DataCategory category, const std::vector<Event> &events,
                        uint64_t seed) const {
  if (events.size() < config_.min_samples || events.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::DETECT_CLUSTER,
        "Skipping " << category_to_string(category) << ": only "
                    << events.size() << " samples");
    return std::nullopt;
  }

  std::vector<Event> sorted = sorted_by_time(events);
  std::vector<Point> points = build_points(sorted);
  KMeansResult fit = kmeans(points, config_.k, seed);
  const size_t k = fit.centroids.size();

  ClusterAnalysis analysis;
  analysis.category = category;
  analysis.assignments = fit.assignments;
  analysis.iterations = fit.iterations;
  analysis.seed = seed;
  analysis.silhouette = silhouette(points, fit.assignments, k);

  for (size_t c = 0; c < k; ++c) {
    Cluster cluster;
    cluster.id = c;
    std::vector<const Event *> members;
    std::vector<double> values;
    for (size_t p = 0; p < sorted.size(); ++p) {
      if (fit.assignments[p] != c)
        continue;
      members.push_back(&sorted[p]);
      cluster.member_ids.push_back(sorted[p].id);
      values.push_back(sorted[p].numeric_value());
    }
    cluster.size = members.size();

    if (!members.empty()) {
      ClusterCenter center;
      center.mean = Stats::mean(values);
      center.min = *std::min_element(values.begin(), values.end());
      center.max = *std::max_element(values.begin(), values.end());
      center.std_dev = Stats::population_stddev(values);
      cluster.center = center;
      cluster.characteristics = characterize(members);
    }
    analysis.clusters.push_back(std::move(cluster));
  }

  analysis.description = describe(category, analysis.clusters);
  LOG(LogLevel::DEBUG, LogComponent::DETECT_CLUSTER,
      category_to_string(category)
          << ": k=" << k << " iterations=" << fit.iterations
          << (fit.converged ? " (converged)" : " (iteration cap)")
          << " silhouette=" << analysis.silhouette << " seed=" << seed);
  return analysis;
}

} // namespace detection
