#include "analysis_orchestrator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/statistics.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iterator>
#include <limits>
#include <random>
#include <set>
#include <stdexcept>

namespace analysis {

namespace {

// Sums of squares over a batch must stay finite.
constexpr double MAX_FIELD_MAGNITUDE = 1e150;

template <typename T>
void append(std::vector<T> &into, std::vector<T> &&from) {
  into.insert(into.end(), std::make_move_iterator(from.begin()),
              std::make_move_iterator(from.end()));
}

} // namespace

std::map<DataCategory, std::vector<Event>>
group_by_category(const std::vector<Event> &events) {
  std::map<DataCategory, std::vector<Event>> groups;
  for (const auto &event : events)
    groups[event.category].push_back(event);
  return groups;
}

AnalysisOrchestrator::AnalysisOrchestrator(const Config::AppConfig &cfg)
    : config_(cfg), extractor_(cfg.features), trend_detector_(cfg.trend),
      cycle_detector_(cfg.cycle, extractor_),
      correlation_detector_(cfg.correlation),
      anomaly_detector_(cfg.anomaly, extractor_),
      cluster_detector_(cfg.clustering, extractor_),
      prediction_engine_(cfg.prediction, trend_detector_) {
  LOG(LogLevel::INFO, LogComponent::ORCHESTRATOR,
      "AnalysisOrchestrator created (parallel_categories="
          << (config_.parallel_categories ? "true" : "false") << ")");
}

void AnalysisOrchestrator::validate_batch(
    const std::vector<Event> &events) const {
  for (const auto &event : events) {
    // Throws FeatureExtractionError for unusable timestamps.
    features::FeatureVector fv = extractor_.extract(event);
    for (const auto &feature : fv.numerical_features) {
      if (!std::isfinite(feature.raw_value))
        throw InvalidBatchError("Event '" + event.id + "' field '" +
                                feature.name + "' is not a finite number");
      if (std::abs(feature.raw_value) > MAX_FIELD_MAGNITUDE)
        throw InvalidBatchError("Event '" + event.id + "' field '" +
                                feature.name + "' is out of range");
    }
  }
}

uint64_t
AnalysisOrchestrator::resolve_seed(const AnalysisOptions &options) const {
  if (options.seed)
    return *options.seed;
  if (config_.clustering.seed)
    return *config_.clustering.seed;
  if (config_.clustering.require_explicit_seed)
    throw std::invalid_argument(
        "Clustering requires an explicit seed but none was given");

  std::random_device device;
  uint64_t seed = (static_cast<uint64_t>(device()) << 32) | device();
  LOG(LogLevel::INFO, LogComponent::ORCHESTRATOR,
      "No clustering seed given, using random seed " << seed);
  return seed;
}

CategoryFindings AnalysisOrchestrator::analyze_category(
    DataCategory category, const std::vector<Event> &events, uint64_t seed,
    int64_t reference_time_ms) const {
  CategoryFindings findings;
  findings.category = category;

  if (config_.trend.enabled)
    findings.trend = trend_detector_.detect(category, events);
  if (config_.cycle.enabled)
    findings.cycles = cycle_detector_.detect(category, events);
  if (config_.anomaly.enabled)
    findings.anomalies = anomaly_detector_.detect(category, events);
  if (config_.clustering.enabled)
    findings.clusters = cluster_detector_.detect(category, events, seed);
  if (config_.prediction.enabled)
    findings.prediction =
        prediction_engine_.predict(category, events, reference_time_ms);

  return findings;
}

double AnalysisOrchestrator::consistency(
    const std::map<DataCategory, std::vector<Event>> &groups) const {
  double sum = 0.0;
  size_t counted = 0;
  for (const auto &[category, events] : groups) {
    if (events.size() <= 1)
      continue;
    std::vector<double> values;
    values.reserve(events.size());
    for (const auto &event : events)
      values.push_back(event.numeric_value());

    double m = Stats::mean(values);
    double sd = Stats::population_stddev(values);
    double cv;
    if (m == 0.0)
      cv = sd == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
    else
      cv = sd / std::abs(m);

    sum += std::isinf(cv) ? 0.0 : Stats::clamp_finite(1.0 - cv, 0.0, 1.0);
    ++counted;
  }
  return counted > 0 ? sum / static_cast<double>(counted) : 0.5;
}

double AnalysisOrchestrator::data_quality(const std::vector<Event> &events,
                                          int64_t reference_time_ms) const {
  if (events.empty())
    return 0.0;

  const int64_t window_ms =
      static_cast<int64_t>(config_.confidence.recency_window_days) *
      prediction::MS_PER_DAY;
  const int64_t cutoff = reference_time_ms - window_ms;
  size_t recent = static_cast<size_t>(
      std::count_if(events.begin(), events.end(), [cutoff](const Event &e) {
        return e.timestamp_ms > cutoff;
      }));
  double recency =
      static_cast<double>(recent) / static_cast<double>(events.size());

  std::set<DataCategory> distinct;
  for (const auto &event : events)
    distinct.insert(event.category);
  double variety = static_cast<double>(distinct.size()) /
                   static_cast<double>(KNOWN_CATEGORY_COUNT);

  double consistency_score = consistency(group_by_category(events));

  return Stats::clamp_finite((recency + variety + consistency_score) / 3.0,
                             0.0, 1.0);
}

double AnalysisOrchestrator::data_volume(size_t event_count) const {
  const double saturation = static_cast<double>(
      std::max<size_t>(config_.confidence.volume_saturation_events, 1));
  return std::min(1.0, static_cast<double>(event_count) / saturation);
}

AnalysisOutcome
AnalysisOrchestrator::analyze(const std::vector<Event> &events,
                              const learning::LearningProfile &prior_profile,
                              const AnalysisOptions &options) const {
  auto start = std::chrono::steady_clock::now();
  const int64_t reference_time_ms =
      options.reference_time_ms
          ? *options.reference_time_ms
          : static_cast<int64_t>(Utils::get_current_time_ms());

  validate_batch(events);

  auto groups = group_by_category(events);
  const bool parallel = options.parallel.value_or(config_.parallel_categories);
  // Only resolved when clustering can actually run, so batches too small to
  // cluster never trip the explicit-seed requirement.
  bool needs_seed = false;
  if (config_.clustering.enabled) {
    for (const auto &[category, group] : groups) {
      if (group.size() >= config_.clustering.min_samples) {
        needs_seed = true;
        break;
      }
    }
  }
  const uint64_t seed = needs_seed ? resolve_seed(options) : 0;

  LOG(LogLevel::INFO, LogComponent::ORCHESTRATOR,
      "Analyzing " << events.size() << " events in " << groups.size()
                   << " categories for user " << prior_profile.user_id()
                   << (parallel ? " (parallel)" : ""));

  std::vector<CategoryFindings> per_category;
  per_category.reserve(groups.size());
  if (parallel && groups.size() > 1) {
    std::vector<std::future<CategoryFindings>> futures;
    futures.reserve(groups.size());
    for (const auto &[category, group] : groups) {
      futures.push_back(std::async(
          std::launch::async,
          [this, category = category, &group = group, seed,
           reference_time_ms] {
            return analyze_category(category, group, seed, reference_time_ms);
          }));
    }
    // get() rethrows whatever a worker threw; collecting in map order keeps
    // the merge order identical to the sequential path.
    for (auto &future : futures)
      per_category.push_back(future.get());
  } else {
    for (const auto &[category, group] : groups)
      per_category.push_back(
          analyze_category(category, group, seed, reference_time_ms));
  }

  AnalysisResult result;
  result.generated_at_ms = reference_time_ms;
  result.event_count = events.size();
  for (auto &findings : per_category) {
    if (findings.trend)
      result.trends.push_back(std::move(*findings.trend));
    append(result.cycles, std::move(findings.cycles));
    append(result.anomalies, std::move(findings.anomalies));
    if (findings.clusters)
      result.clusters.push_back(std::move(*findings.clusters));
    if (findings.prediction)
      result.predictions.push_back(std::move(*findings.prediction));
  }

  if (config_.correlation.enabled)
    result.correlations = correlation_detector_.detect(groups);

  result.data_quality = data_quality(events, reference_time_ms);
  result.data_volume = data_volume(events.size());
  result.pattern_strength =
      Stats::clamp_finite(config_.confidence.pattern_strength, 0.0, 1.0);
  result.overall_confidence = Stats::clamp_finite(
      (result.data_quality + result.data_volume + result.pattern_strength) /
          3.0,
      0.0, 1.0);

  result.profile_summary = prior_profile.summary();
  result.insight_weights = prior_profile.insight_weights();

  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();
  LOG(LogLevel::INFO, LogComponent::ORCHESTRATOR,
      "Analysis done in " << elapsed_ms << "ms: " << result.trends.size()
                          << " trends, " << result.cycles.size()
                          << " cycles, " << result.correlations.size()
                          << " correlations, " << result.anomalies.size()
                          << " anomalies, " << result.clusters.size()
                          << " cluster sets, " << result.predictions.size()
                          << " predictions, confidence "
                          << result.overall_confidence);

  return AnalysisOutcome{std::move(result), prior_profile};
}

FeedbackOutcome AnalysisOrchestrator::submit_feedback(
    const learning::LearningProfile &profile,
    const std::vector<learning::Feedback> &feedback, int64_t now_ms) const {
  FeedbackOutcome outcome{profile, {}};
  size_t accepted = 0;
  for (const auto &entry : feedback) {
    if (outcome.profile.record(entry, now_ms))
      ++accepted;
  }
  outcome.summary = outcome.profile.summary();
  LOG(LogLevel::INFO, LogComponent::LEARNING,
      "Recorded " << accepted << "/" << feedback.size()
                  << " feedback entries for user " << profile.user_id()
                  << ", total " << outcome.summary.total_feedback);
  return outcome;
}

} // namespace analysis
