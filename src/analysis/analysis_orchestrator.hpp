#ifndef ANALYSIS_ORCHESTRATOR_HPP
#define ANALYSIS_ORCHESTRATOR_HPP

#include "analysis_result.hpp"
#include "core/config.hpp"
#include "core/event.hpp"
#include "detection/anomaly_detector.hpp"
#include "detection/cluster_detector.hpp"
#include "detection/correlation_detector.hpp"
#include "detection/cycle_detector.hpp"
#include "detection/trend_detector.hpp"
#include "features/feature_extractor.hpp"
#include "learning/learning_profile.hpp"
#include "prediction/prediction_engine.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace analysis {

// Everything the per-category detectors found for one category.
struct CategoryFindings {
  DataCategory category;
  std::optional<Trend> trend;
  std::vector<Cycle> cycles;
  std::vector<Anomaly> anomalies;
  std::optional<ClusterAnalysis> clusters;
  std::optional<Prediction> prediction;
};

/**
 * Runs the whole pipeline over one user's batch.
 *
 * The orchestrator holds no per-request state: the learning profile goes in
 * as an argument and comes back out as part of the outcome, so one instance
 * can serve concurrent requests. It owns the detectors, which keep references
 * to its feature extractor, and is therefore neither copyable nor movable.
 */
class AnalysisOrchestrator {
public:
  explicit AnalysisOrchestrator(const Config::AppConfig &cfg);

  AnalysisOrchestrator(const AnalysisOrchestrator &) = delete;
  AnalysisOrchestrator &operator=(const AnalysisOrchestrator &) = delete;

  /**
   * @throws FeatureExtractionError if any event has an unusable timestamp
   * @throws InvalidBatchError if any event carries a non-finite value
   * @throws std::invalid_argument if no clustering seed is available and
   * the configuration demands an explicit one
   */
  AnalysisOutcome analyze(const std::vector<Event> &events,
                          const learning::LearningProfile &prior_profile,
                          const AnalysisOptions &options = {}) const;

  FeedbackOutcome
  submit_feedback(const learning::LearningProfile &profile,
                  const std::vector<learning::Feedback> &feedback,
                  int64_t now_ms) const;

  CategoryFindings analyze_category(DataCategory category,
                                    const std::vector<Event> &events,
                                    uint64_t seed,
                                    int64_t reference_time_ms) const;

  double data_quality(const std::vector<Event> &events,
                      int64_t reference_time_ms) const;
  double data_volume(size_t event_count) const;

private:
  void validate_batch(const std::vector<Event> &events) const;
  uint64_t resolve_seed(const AnalysisOptions &options) const;
  double consistency(
      const std::map<DataCategory, std::vector<Event>> &groups) const;

  Config::AppConfig config_;
  features::FeatureExtractor extractor_;
  detection::TrendDetector trend_detector_;
  detection::CycleDetector cycle_detector_;
  detection::CorrelationDetector correlation_detector_;
  detection::AnomalyDetector anomaly_detector_;
  detection::ClusterDetector cluster_detector_;
  prediction::PredictionEngine prediction_engine_;
};

// Groups events by category, preserving input order within each group.
std::map<DataCategory, std::vector<Event>>
group_by_category(const std::vector<Event> &events);

} // namespace analysis

#endif // ANALYSIS_ORCHESTRATOR_HPP
