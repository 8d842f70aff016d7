#ifndef ANALYSIS_RESULT_HPP
#define ANALYSIS_RESULT_HPP

#include "core/findings.hpp"
#include "learning/learning_profile.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace analysis {

struct AnalysisResult {
  int64_t generated_at_ms = 0;
  size_t event_count = 0;

  std::vector<Trend> trends;
  std::vector<Cycle> cycles;
  std::vector<Correlation> correlations;
  std::vector<Anomaly> anomalies;
  std::vector<ClusterAnalysis> clusters;
  std::vector<Prediction> predictions;

  double data_quality = 0.0;
  double data_volume = 0.0;
  double pattern_strength = 0.0;
  double overall_confidence = 0.0;

  // Copied from the profile the analysis ran with.
  learning::ProfileSummary profile_summary;
  std::map<InsightType, double> insight_weights;
};

struct AnalysisOptions {
  // Defaults to the wall clock. Recency and forecast timestamps are measured
  // from here.
  std::optional<int64_t> reference_time_ms;
  // Overrides the configured clustering seed.
  std::optional<uint64_t> seed;
  // Overrides the configured parallel_categories flag.
  std::optional<bool> parallel;
};

struct AnalysisOutcome {
  AnalysisResult result;
  learning::LearningProfile profile;
};

struct FeedbackOutcome {
  learning::LearningProfile profile;
  learning::ProfileSummary summary;
};

} // namespace analysis

#endif // ANALYSIS_RESULT_HPP
