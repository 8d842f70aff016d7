#ifndef LEARNING_PROFILE_HPP
#define LEARNING_PROFILE_HPP

#include "core/config.hpp"
#include "core/findings.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace learning {

// User feedback on one insight, as submitted.
struct Feedback {
  std::string insight_id;
  double rating = 0.0;
  std::string action;
  std::optional<InsightType> insight_type;
};

struct FeedbackEntry {
  std::string insight_id;
  std::optional<InsightType> insight_type;
  double rating; // [0, 1]
  std::string action;
  int64_t timestamp_ms;
};

struct ProfileSummary {
  size_t total_feedback = 0;
  double average_rating = 0.0;
  double learning_progress = 0.0; // [0, 1]
  // Only set once some weight has moved away from neutral.
  std::optional<InsightType> most_valued;
  std::optional<InsightType> least_valued;
};

/**
 * Per-user feedback history. The log is append-only; the summary and the
 * insight-type weights are maintained incrementally as entries are added.
 * Weights describe how much the user values each kind of insight and are
 * reported back with results. They never alter detector output.
 */
class LearningProfile {
public:
  explicit LearningProfile(std::string user_id = "default");
  LearningProfile(std::string user_id, const Config::LearningConfig &config);

  // Appends one entry. Ratings are clamped into [0, 1]; a non-finite rating
  // is rejected and false is returned.
  bool record(const Feedback &feedback, int64_t timestamp_ms);

  ProfileSummary summary() const;

  double weight_for(InsightType type) const;
  const std::map<InsightType, double> &insight_weights() const {
    return weights_;
  }
  const std::vector<FeedbackEntry> &feedback_log() const { return log_; }
  const std::string &user_id() const { return user_id_; }

private:
  void adjust_weight(InsightType type, double rating);

  std::string user_id_;
  Config::LearningConfig config_;
  std::vector<FeedbackEntry> log_;
  double average_rating_ = 0.0;
  std::map<InsightType, double> weights_;
};

} // namespace learning

#endif // LEARNING_PROFILE_HPP
