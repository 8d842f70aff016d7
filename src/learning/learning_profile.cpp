#include "learning_profile.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace learning {

LearningProfile::LearningProfile(std::string user_id)
    : LearningProfile(std::move(user_id), Config::LearningConfig{}) {}

LearningProfile::LearningProfile(std::string user_id,
                                 const Config::LearningConfig &config)
    : user_id_(std::move(user_id)), config_(config) {
  for (InsightType type : ALL_INSIGHT_TYPES)
    weights_[type] = 1.0;
}

bool LearningProfile::record(const Feedback &feedback, int64_t timestamp_ms) {
  if (!std::isfinite(feedback.rating)) {
    LOG(LogLevel::WARN, LogComponent::LEARNING,
        "Rejected feedback for insight '" << feedback.insight_id
                                          << "' from user " << user_id_
                                          << ": rating is not a number");
    return false;
  }

  double rating = std::clamp(feedback.rating, 0.0, 1.0);
  log_.push_back({feedback.insight_id, feedback.insight_type, rating,
                  feedback.action, timestamp_ms});
  average_rating_ +=
      (rating - average_rating_) / static_cast<double>(log_.size());

  if (feedback.insight_type)
    adjust_weight(*feedback.insight_type, rating);

  LOG(LogLevel::DEBUG, LogComponent::LEARNING,
      "User " << user_id_ << " rated " << feedback.insight_id << " "
              << rating << " (" << feedback.action << "), "
              << log_.size() << " entries");
  return true;
}

void LearningProfile::adjust_weight(InsightType type, double rating) {
  double &weight = weights_[type];
  if (rating > config_.positive_rating_threshold)
    weight += config_.weight_step;
  else if (rating < config_.negative_rating_threshold)
    weight -= config_.weight_step;
  weight = std::clamp(weight, config_.min_weight, config_.max_weight);
}

double LearningProfile::weight_for(InsightType type) const {
  auto it = weights_.find(type);
  return it != weights_.end() ? it->second : 1.0;
}

ProfileSummary LearningProfile::summary() const {
  ProfileSummary result;
  result.total_feedback = log_.size();
  result.average_rating = average_rating_;
  const double saturation = static_cast<double>(
      std::max<size_t>(config_.progress_saturation_feedback, 1));
  result.learning_progress =
      std::min(1.0, static_cast<double>(log_.size()) / saturation);

  bool any_moved = std::any_of(
      weights_.begin(), weights_.end(),
      [](const auto &entry) { return entry.second != 1.0; });
  if (!any_moved)
    return result;

  // Ties resolve to the first type in enumeration order.
  auto most = weights_.begin();
  auto least = weights_.begin();
  for (auto it = weights_.begin(); it != weights_.end(); ++it) {
    if (it->second > most->second)
      most = it;
    if (it->second < least->second)
      least = it;
  }
  result.most_valued = most->first;
  result.least_valued = least->first;
  return result;
}

} // namespace learning
