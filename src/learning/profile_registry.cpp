#include "profile_registry.hpp"
#include "core/logger.hpp"

namespace learning {

ProfileRegistry::ProfileRegistry(const Config::LearningConfig &config)
    : config_(config) {}

std::shared_ptr<ProfileRegistry::Slot>
ProfileRegistry::slot_for(const std::string &user_id) {
  {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    auto it = slots_.find(user_id);
    if (it != slots_.end())
      return it->second;
  }

  std::unique_lock<std::shared_mutex> lock(slots_mutex_);
  // Another writer may have created it between the two locks.
  auto it = slots_.find(user_id);
  if (it != slots_.end())
    return it->second;

  auto slot = std::make_shared<Slot>(LearningProfile(user_id, config_));
  slots_.emplace(user_id, slot);
  LOG(LogLevel::DEBUG, LogComponent::LEARNING,
      "Created learning profile for user " << user_id);
  return slot;
}

LearningProfile ProfileRegistry::snapshot(const std::string &user_id) {
  auto slot = slot_for(user_id);
  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->profile;
}

void ProfileRegistry::with_profile(
    const std::string &user_id,
    const std::function<void(LearningProfile &)> &update) {
  auto slot = slot_for(user_id);
  std::lock_guard<std::mutex> lock(slot->mutex);
  update(slot->profile);
}

ProfileSummary ProfileRegistry::submit(const std::string &user_id,
                                       const std::vector<Feedback> &feedback,
                                       int64_t timestamp_ms) {
  ProfileSummary summary;
  size_t rejected = 0;
  with_profile(user_id, [&](LearningProfile &profile) {
    for (const auto &entry : feedback) {
      if (!profile.record(entry, timestamp_ms))
        ++rejected;
    }
    summary = profile.summary();
  });
  if (rejected > 0) {
    LOG(LogLevel::WARN, LogComponent::LEARNING,
        rejected << " of " << feedback.size()
                 << " feedback entries rejected for user " << user_id);
  }
  return summary;
}

size_t ProfileRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(slots_mutex_);
  return slots_.size();
}

} // namespace learning
