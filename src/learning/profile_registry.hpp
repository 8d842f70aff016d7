#ifndef PROFILE_REGISTRY_HPP
#define PROFILE_REGISTRY_HPP

#include "core/config.hpp"
#include "learning_profile.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace learning {

/**
 * Process-scoped store of learning profiles keyed by user id. Updates for
 * one user are serialized on that user's own mutex, so different users never
 * contend beyond the brief map lookup.
 */
class ProfileRegistry {
public:
  explicit ProfileRegistry(const Config::LearningConfig &config = {});

  // Copy of the user's current profile; an empty one for unknown users.
  LearningProfile snapshot(const std::string &user_id);

  // Runs `update` with the user's profile locked.
  void with_profile(const std::string &user_id,
                    const std::function<void(LearningProfile &)> &update);

  ProfileSummary submit(const std::string &user_id,
                        const std::vector<Feedback> &feedback,
                        int64_t timestamp_ms);

  size_t size() const;

private:
  struct Slot {
    std::mutex mutex;
    LearningProfile profile;

    explicit Slot(LearningProfile p) : profile(std::move(p)) {}
  };

  std::shared_ptr<Slot> slot_for(const std::string &user_id);

  Config::LearningConfig config_;
  mutable std::shared_mutex slots_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace learning

#endif // PROFILE_REGISTRY_HPP
