#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *EVENTS_INPUT_PATH = "events_input_path";
constexpr const char *FEEDBACK_INPUT_PATH = "feedback_input_path";
constexpr const char *RESULT_OUTPUT_PATH = "result_output_path";
constexpr const char *USER_ID = "user_id";
constexpr const char *UTC_OFFSET_MINUTES = "utc_offset_minutes";
constexpr const char *PARALLEL_CATEGORIES = "parallel_categories";
constexpr const char *PRETTY_PRINT_RESULT = "pretty_print_result";

// Trend Settings
constexpr const char *TR_ENABLED = "enabled";
constexpr const char *TR_MIN_SAMPLES = "min_samples";
constexpr const char *TR_MIN_CONFIDENCE = "min_confidence";
constexpr const char *TR_STRONG_SLOPE = "strong_slope";

// Cycle Settings
constexpr const char *CY_ENABLED = "enabled";
constexpr const char *CY_MIN_STRENGTH = "min_strength";

// Correlation Settings
constexpr const char *CO_ENABLED = "enabled";
constexpr const char *CO_MIN_ALIGNED_PAIRS = "min_aligned_pairs";
constexpr const char *CO_ALIGNMENT_TOLERANCE_MS = "alignment_tolerance_ms";
constexpr const char *CO_MIN_ABS_COEFFICIENT = "min_abs_coefficient";
constexpr const char *CO_CONFIDENCE_SATURATION_PAIRS =
    "confidence_saturation_pairs";
constexpr const char *CO_STRONG_COEFFICIENT = "strong_coefficient";

// Anomaly Settings
constexpr const char *AN_ENABLED = "enabled";
constexpr const char *AN_MIN_SAMPLES = "min_samples";
constexpr const char *AN_MEDIUM_Z_THRESHOLD = "medium_z_threshold";
constexpr const char *AN_HIGH_Z_THRESHOLD = "high_z_threshold";
constexpr const char *AN_CONTEXTUAL_ENABLED = "contextual_enabled";
constexpr const char *AN_MIN_CONTEXT_PEERS = "min_context_peers";
constexpr const char *AN_CONTEXT_DEVIATION_RATIO = "context_deviation_ratio";

// Clustering Settings
constexpr const char *CL_ENABLED = "enabled";
constexpr const char *CL_K = "k";
constexpr const char *CL_MIN_SAMPLES = "min_samples";
constexpr const char *CL_MAX_ITERATIONS = "max_iterations";
constexpr const char *CL_CONVERGENCE_THRESHOLD = "convergence_threshold";
constexpr const char *CL_SEED = "seed";
constexpr const char *CL_REQUIRE_EXPLICIT_SEED = "require_explicit_seed";

// Prediction Settings
constexpr const char *PR_ENABLED = "enabled";
constexpr const char *PR_HORIZON_DAYS = "horizon_days";
constexpr const char *PR_MIN_CONFIDENCE = "min_confidence";
constexpr const char *PR_CONFIDENCE_DECAY = "confidence_decay";
constexpr const char *PR_STRONG_SLOPE = "strong_slope";

// Confidence Settings
constexpr const char *CF_RECENCY_WINDOW_DAYS = "recency_window_days";
constexpr const char *CF_VOLUME_SATURATION_EVENTS = "volume_saturation_events";
constexpr const char *CF_PATTERN_STRENGTH = "pattern_strength";

// Learning Settings
constexpr const char *LE_PROGRESS_SATURATION_FEEDBACK =
    "progress_saturation_feedback";
constexpr const char *LE_POSITIVE_RATING_THRESHOLD = "positive_rating_threshold";
constexpr const char *LE_NEGATIVE_RATING_THRESHOLD = "negative_rating_threshold";
constexpr const char *LE_WEIGHT_STEP = "weight_step";
constexpr const char *LE_MIN_WEIGHT = "min_weight";
constexpr const char *LE_MAX_WEIGHT = "max_weight";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct FeatureConfig {
  // Calendar features are computed on timestamp + offset. 0 means UTC.
  int utc_offset_minutes = 0;
  // Overrides and additions to the built-in normalization range table.
  std::map<std::string, std::pair<double, double>> range_overrides;
};

struct TrendConfig {
  bool enabled = true;
  size_t min_samples = 3;
  double min_confidence = 0.7;
  double strong_slope = 0.5;
};

struct CycleConfig {
  bool enabled = true;
  double min_strength = 0.6;
};

struct CorrelationConfig {
  bool enabled = true;
  size_t min_aligned_pairs = 3;
  uint64_t alignment_tolerance_ms = 3600000; // 1 hour
  double min_abs_coefficient = 0.5;
  size_t confidence_saturation_pairs = 10;
  double strong_coefficient = 0.7;
};

struct AnomalyConfig {
  bool enabled = true;
  size_t min_samples = 5;
  double medium_z_threshold = 2.5;
  double high_z_threshold = 3.0;
  bool contextual_enabled = true;
  size_t min_context_peers = 3;
  double context_deviation_ratio = 0.5;
};

struct ClusteringConfig {
  bool enabled = true;
  size_t k = 3;
  size_t min_samples = 5;
  size_t max_iterations = 100;
  double convergence_threshold = 0.001;
  std::optional<uint64_t> seed;
  bool require_explicit_seed = false;
};

struct PredictionConfig {
  bool enabled = true;
  size_t horizon_days = 7;
  double min_confidence = 0.5;
  double confidence_decay = 0.3;
  double strong_slope = 0.5;
};

struct ConfidenceConfig {
  uint32_t recency_window_days = 30;
  size_t volume_saturation_events = 50;
  double pattern_strength = 0.8;
};

struct LearningConfig {
  size_t progress_saturation_feedback = 100;
  double positive_rating_threshold = 0.7;
  double negative_rating_threshold = 0.3;
  double weight_step = 0.1;
  double min_weight = 0.5;
  double max_weight = 1.5;
};

struct AppConfig {
  std::string events_input_path = "data/events.json";
  std::string feedback_input_path;
  std::string result_output_path = "-"; // "-" writes to stdout
  std::string user_id = "default";
  bool parallel_categories = false;
  bool pretty_print_result = true;

  FeatureConfig features;
  TrendConfig trend;
  CycleConfig cycle;
  CorrelationConfig correlation;
  AnomalyConfig anomaly;
  ClusteringConfig clustering;
  PredictionConfig prediction;
  ConfidenceConfig confidence;
  LearningConfig learning;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_feature_config(const FeatureConfig &config,
                             std::vector<std::string> &errors);
bool validate_correlation_config(const CorrelationConfig &config,
                                 std::vector<std::string> &errors);
bool validate_anomaly_config(const AnomalyConfig &config,
                             std::vector<std::string> &errors);
bool validate_clustering_config(const ClusteringConfig &config,
                                std::vector<std::string> &errors);
bool validate_learning_config(const LearningConfig &config,
                              std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Fills `config` from an INI file. Returns false if the file can't be opened.
bool parse_config_into(const std::string &filepath, AppConfig &config);

// Logging defaults used when no [Logging] section overrides them.
void apply_default_log_levels(LoggingConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
