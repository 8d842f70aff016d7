#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.writer", LogComponent::IO_WRITER},
    {"features", LogComponent::FEATURES},
    {"detect.trend", LogComponent::DETECT_TREND},
    {"detect.cycle", LogComponent::DETECT_CYCLE},
    {"detect.correlation", LogComponent::DETECT_CORRELATION},
    {"detect.anomaly", LogComponent::DETECT_ANOMALY},
    {"detect.cluster", LogComponent::DETECT_CLUSTER},
    {"prediction", LogComponent::PREDICTION},
    {"learning", LogComponent::LEARNING},
    {"orchestrator", LogComponent::ORCHESTRATOR}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

void apply_default_log_levels(LoggingConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

bool validate_feature_config(const FeatureConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.utc_offset_minutes < -14 * 60 ||
      config.utc_offset_minutes > 14 * 60) {
    errors.push_back("UTC offset must be between -840 and 840 minutes");
    valid = false;
  }

  for (const auto &[name, range] : config.range_overrides) {
    if (!std::isfinite(range.first) || !std::isfinite(range.second) ||
        range.first > range.second) {
      errors.push_back("Feature range for '" + name +
                       "' must be finite with min <= max");
      valid = false;
    }
  }

  return valid;
}

bool validate_correlation_config(const CorrelationConfig &config,
                                 std::vector<std::string> &errors) {
  bool valid = true;

  if (config.min_aligned_pairs < 3) {
    errors.push_back("Correlation needs at least 3 aligned pairs");
    valid = false;
  }

  if (config.alignment_tolerance_ms == 0) {
    errors.push_back("Correlation alignment tolerance must be positive");
    valid = false;
  }

  if (config.min_abs_coefficient < 0.0 || config.min_abs_coefficient > 1.0) {
    errors.push_back(
        "Correlation minimum coefficient must be between 0.0 and 1.0");
    valid = false;
  }

  if (config.confidence_saturation_pairs == 0) {
    errors.push_back("Correlation confidence saturation must be positive");
    valid = false;
  }

  return valid;
}

bool validate_anomaly_config(const AnomalyConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.min_samples < 2) {
    errors.push_back("Anomaly detection needs at least 2 samples");
    valid = false;
  }

  if (config.medium_z_threshold <= 0.0) {
    errors.push_back("Anomaly medium Z threshold must be positive");
    valid = false;
  }

  if (config.high_z_threshold < config.medium_z_threshold) {
    errors.push_back(
        "Anomaly high Z threshold must not be below the medium threshold");
    valid = false;
  }

  if (config.context_deviation_ratio < 0.0) {
    errors.push_back("Anomaly context deviation ratio must not be negative");
    valid = false;
  }

  return valid;
}

bool validate_clustering_config(const ClusteringConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.k < 1 || config.k > 32) {
    errors.push_back("Clustering k must be between 1 and 32");
    valid = false;
  }

  if (config.min_samples < config.k) {
    errors.push_back("Clustering minimum samples must be at least k");
    valid = false;
  }

  if (config.max_iterations < 1 || config.max_iterations > 10000) {
    errors.push_back("Clustering max iterations must be between 1 and 10000");
    valid = false;
  }

  if (config.convergence_threshold <= 0.0) {
    errors.push_back("Clustering convergence threshold must be positive");
    valid = false;
  }

  return valid;
}

bool validate_learning_config(const LearningConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.progress_saturation_feedback == 0) {
    errors.push_back("Learning progress saturation must be positive");
    valid = false;
  }

  if (config.negative_rating_threshold < 0.0 ||
      config.positive_rating_threshold > 1.0 ||
      config.negative_rating_threshold >= config.positive_rating_threshold) {
    errors.push_back("Learning rating thresholds must satisfy 0 <= negative < "
                     "positive <= 1");
    valid = false;
  }

  if (config.min_weight <= 0.0 || config.min_weight > 1.0 ||
      config.max_weight < 1.0) {
    errors.push_back(
        "Learning weights must satisfy 0 < min_weight <= 1 <= max_weight");
    valid = false;
  }

  if (config.weight_step <= 0.0) {
    errors.push_back("Learning weight step must be positive");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_feature_config(config.features, errors))
    valid = false;

  if (config.trend.min_samples < 3) {
    errors.push_back("Trend detection needs at least 3 samples");
    valid = false;
  }

  if (config.trend.min_confidence < 0.0 || config.trend.min_confidence > 1.0) {
    errors.push_back("Trend minimum confidence must be between 0.0 and 1.0");
    valid = false;
  }

  if (config.cycle.min_strength < 0.0 || config.cycle.min_strength > 1.0) {
    errors.push_back("Cycle minimum strength must be between 0.0 and 1.0");
    valid = false;
  }

  if (!validate_correlation_config(config.correlation, errors))
    valid = false;

  if (!validate_anomaly_config(config.anomaly, errors))
    valid = false;

  if (!validate_clustering_config(config.clustering, errors))
    valid = false;

  if (config.prediction.horizon_days > 365) {
    errors.push_back("Prediction horizon must be at most 365 days");
    valid = false;
  }

  if (config.prediction.confidence_decay < 0.0 ||
      config.prediction.confidence_decay > 1.0) {
    errors.push_back("Prediction confidence decay must be between 0.0 and 1.0");
    valid = false;
  }

  if (config.confidence.volume_saturation_events == 0) {
    errors.push_back("Volume saturation must be positive");
    valid = false;
  }

  if (config.confidence.pattern_strength < 0.0 ||
      config.confidence.pattern_strength > 1.0) {
    errors.push_back("Pattern strength must be between 0.0 and 1.0");
    valid = false;
  }

  if (!validate_learning_config(config.learning, errors))
    valid = false;

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::clog << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::EVENTS_INPUT_PATH)
        config.events_input_path = value;
      else if (key == Keys::FEEDBACK_INPUT_PATH)
        config.feedback_input_path = value;
      else if (key == Keys::RESULT_OUTPUT_PATH)
        config.result_output_path = value;
      else if (key == Keys::USER_ID)
        config.user_id = value;
      else if (key == Keys::PARALLEL_CATEGORIES)
        config.parallel_categories = string_to_bool(value);
      else if (key == Keys::PRETTY_PRINT_RESULT)
        config.pretty_print_result = string_to_bool(value);
      else
        config.custom_settings[key] = value;

      // Feature extraction settings
    } else if (current_section == "Features") {
      if (key == Keys::UTC_OFFSET_MINUTES)
        config.features.utc_offset_minutes =
            Utils::string_to_number<int>(value).value_or(
                config.features.utc_offset_minutes);

      // Normalization ranges, one "name = min,max" per line
    } else if (current_section == "FeatureRanges") {
      if (auto range = Utils::parse_range(value))
        config.features.range_overrides[key] = *range;
      else
        std::cerr << "Warning (Config Line " << line_num
                  << "): Feature range must be 'min,max': " << value
                  << std::endl;

    } else if (current_section == "Trend") {
      if (key == Keys::TR_ENABLED)
        config.trend.enabled = string_to_bool(value);
      else if (key == Keys::TR_MIN_SAMPLES)
        config.trend.min_samples = Utils::string_to_number<size_t>(value)
                                       .value_or(config.trend.min_samples);
      else if (key == Keys::TR_MIN_CONFIDENCE)
        config.trend.min_confidence = Utils::string_to_number<double>(value)
                                          .value_or(config.trend.min_confidence);
      else if (key == Keys::TR_STRONG_SLOPE)
        config.trend.strong_slope = Utils::string_to_number<double>(value)
                                        .value_or(config.trend.strong_slope);

    } else if (current_section == "Cycle") {
      if (key == Keys::CY_ENABLED)
        config.cycle.enabled = string_to_bool(value);
      else if (key == Keys::CY_MIN_STRENGTH)
        config.cycle.min_strength = Utils::string_to_number<double>(value)
                                        .value_or(config.cycle.min_strength);

    } else if (current_section == "Correlation") {
      if (key == Keys::CO_ENABLED)
        config.correlation.enabled = string_to_bool(value);
      else if (key == Keys::CO_MIN_ALIGNED_PAIRS)
        config.correlation.min_aligned_pairs =
            Utils::string_to_number<size_t>(value).value_or(
                config.correlation.min_aligned_pairs);
      else if (key == Keys::CO_ALIGNMENT_TOLERANCE_MS)
        config.correlation.alignment_tolerance_ms =
            Utils::string_to_number<uint64_t>(value).value_or(
                config.correlation.alignment_tolerance_ms);
      else if (key == Keys::CO_MIN_ABS_COEFFICIENT)
        config.correlation.min_abs_coefficient =
            Utils::string_to_number<double>(value).value_or(
                config.correlation.min_abs_coefficient);
      else if (key == Keys::CO_CONFIDENCE_SATURATION_PAIRS)
        config.correlation.confidence_saturation_pairs =
            Utils::string_to_number<size_t>(value).value_or(
                config.correlation.confidence_saturation_pairs);
      else if (key == Keys::CO_STRONG_COEFFICIENT)
        config.correlation.strong_coefficient =
            Utils::string_to_number<double>(value).value_or(
                config.correlation.strong_coefficient);

    } else if (current_section == "Anomaly") {
      if (key == Keys::AN_ENABLED)
        config.anomaly.enabled = string_to_bool(value);
      else if (key == Keys::AN_MIN_SAMPLES)
        config.anomaly.min_samples = Utils::string_to_number<size_t>(value)
                                         .value_or(config.anomaly.min_samples);
      else if (key == Keys::AN_MEDIUM_Z_THRESHOLD)
        config.anomaly.medium_z_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.anomaly.medium_z_threshold);
      else if (key == Keys::AN_HIGH_Z_THRESHOLD)
        config.anomaly.high_z_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.anomaly.high_z_threshold);
      else if (key == Keys::AN_CONTEXTUAL_ENABLED)
        config.anomaly.contextual_enabled = string_to_bool(value);
      else if (key == Keys::AN_MIN_CONTEXT_PEERS)
        config.anomaly.min_context_peers =
            Utils::string_to_number<size_t>(value).value_or(
                config.anomaly.min_context_peers);
      else if (key == Keys::AN_CONTEXT_DEVIATION_RATIO)
        config.anomaly.context_deviation_ratio =
            Utils::string_to_number<double>(value).value_or(
                config.anomaly.context_deviation_ratio);

    } else if (current_section == "Clustering") {
      if (key == Keys::CL_ENABLED)
        config.clustering.enabled = string_to_bool(value);
      else if (key == Keys::CL_K)
        config.clustering.k =
            Utils::string_to_number<size_t>(value).value_or(config.clustering.k);
      else if (key == Keys::CL_MIN_SAMPLES)
        config.clustering.min_samples =
            Utils::string_to_number<size_t>(value).value_or(
                config.clustering.min_samples);
      else if (key == Keys::CL_MAX_ITERATIONS)
        config.clustering.max_iterations =
            Utils::string_to_number<size_t>(value).value_or(
                config.clustering.max_iterations);
      else if (key == Keys::CL_CONVERGENCE_THRESHOLD)
        config.clustering.convergence_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.clustering.convergence_threshold);
      else if (key == Keys::CL_SEED) {
        if (value.empty())
          config.clustering.seed.reset();
        else if (auto seed = Utils::string_to_number<uint64_t>(value))
          config.clustering.seed = *seed;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Invalid clustering seed: " << value << std::endl;
      } else if (key == Keys::CL_REQUIRE_EXPLICIT_SEED)
        config.clustering.require_explicit_seed = string_to_bool(value);

    } else if (current_section == "Prediction") {
      if (key == Keys::PR_ENABLED)
        config.prediction.enabled = string_to_bool(value);
      else if (key == Keys::PR_HORIZON_DAYS)
        config.prediction.horizon_days =
            Utils::string_to_number<size_t>(value).value_or(
                config.prediction.horizon_days);
      else if (key == Keys::PR_MIN_CONFIDENCE)
        config.prediction.min_confidence =
            Utils::string_to_number<double>(value).value_or(
                config.prediction.min_confidence);
      else if (key == Keys::PR_CONFIDENCE_DECAY)
        config.prediction.confidence_decay =
            Utils::string_to_number<double>(value).value_or(
                config.prediction.confidence_decay);
      else if (key == Keys::PR_STRONG_SLOPE)
        config.prediction.strong_slope =
            Utils::string_to_number<double>(value).value_or(
                config.prediction.strong_slope);

    } else if (current_section == "Confidence") {
      if (key == Keys::CF_RECENCY_WINDOW_DAYS)
        config.confidence.recency_window_days =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.confidence.recency_window_days);
      else if (key == Keys::CF_VOLUME_SATURATION_EVENTS)
        config.confidence.volume_saturation_events =
            Utils::string_to_number<size_t>(value).value_or(
                config.confidence.volume_saturation_events);
      else if (key == Keys::CF_PATTERN_STRENGTH)
        config.confidence.pattern_strength =
            Utils::string_to_number<double>(value).value_or(
                config.confidence.pattern_strength);

    } else if (current_section == "Learning") {
      if (key == Keys::LE_PROGRESS_SATURATION_FEEDBACK)
        config.learning.progress_saturation_feedback =
            Utils::string_to_number<size_t>(value).value_or(
                config.learning.progress_saturation_feedback);
      else if (key == Keys::LE_POSITIVE_RATING_THRESHOLD)
        config.learning.positive_rating_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.learning.positive_rating_threshold);
      else if (key == Keys::LE_NEGATIVE_RATING_THRESHOLD)
        config.learning.negative_rating_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.learning.negative_rating_threshold);
      else if (key == Keys::LE_WEIGHT_STEP)
        config.learning.weight_step = Utils::string_to_number<double>(value)
                                          .value_or(config.learning.weight_step);
      else if (key == Keys::LE_MIN_WEIGHT)
        config.learning.min_weight = Utils::string_to_number<double>(value)
                                         .value_or(config.learning.min_weight);
      else if (key == Keys::LE_MAX_WEIGHT)
        config.learning.max_weight = Utils::string_to_number<double>(value)
                                         .value_or(config.learning.max_weight);

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "detect.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        }
      }
    } else {
      std::cerr << "Warning (Config Line " << line_num
                << "): Unknown section '" << current_section << "'"
                << std::endl;
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::clog << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
