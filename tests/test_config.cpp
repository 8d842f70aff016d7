#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include "../src/core/config.hpp"
#include "../src/core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "pattern_engine_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

// Test global settings and feature options
TEST_F(ConfigTest, GlobalAndFeatureSettingsParsing) {
    std::string config_content = R"(
events_input_path = /tmp/events.json
feedback_input_path = /tmp/feedback.json
result_output_path = out/result.json
user_id = alice
parallel_categories = yes
pretty_print_result = false
custom_key = custom_value

[Features]
utc_offset_minutes = -300

[FeatureRanges]
steps = 0,15000
mood = 1,5
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->events_input_path, "/tmp/events.json");
    EXPECT_EQ(config->feedback_input_path, "/tmp/feedback.json");
    EXPECT_EQ(config->result_output_path, "out/result.json");
    EXPECT_EQ(config->user_id, "alice");
    EXPECT_TRUE(config->parallel_categories);
    EXPECT_FALSE(config->pretty_print_result);
    EXPECT_EQ(config->custom_settings.at("custom_key"), "custom_value");

    EXPECT_EQ(config->features.utc_offset_minutes, -300);
    ASSERT_EQ(config->features.range_overrides.size(), 2u);
    EXPECT_DOUBLE_EQ(config->features.range_overrides.at("steps").second, 15000.0);
    EXPECT_DOUBLE_EQ(config->features.range_overrides.at("mood").first, 1.0);
}

// Test detector sections
TEST_F(ConfigTest, DetectorSectionsParsing) {
    std::string config_content = R"(
[Trend]
enabled = false
min_samples = 4
min_confidence = 0.8

[Cycle]
min_strength = 0.5

[Correlation]
alignment_tolerance_ms = 1800000
min_abs_coefficient = 0.6

[Anomaly]
min_samples = 6
medium_z_threshold = 2.0
high_z_threshold = 3.5
contextual_enabled = off

[Clustering]
k = 4
min_samples = 8
max_iterations = 50
seed = 1234

[Prediction]
horizon_days = 14
confidence_decay = 0.5
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_FALSE(config->trend.enabled);
    EXPECT_EQ(config->trend.min_samples, 4u);
    EXPECT_DOUBLE_EQ(config->trend.min_confidence, 0.8);
    EXPECT_DOUBLE_EQ(config->cycle.min_strength, 0.5);
    EXPECT_EQ(config->correlation.alignment_tolerance_ms, 1800000u);
    EXPECT_DOUBLE_EQ(config->correlation.min_abs_coefficient, 0.6);
    EXPECT_EQ(config->anomaly.min_samples, 6u);
    EXPECT_DOUBLE_EQ(config->anomaly.high_z_threshold, 3.5);
    EXPECT_FALSE(config->anomaly.contextual_enabled);
    EXPECT_EQ(config->clustering.k, 4u);
    EXPECT_EQ(config->clustering.max_iterations, 50u);
    ASSERT_TRUE(config->clustering.seed.has_value());
    EXPECT_EQ(*config->clustering.seed, 1234u);
    EXPECT_EQ(config->prediction.horizon_days, 14u);
    EXPECT_DOUBLE_EQ(config->prediction.confidence_decay, 0.5);
}

// Test logging levels including wildcards
TEST_F(ConfigTest, LoggingLevelsParsing) {
    std::string config_content = R"(
[Logging]
default_level = ERROR
core = INFO
detect.* = DEBUG
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    const auto &levels = manager.get_config()->logging.log_levels;
    EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::INFO);
    EXPECT_EQ(levels.at(LogComponent::LEARNING), LogLevel::ERROR);
    EXPECT_EQ(levels.at(LogComponent::DETECT_TREND), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::DETECT_CLUSTER), LogLevel::DEBUG);
}

// Invalid values are rejected and the previous configuration is kept
TEST_F(ConfigTest, ValidationFailureKeepsPreviousConfig) {
    std::string valid_config = R"(
user_id = first
)";
    std::string config_file = createTestConfigFile(valid_config);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    std::string invalid_config = R"(
user_id = second

[Anomaly]
medium_z_threshold = 3.0
high_z_threshold = 2.0
)";
    config_file = createTestConfigFile(invalid_config);
    EXPECT_FALSE(manager.load_configuration(config_file));
    EXPECT_EQ(manager.get_config()->user_id, "first");
}

TEST_F(ConfigTest, MissingFileFallsBackToDefaults) {
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration((test_dir / "missing.ini").string()));

    auto config = manager.get_config();
    ASSERT_NE(config, nullptr);
    EXPECT_EQ(config->clustering.k, 3u);
    EXPECT_DOUBLE_EQ(config->trend.min_confidence, 0.7);
}

// The seed may be supplied per run, so the flag alone is a valid config
TEST_F(ConfigTest, ExplicitSeedRequirementWithoutConfiguredSeed) {
    std::string config_content = R"(
user_id = tester

[Clustering]
require_explicit_seed = true
)";
    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_TRUE(config->clustering.require_explicit_seed);
    EXPECT_FALSE(config->clustering.seed.has_value());
    EXPECT_EQ(config->user_id, "tester");
}

TEST(ConfigValidationTest, IndividualValidators) {
    std::vector<std::string> errors;

    Config::FeatureConfig features;
    features.range_overrides["steps"] = {10.0, 5.0};
    EXPECT_FALSE(Config::validate_feature_config(features, errors));

    Config::ClusteringConfig clustering;
    clustering.k = 0;
    EXPECT_FALSE(Config::validate_clustering_config(clustering, errors));

    Config::LearningConfig learning;
    learning.negative_rating_threshold = 0.8;
    EXPECT_FALSE(Config::validate_learning_config(learning, errors));

    Config::CorrelationConfig correlation;
    correlation.alignment_tolerance_ms = 0;
    EXPECT_FALSE(Config::validate_correlation_config(correlation, errors));

    EXPECT_EQ(errors.size(), 4u);

    errors.clear();
    EXPECT_TRUE(Config::validate_app_config(Config::AppConfig{}, errors));
    EXPECT_TRUE(errors.empty());
}
