#include "analysis/analysis_result.hpp"
#include "core/errors.hpp"
#include "io/json_file_io.hpp"
#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using nlohmann::json;

class JsonIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "pattern_engine_json_io_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream file(path);
        file << content;
        file.close();
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST(JsonInputTest, ParsesScalarEvent) {
    json j = {{"id", "e1"}, {"dataType", "health"}, {"source", "watch"},
              {"value", 72.5}, {"timestamp", 1704067200000LL}};
    Event event = JsonInput::parse_event(j);
    EXPECT_EQ(event.id, "e1");
    EXPECT_EQ(event.category, DataCategory::HEALTH);
    EXPECT_EQ(event.source, "watch");
    EXPECT_EQ(event.timestamp_ms, 1704067200000LL);
    ASSERT_EQ(event.fields.size(), 1u);
    EXPECT_EQ(event.fields[0].name, "value");
    EXPECT_DOUBLE_EQ(event.numeric_value(), 72.5);
}

TEST(JsonInputTest, ParsesMixedObjectValue) {
    json j = json::parse(R"({
        "id": "e2", "dataType": "finance", "source": "bank",
        "timestamp": 1704067200000,
        "value": {"amount": 42, "merchant": "cafe", "recurring": false}
    })");
    Event event = JsonInput::parse_event(j);
    EXPECT_EQ(event.category, DataCategory::FINANCE);
    EXPECT_EQ(event.fields.size(), 3u);
    EXPECT_EQ(event.numeric_field_count(), 1u);
    EXPECT_DOUBLE_EQ(event.numeric_value(), 42.0);
}

TEST(JsonInputTest, RejectsMalformedEvents) {
    json valid = {{"id", "e"}, {"dataType", "health"}, {"source", "s"},
                  {"value", 1}, {"timestamp", 1000}};

    json missing = valid;
    missing.erase("source");
    EXPECT_THROW(JsonInput::parse_event(missing), InvalidBatchError);

    json unknown_type = valid;
    unknown_type["dataType"] = "hobbies";
    EXPECT_THROW(JsonInput::parse_event(unknown_type), InvalidBatchError);

    json fractional_ts = valid;
    fractional_ts["timestamp"] = 1000.5;
    EXPECT_THROW(JsonInput::parse_event(fractional_ts), InvalidBatchError);

    json null_value = valid;
    null_value["value"] = nullptr;
    EXPECT_THROW(JsonInput::parse_event(null_value), InvalidBatchError);

    json nested = valid;
    nested["value"] = {{"inner", {1, 2}}};
    EXPECT_THROW(JsonInput::parse_event(nested), InvalidBatchError);

    EXPECT_THROW(JsonInput::parse_events(valid), InvalidBatchError);
    EXPECT_EQ(JsonInput::parse_events(json::array({valid, valid})).size(), 2u);
}

TEST(JsonInputTest, ParsesFeedback) {
    json j = json::parse(R"([
        {"insightId": "t1", "rating": 0.9, "action": "helpful", "insightType": "Trend"},
        {"insightId": "x1", "rating": 0.2, "action": "dismissed", "insightType": "horoscope"},
        {"insightId": "n1", "rating": 0.5, "action": "viewed"}
    ])");
    auto feedback = JsonInput::parse_feedback(j);
    ASSERT_EQ(feedback.size(), 3u);
    EXPECT_EQ(feedback[0].insight_type, InsightType::TREND);
    EXPECT_DOUBLE_EQ(feedback[0].rating, 0.9);
    EXPECT_FALSE(feedback[1].insight_type.has_value());
    EXPECT_FALSE(feedback[2].insight_type.has_value());
    EXPECT_EQ(feedback[2].action, "viewed");

    json no_rating = {{"insightId", "a"}, {"action", "viewed"}};
    EXPECT_THROW(JsonInput::parse_feedback_entry(no_rating), InvalidBatchError);
}

TEST_F(JsonIoTest, EventSourceReadsFile) {
    std::string path = writeFile("events.json", R"([
        {"id": "a", "dataType": "productivity", "source": "timer", "value": 30, "timestamp": 1704067200000},
        {"id": "b", "dataType": "career", "source": "cv", "value": {"skills": 4}, "timestamp": 1704153600000}
    ])");

    JsonFileEventSource source(path);
    EXPECT_STREQ(source.get_name(), "JsonFileEventSource");
    auto events = source.fetch_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].category, DataCategory::PRODUCTIVITY);
    EXPECT_EQ(events[1].category, DataCategory::CAREER);

    // Reading again yields the same batch
    EXPECT_EQ(source.fetch_events().size(), 2u);
}

TEST_F(JsonIoTest, EventSourceErrors) {
    EXPECT_THROW(JsonFileEventSource((test_dir / "missing.json").string()),
                 std::runtime_error);

    std::string path = writeFile("broken.json", "[{\"id\": ");
    JsonFileEventSource source(path);
    EXPECT_THROW(source.fetch_events(), InvalidBatchError);
}

TEST_F(JsonIoTest, FeedbackFile) {
    std::string path = writeFile("feedback.json", R"([
        {"insightId": "c1", "rating": 1.0, "action": "helpful", "insightType": "cycle"}
    ])");
    auto feedback = JsonInput::read_feedback_file(path);
    ASSERT_EQ(feedback.size(), 1u);
    EXPECT_EQ(feedback[0].insight_type, InsightType::CYCLE);

    EXPECT_THROW(JsonInput::read_feedback_file((test_dir / "none.json").string()),
                 std::runtime_error);
    EXPECT_THROW(JsonInput::read_feedback_file(writeFile("obj.json", "{}")),
                 InvalidBatchError);
}

TEST_F(JsonIoTest, SinkWritesParsableResult) {
    analysis::AnalysisResult result;
    result.generated_at_ms = 1704067200000LL;
    result.event_count = 3;
    result.data_quality = 0.5;
    result.overall_confidence = 0.4;

    Anomaly anomaly{"e9", DataCategory::HEALTH, 1704067200000LL, 20.0,
                    AnomalyKind::CONTEXTUAL, AnomalySeverity::MEDIUM,
                    std::nullopt, "Unusual health pattern for this time of day/week"};
    result.anomalies.push_back(anomaly);
    result.insight_weights[InsightType::TREND] = 1.2;

    std::string path = (test_dir / "out" / "result.json").string();
    {
        JsonFileAnalysisSink sink(path, true);
        EXPECT_STREQ(sink.get_name(), "JsonFileAnalysisSink");
        ASSERT_TRUE(sink.store(result));
    }

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    json written = json::parse(in);

    EXPECT_EQ(written["event_count"], 3);
    EXPECT_EQ(written["generated_at_ms"], 1704067200000LL);
    for (const char* key : {"trends", "cycles", "correlations", "anomalies",
                            "clusters", "predictions"}) {
        ASSERT_TRUE(written[key].is_array()) << key;
    }
    EXPECT_DOUBLE_EQ(written["confidence"]["data_quality"].get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(written["confidence"]["overall"].get<double>(), 0.4);

    const json& written_anomaly = written["anomalies"][0];
    EXPECT_EQ(written_anomaly["kind"], "contextual");
    EXPECT_FALSE(written_anomaly.contains("z_score"));

    EXPECT_TRUE(written["profile_summary"]["most_valued"].is_null());
    EXPECT_DOUBLE_EQ(written["insight_weights"]["trend"].get<double>(), 1.2);
}

TEST(JsonFormatterTest, StatisticalAnomalyCarriesZScore) {
    Anomaly anomaly{"e1", DataCategory::FINANCE, 1000, 99.0,
                    AnomalyKind::STATISTICAL, AnomalySeverity::HIGH, 3.4, "x"};
    json j = JsonFormatter::anomaly_to_json_object(anomaly);
    EXPECT_DOUBLE_EQ(j["z_score"].get<double>(), 3.4);
    EXPECT_EQ(j["severity"], "high");
    EXPECT_EQ(j["category"], "finance");

    learning::ProfileSummary summary;
    summary.most_valued = InsightType::PREDICTION;
    json s = JsonFormatter::profile_summary_to_json_object(summary);
    EXPECT_EQ(s["most_valued"], "prediction");
    EXPECT_TRUE(s["least_valued"].is_null());
}
