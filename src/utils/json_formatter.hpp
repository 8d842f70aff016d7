#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/analysis_result.hpp"
#include "core/findings.hpp"
#include "learning/learning_profile.hpp"
#include "nlohmann/json.hpp"

#include <map>
#include <string>

namespace JsonFormatter {

nlohmann::json trend_to_json_object(const Trend &trend);
nlohmann::json cycle_to_json_object(const Cycle &cycle);
nlohmann::json correlation_to_json_object(const Correlation &correlation);
nlohmann::json anomaly_to_json_object(const Anomaly &anomaly);
nlohmann::json cluster_analysis_to_json_object(const ClusterAnalysis &analysis);
nlohmann::json prediction_to_json_object(const Prediction &prediction);

nlohmann::json
profile_summary_to_json_object(const learning::ProfileSummary &summary);
nlohmann::json
insight_weights_to_json_object(const std::map<InsightType, double> &weights);

nlohmann::json
analysis_result_to_json_object(const analysis::AnalysisResult &result);

std::string format_analysis_result(const analysis::AnalysisResult &result,
                                   bool pretty = false);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
