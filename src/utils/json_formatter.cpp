#include "json_formatter.hpp"

#include <string>

nlohmann::json JsonFormatter::trend_to_json_object(const Trend &trend) {
  nlohmann::json j;
  j["category"] = category_to_string(trend.category);
  j["direction"] = trend_direction_to_string(trend.direction);
  j["strength"] = trend.strength;
  j["slope"] = trend.slope;
  j["intercept"] = trend.intercept;
  j["confidence"] = trend.confidence;
  j["sample_count"] = trend.sample_count;
  j["duration_ms"] = trend.duration_ms;
  j["description"] = trend.description;
  return j;
}

nlohmann::json JsonFormatter::cycle_to_json_object(const Cycle &cycle) {
  nlohmann::json j;
  j["category"] = category_to_string(cycle.category);
  j["period"] = cycle_period_to_string(cycle.period);
  j["strength"] = cycle.strength;
  j["profile"] = cycle.profile;
  j["peak_bucket"] = cycle.peak_bucket;
  j["trough_bucket"] = cycle.trough_bucket;
  j["description"] = cycle.description;
  return j;
}

nlohmann::json
JsonFormatter::correlation_to_json_object(const Correlation &correlation) {
  nlohmann::json j;
  j["category_a"] = category_to_string(correlation.category_a);
  j["category_b"] = category_to_string(correlation.category_b);
  j["coefficient"] = correlation.coefficient;
  j["strength"] = correlation.strength;
  j["confidence"] = correlation.confidence;
  j["aligned_pairs"] = correlation.aligned_pairs;
  j["direction"] = correlation_direction_to_string(correlation.direction);
  j["description"] = correlation.description;
  return j;
}

nlohmann::json JsonFormatter::anomaly_to_json_object(const Anomaly &anomaly) {
  nlohmann::json j;
  j["event_id"] = anomaly.event_id;
  j["category"] = category_to_string(anomaly.category);
  j["timestamp_ms"] = anomaly.timestamp_ms;
  j["value"] = anomaly.value;
  j["kind"] = anomaly_kind_to_string(anomaly.kind);
  j["severity"] = anomaly_severity_to_string(anomaly.severity);
  if (anomaly.z_score)
    j["z_score"] = *anomaly.z_score;
  j["description"] = anomaly.description;
  return j;
}

nlohmann::json
JsonFormatter::cluster_analysis_to_json_object(const ClusterAnalysis &analysis) {
  nlohmann::json j;
  j["category"] = category_to_string(analysis.category);
  j["silhouette"] = analysis.silhouette;
  j["iterations"] = analysis.iterations;
  j["seed"] = analysis.seed;
  j["description"] = analysis.description;

  nlohmann::json clusters = nlohmann::json::array();
  for (const auto &cluster : analysis.clusters) {
    nlohmann::json j_cluster;
    j_cluster["id"] = cluster.id;
    j_cluster["size"] = cluster.size;
    j_cluster["member_ids"] = cluster.member_ids;
    if (cluster.center) {
      j_cluster["center"] = {{"mean", cluster.center->mean},
                             {"min", cluster.center->min},
                             {"max", cluster.center->max},
                             {"std_dev", cluster.center->std_dev}};
    }
    if (cluster.characteristics) {
      const auto &c = *cluster.characteristics;
      j_cluster["characteristics"] = {
          {"dominant_hour_of_day", c.dominant_hour_of_day},
          {"dominant_day_of_week", c.dominant_day_of_week},
          {"dominant_time_of_day",
           features::time_of_day_to_string(c.dominant_time_of_day)},
          {"dominant_source", c.dominant_source}};
    }
    clusters.push_back(std::move(j_cluster));
  }
  j["clusters"] = std::move(clusters);
  return j;
}

nlohmann::json
JsonFormatter::prediction_to_json_object(const Prediction &prediction) {
  nlohmann::json j;
  j["category"] = category_to_string(prediction.category);
  j["direction"] = trend_direction_to_string(prediction.direction);
  j["confidence"] = prediction.confidence;
  j["slope"] = prediction.slope;
  j["description"] = prediction.description;

  nlohmann::json points = nlohmann::json::array();
  for (const auto &point : prediction.points) {
    points.push_back({{"timestamp_ms", point.timestamp_ms},
                      {"value", point.value},
                      {"confidence", point.confidence}});
  }
  j["points"] = std::move(points);
  return j;
}

nlohmann::json JsonFormatter::profile_summary_to_json_object(
    const learning::ProfileSummary &summary) {
  nlohmann::json j;
  j["total_feedback"] = summary.total_feedback;
  j["average_rating"] = summary.average_rating;
  j["learning_progress"] = summary.learning_progress;
  j["most_valued"] = summary.most_valued
                         ? nlohmann::json(insight_type_to_string(
                               *summary.most_valued))
                         : nlohmann::json(nullptr);
  j["least_valued"] = summary.least_valued
                          ? nlohmann::json(insight_type_to_string(
                                *summary.least_valued))
                          : nlohmann::json(nullptr);
  return j;
}

nlohmann::json JsonFormatter::insight_weights_to_json_object(
    const std::map<InsightType, double> &weights) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[type, weight] : weights)
    j[insight_type_to_string(type)] = weight;
  return j;
}

nlohmann::json JsonFormatter::analysis_result_to_json_object(
    const analysis::AnalysisResult &result) {
  // Helper for the finding lists, which are arrays even when empty.
  auto to_array = [](const auto &items, auto convert) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &item : items)
      array.push_back(convert(item));
    return array;
  };

  nlohmann::json j;
  j["generated_at_ms"] = result.generated_at_ms;
  j["event_count"] = result.event_count;

  j["trends"] = to_array(result.trends, trend_to_json_object);
  j["cycles"] = to_array(result.cycles, cycle_to_json_object);
  j["correlations"] = to_array(result.correlations, correlation_to_json_object);
  j["anomalies"] = to_array(result.anomalies, anomaly_to_json_object);
  j["clusters"] = to_array(result.clusters, cluster_analysis_to_json_object);
  j["predictions"] = to_array(result.predictions, prediction_to_json_object);

  j["confidence"] = {{"data_quality", result.data_quality},
                     {"data_volume", result.data_volume},
                     {"pattern_strength", result.pattern_strength},
                     {"overall", result.overall_confidence}};

  j["profile_summary"] = profile_summary_to_json_object(result.profile_summary);
  j["insight_weights"] = insight_weights_to_json_object(result.insight_weights);
  return j;
}

std::string
JsonFormatter::format_analysis_result(const analysis::AnalysisResult &result,
                                      bool pretty) {
  return analysis_result_to_json_object(result).dump(pretty ? 2 : -1);
}
