#include "findings.hpp"
#include "utils/utils.hpp"

const char *trend_direction_to_string(TrendDirection direction) {
  return direction == TrendDirection::INCREASING ? "increasing" : "decreasing";
}

const char *cycle_period_to_string(CyclePeriod period) {
  switch (period) {
  case CyclePeriod::DAILY:
    return "daily";
  case CyclePeriod::WEEKLY:
    return "weekly";
  case CyclePeriod::MONTHLY:
    return "monthly";
  }
  return "unknown";
}

const char *correlation_direction_to_string(CorrelationDirection direction) {
  return direction == CorrelationDirection::POSITIVE ? "positive" : "negative";
}

const char *anomaly_kind_to_string(AnomalyKind kind) {
  return kind == AnomalyKind::STATISTICAL ? "statistical" : "contextual";
}

const char *anomaly_severity_to_string(AnomalySeverity severity) {
  return severity == AnomalySeverity::HIGH ? "high" : "medium";
}

const char *insight_type_to_string(InsightType type) {
  switch (type) {
  case InsightType::TREND:
    return "trend";
  case InsightType::CYCLE:
    return "cycle";
  case InsightType::CORRELATION:
    return "correlation";
  case InsightType::ANOMALY:
    return "anomaly";
  case InsightType::CLUSTER:
    return "cluster";
  case InsightType::PREDICTION:
    return "prediction";
  }
  return "unknown";
}

std::optional<InsightType> insight_type_from_string(const std::string &name) {
  std::string lowered = Utils::to_lower_copy(Utils::trim_copy(name));
  for (InsightType type : ALL_INSIGHT_TYPES) {
    if (lowered == insight_type_to_string(type))
      return type;
  }
  return std::nullopt;
}
