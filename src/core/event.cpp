#include "event.hpp"
#include "errors.hpp"
#include "utils/utils.hpp"

#include <sstream>
#include <string>

const char *category_to_string(DataCategory category) {
  switch (category) {
  case DataCategory::HEALTH:
    return "health";
  case DataCategory::FINANCE:
    return "finance";
  case DataCategory::PRODUCTIVITY:
    return "productivity";
  case DataCategory::RELATIONSHIPS:
    return "relationships";
  case DataCategory::LEARNING:
    return "learning";
  case DataCategory::CAREER:
    return "career";
  }
  return "unknown";
}

DataCategory category_from_string(std::string_view name) {
  std::string lowered = Utils::to_lower_copy(Utils::trim_copy(name));
  for (DataCategory category : ALL_CATEGORIES) {
    if (lowered == category_to_string(category))
      return category;
  }
  throw InvalidBatchError("Unrecognized data category: '" + std::string(name) +
                          "'");
}

size_t category_index(DataCategory category) {
  return static_cast<size_t>(category);
}

std::optional<double> EventField::as_number() const {
  if (const double *number = std::get_if<double>(&value))
    return *number;
  return std::nullopt;
}

std::string EventField::as_text() const {
  if (const std::string *text = std::get_if<std::string>(&value))
    return *text;
  if (const bool *flag = std::get_if<bool>(&value))
    return *flag ? "true" : "false";
  std::ostringstream oss;
  oss << std::get<double>(value);
  return oss.str();
}

double Event::numeric_value() const {
  double sum = 0.0;
  size_t count = 0;
  for (const auto &field : fields) {
    if (auto number = field.as_number()) {
      sum += *number;
      count++;
    }
  }
  return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

size_t Event::numeric_field_count() const {
  size_t count = 0;
  for (const auto &field : fields)
    if (field.is_numeric())
      count++;
  return count;
}

Event make_scalar_event(std::string id, DataCategory category,
                        std::string source, double value,
                        int64_t timestamp_ms) {
  Event event;
  event.id = std::move(id);
  event.category = category;
  event.source = std::move(source);
  event.fields.push_back(EventField{"value", value});
  event.timestamp_ms = timestamp_ms;
  return event;
}
