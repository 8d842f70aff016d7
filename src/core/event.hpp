#ifndef EVENT_HPP
#define EVENT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// The closed set of personal-data domains. Every component iterates this
// list instead of keeping its own.
enum class DataCategory {
  HEALTH,
  FINANCE,
  PRODUCTIVITY,
  RELATIONSHIPS,
  LEARNING,
  CAREER
};

constexpr std::array<DataCategory, 6> ALL_CATEGORIES = {
    DataCategory::HEALTH,        DataCategory::FINANCE,
    DataCategory::PRODUCTIVITY,  DataCategory::RELATIONSHIPS,
    DataCategory::LEARNING,      DataCategory::CAREER};

constexpr size_t KNOWN_CATEGORY_COUNT = ALL_CATEGORIES.size();

const char *category_to_string(DataCategory category);

// Throws InvalidBatchError for names outside the closed set.
DataCategory category_from_string(std::string_view name);

size_t category_index(DataCategory category);

using FieldValue = std::variant<double, std::string, bool>;

struct EventField {
  std::string name;
  FieldValue value;

  bool is_numeric() const { return std::holds_alternative<double>(value); }
  std::optional<double> as_number() const;
  // Text rendering used for categorical features.
  std::string as_text() const;
};

struct Event {
  std::string id;
  DataCategory category = DataCategory::HEALTH;
  std::string source;
  // Ordered as supplied. A scalar event value is stored as one numeric field
  // named "value".
  std::vector<EventField> fields;
  int64_t timestamp_ms = 0;

  // Mean of the numeric fields, 0 when there are none.
  double numeric_value() const;
  size_t numeric_field_count() const;
};

// Builds an event whose value is a single number.
Event make_scalar_event(std::string id, DataCategory category,
                        std::string source, double value,
                        int64_t timestamp_ms);

#endif // EVENT_HPP
