#include "json_file_io.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

const nlohmann::json &require_member(const nlohmann::json &j,
                                     const char *name,
                                     const std::string &where) {
  auto it = j.find(name);
  if (it == j.end())
    throw InvalidBatchError(where + ": missing member '" + name + "'");
  return *it;
}

std::string require_string(const nlohmann::json &j, const char *name,
                           const std::string &where) {
  const auto &value = require_member(j, name, where);
  if (!value.is_string())
    throw InvalidBatchError(where + ": member '" + name +
                            "' must be a string");
  return value.get<std::string>();
}

nlohmann::json parse_document(std::istream &in, const std::string &filepath) {
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidBatchError("Malformed JSON in " + filepath + ": " + e.what());
  }
}

} // namespace

namespace JsonInput {

Event parse_event(const nlohmann::json &j) {
  if (!j.is_object())
    throw InvalidBatchError("Event must be a JSON object");

  Event event;
  event.id = require_string(j, "id", "event");
  const std::string where = "event '" + event.id + "'";
  event.category = category_from_string(require_string(j, "dataType", where));
  event.source = require_string(j, "source", where);

  const auto &timestamp = require_member(j, "timestamp", where);
  if (!timestamp.is_number_integer())
    throw InvalidBatchError(where + ": 'timestamp' must be an integer");
  event.timestamp_ms = timestamp.get<int64_t>();

  const auto &value = require_member(j, "value", where);
  if (value.is_number()) {
    event.fields.push_back({"value", FieldValue{value.get<double>()}});
  } else if (value.is_object()) {
    for (auto it = value.begin(); it != value.end(); ++it) {
      const auto &field = it.value();
      if (field.is_number())
        event.fields.push_back({it.key(), FieldValue{field.get<double>()}});
      else if (field.is_boolean())
        event.fields.push_back({it.key(), FieldValue{field.get<bool>()}});
      else if (field.is_string())
        event.fields.push_back(
            {it.key(), FieldValue{field.get<std::string>()}});
      else
        throw InvalidBatchError(where + ": field '" + it.key() +
                                "' must be a number, string or boolean");
    }
  } else {
    throw InvalidBatchError(where + ": 'value' must be a number or an object");
  }
  return event;
}

std::vector<Event> parse_events(const nlohmann::json &j) {
  if (!j.is_array())
    throw InvalidBatchError("Event batch must be a JSON array");

  std::vector<Event> events;
  events.reserve(j.size());
  for (const auto &element : j)
    events.push_back(parse_event(element));
  return events;
}

learning::Feedback parse_feedback_entry(const nlohmann::json &j) {
  if (!j.is_object())
    throw InvalidBatchError("Feedback entry must be a JSON object");

  learning::Feedback feedback;
  feedback.insight_id = require_string(j, "insightId", "feedback");
  const std::string where = "feedback for '" + feedback.insight_id + "'";

  const auto &rating = require_member(j, "rating", where);
  if (!rating.is_number())
    throw InvalidBatchError(where + ": 'rating' must be a number");
  feedback.rating = rating.get<double>();
  feedback.action = require_string(j, "action", where);

  auto type_it = j.find("insightType");
  if (type_it != j.end() && !type_it->is_null()) {
    if (!type_it->is_string())
      throw InvalidBatchError(where + ": 'insightType' must be a string");
    feedback.insight_type = insight_type_from_string(type_it->get<std::string>());
    if (!feedback.insight_type) {
      LOG(LogLevel::WARN, LogComponent::IO_READER,
          where << ": unknown insight type '" << type_it->get<std::string>()
                << "', weights will not be adjusted");
    }
  }
  return feedback;
}

std::vector<learning::Feedback> parse_feedback(const nlohmann::json &j) {
  if (!j.is_array())
    throw InvalidBatchError("Feedback must be a JSON array");

  std::vector<learning::Feedback> feedback;
  feedback.reserve(j.size());
  for (const auto &element : j)
    feedback.push_back(parse_feedback_entry(element));
  return feedback;
}

std::vector<learning::Feedback> read_feedback_file(const std::string &filepath) {
  std::ifstream in(filepath);
  if (!in.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open feedback file: " << filepath);
    throw std::runtime_error("Failed to open feedback file: " + filepath);
  }
  auto feedback = parse_feedback(parse_document(in, filepath));
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Read " << feedback.size() << " feedback entries from " << filepath);
  return feedback;
}

} // namespace JsonInput

JsonFileEventSource::JsonFileEventSource(const std::string &filepath)
    : filepath_(filepath) {
  stream_.open(filepath_);
  if (!stream_.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open events file: " << filepath_);
    throw std::runtime_error("Failed to open events file: " + filepath_);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened events file: " << filepath_);
}

std::vector<Event> JsonFileEventSource::fetch_events() {
  stream_.clear();
  stream_.seekg(0);
  auto events = JsonInput::parse_events(parse_document(stream_, filepath_));
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Read " << events.size() << " events from " << filepath_);
  return events;
}

JsonFileAnalysisSink::JsonFileAnalysisSink(const std::string &filepath,
                                           bool pretty)
    : filepath_(filepath), pretty_(pretty) {
  if (filepath_.empty() || filepath_ == "-")
    return;

  if (!Utils::create_directory_for_file(filepath_))
    LOG(LogLevel::WARN, LogComponent::IO_WRITER,
        "Could not create directory for result file: " << filepath_);
  stream_.open(filepath_, std::ios::trunc);
  if (!stream_.is_open())
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Could not open result output file: " << filepath_);
}

JsonFileAnalysisSink::~JsonFileAnalysisSink() {
  if (stream_.is_open()) {
    stream_.flush();
    stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_WRITER,
        "Closed result output file: " << filepath_);
  }
}

bool JsonFileAnalysisSink::store(const analysis::AnalysisResult &result) {
  std::string json_output =
      JsonFormatter::format_analysis_result(result, pretty_);

  std::ostream *out = nullptr;
  if (filepath_.empty() || filepath_ == "-")
    out = &std::cout;
  else if (stream_.is_open())
    out = &stream_;
  else
    return false;

  *out << json_output << std::endl;
  if (!out->good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Failed to write analysis result to " << filepath_);
    return false;
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_WRITER,
      "Stored analysis of " << result.event_count << " events to "
                            << (out == &std::cout ? "stdout" : filepath_));
  return true;
}
